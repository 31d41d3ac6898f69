// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <ChunkTransferEngine.hpp>

#include <fwd.hpp>

#include <fmt/format.h>

#include <functional>
#include <stdexcept>

using Protocol::Ack;

TransferResult ChunkTransferEngine::transfer(
    ITransport &transport, std::span<const Chunk> chunks,
    std::optional<std::uint32_t> expected_crc) {
  if (m_busy.exchange(true)) {
    throw std::logic_error("A transfer is already running on this engine");
  }
  finally release{[this]() { m_busy.store(false); }};
  m_cancel.store(false);

  TransferSession session{};
  session.attempts.assign(chunks.size(), 0);
  DeviceLink link(transport);

  set_state(session, TransferState::Handshaking);
  if (!enter_bootloader(link, session)) {
    return finish(session, make_error_code(TransferErrc::BootloaderEntryFailed));
  }

  set_state(session, TransferState::Transferring);
  const auto total = rg::accumulate(chunks, std::size_t{0}, std::plus<>{},
                                    &Chunk::wire_size);
  m_listener.onProgress(0, total);
  for (auto const &chunk : chunks) {
    if (m_cancel.load()) {
      session.detail = fmt::format("cancelled before chunk #{}",
                                   session.chunk_index);
      return finish(session, make_error_code(TransferErrc::Cancelled));
    }
    if (!send_chunk(link, session, chunk)) {
      return finish(session,
                    make_error_code(TransferErrc::ChunkTransferFailed),
                    session.chunk_index);
    }
    session.bytes_sent += chunk.wire_size();
    ++session.chunk_index;
    m_listener.onProgress(session.bytes_sent, total);
  }

  reset_device(link);
  if (expected_crc && transport.supports(ITransport::RUNTIME_CRC)) {
    set_state(session, TransferState::Verifying);
    if (const auto ec = verify(link, session, *expected_crc); ec) {
      return finish(session, ec);
    }
  }
  return finish(session);
}

bool ChunkTransferEngine::enter_bootloader(DeviceLink &link,
                                           TransferSession &session) {
  auto &transport = link.transport();
  for (unsigned attempt = 1; attempt <= m_opts.bootloader_attempts;
       ++attempt) {
    try {
      link.request_bootloader();
      transport.delay(m_opts.bootloader_backoff);
      if (transport.query_identity().bootloader_mode) {
        return true;
      }
      session.detail = "device did not report bootloader mode";
    } catch (ITransport::Error const &e) {
      session.detail = e.what();
    }
    if (attempt < m_opts.bootloader_attempts) {
      m_listener.onRetry(TransferState::Handshaking, 0, attempt,
                         session.detail);
    }
  }
  session.detail = fmt::format("no bootloader after {} attempts, last: {}",
                               m_opts.bootloader_attempts, session.detail);
  return false;
}

bool ChunkTransferEngine::send_chunk(DeviceLink &link,
                                     TransferSession &session,
                                     Chunk const &chunk) {
  const auto idx = session.chunk_index;
  const auto budget = m_opts.chunk_retries + 1;
  session.retries = 0;
  for (unsigned attempt = 1;; ++attempt) {
    session.attempts[idx] = attempt;
    try {
      link.send_chunk(chunk);
      session.last_ack = link.read_ack(m_opts.ack_timeout);
      if (*session.last_ack == Ack::ACK) {
        return true;
      }
      session.detail = fmt::format("chunk #{} negative acknowledgment", idx);
    } catch (ITransport::Timeout const &e) {
      session.last_ack.reset();
      session.detail =
          fmt::format("chunk #{} acknowledgment timeout: {}", idx, e.what());
    } catch (ITransport::Error const &e) {
      session.last_ack.reset();
      session.detail = fmt::format("chunk #{} I/O error: {}", idx, e.what());
    }
    if (attempt >= budget) {
      return false;
    }
    ++session.retries;
    m_listener.onRetry(TransferState::Transferring, idx, attempt,
                       session.detail);
    link.transport().delay(m_opts.retry_backoff);
  }
}

void ChunkTransferEngine::reset_device(DeviceLink &link) {
  // the device may drop the link as soon as the reset is accepted
  try {
    link.reset();
  } catch (ITransport::Error const &e) {
    m_listener.onNotice(fmt::format("reset request not confirmed: {}",
                                    e.what()));
  }
  link.transport().delay(m_opts.reset_delay);
}

std::error_code ChunkTransferEngine::verify(DeviceLink &link,
                                            TransferSession &session,
                                            std::uint32_t expected_crc) {
  try {
    if (const auto crc = link.runtime_crc(); crc != expected_crc) {
      session.detail =
          fmt::format("device runtime CRC 0x{:08x}, expected 0x{:08x}", crc,
                      expected_crc);
      return make_error_code(TransferErrc::VerificationFailed);
    }
  } catch (ITransport::Error const &e) {
    session.detail = fmt::format("runtime CRC query failed: {}", e.what());
    return make_error_code(TransferErrc::VerificationFailed);
  }
  return {};
}

void ChunkTransferEngine::set_state(TransferSession &session,
                                    TransferState state) {
  session.state = state;
  m_listener.onStateChange(state);
}

TransferResult
ChunkTransferEngine::finish(TransferSession &session, std::error_code reason,
                            std::optional<std::size_t> failed_chunk) {
  set_state(session, reason ? TransferState::Aborted : TransferState::Complete);
  TransferResult res{};
  res.state = session.state;
  res.reason = reason;
  res.failed_chunk = failed_chunk;
  res.chunks_sent = session.chunk_index;
  res.bytes_sent = session.bytes_sent;
  res.attempts = std::move(session.attempts);
  if (reason) {
    res.detail = std::move(session.detail);
  }
  return res;
}
