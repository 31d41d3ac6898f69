// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceLink.hpp>
#include <Errors.hpp>
#include <FirmwareFile.hpp>
#include <ITransport.hpp>
#include <Protocol.hpp>
#include <Timings.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

enum class TransferState {
  Idle,
  Handshaking,
  Transferring,
  Verifying,
  Complete,
  Aborted
};

inline constexpr std::string_view to_string(TransferState s) noexcept {
  switch (s) {
  case TransferState::Idle:
    return "Idle"sv;
  case TransferState::Handshaking:
    return "Handshaking"sv;
  case TransferState::Transferring:
    return "Transferring"sv;
  case TransferState::Verifying:
    return "Verifying"sv;
  case TransferState::Complete:
    return "Complete"sv;
  case TransferState::Aborted:
    return "Aborted"sv;
  }
  return "Unknown"sv;
}

struct IProgressListener {
  virtual void onProgress(std::size_t done, std::size_t total) = 0;

protected:
  ~IProgressListener() = default;
};

struct ITransferListener : IProgressListener {
  virtual void onStateChange(TransferState state) = 0;
  // an attempt failed and will be repeated after a backoff, index is the
  // chunk position while Transferring and 0 while Handshaking
  virtual void onRetry(TransferState phase, std::size_t index,
                       unsigned attempt, std::string_view reason) = 0;
  // non fatal condition worth reporting
  virtual void onNotice(std::string_view message) = 0;

protected:
  ~ITransferListener() = default;
};

struct OptListener {
  OptListener(ITransferListener *listener = nullptr) : listener{listener} {}
  void onProgress(std::size_t done, std::size_t total) {
    if (listener)
      listener->onProgress(done, total);
  }
  void onStateChange(TransferState state) {
    if (listener)
      listener->onStateChange(state);
  }
  void onRetry(TransferState phase, std::size_t index, unsigned attempt,
               std::string_view reason) {
    if (listener)
      listener->onRetry(phase, index, attempt, reason);
  }
  void onNotice(std::string_view message) {
    if (listener)
      listener->onNotice(message);
  }

private:
  ITransferListener *listener{};
};

struct TransferOptions {
  unsigned bootloader_attempts = 5;
  // retries after the first attempt of a chunk
  unsigned chunk_retries = 3;
  std::chrono::milliseconds ack_timeout = Timings::T_CHUNK_ACK;
  std::chrono::milliseconds retry_backoff = Timings::T_RETRY_BACKOFF;
  std::chrono::milliseconds bootloader_backoff = Timings::T_BL_ENTRY;
  std::chrono::milliseconds reset_delay = Timings::T_RESET;
};

// Mutable state of one transfer, never outlives transfer()
struct TransferSession {
  TransferState state{TransferState::Idle};
  std::size_t chunk_index{};
  std::size_t bytes_sent{};
  std::optional<Protocol::Ack> last_ack;
  unsigned retries{};
  std::vector<unsigned> attempts;
  std::string detail;
};

struct TransferResult {
  TransferState state{TransferState::Idle};
  std::error_code reason;
  std::optional<std::size_t> failed_chunk;
  std::size_t chunks_sent{};
  std::size_t bytes_sent{};
  // attempts used per chunk, in file order
  std::vector<unsigned> attempts;
  // last failure seen by the engine, empty on a clean transfer
  std::string detail;

  [[nodiscard]] bool ok() const noexcept {
    return state == TransferState::Complete;
  }
};

// Pushes a chunk sequence into the device bootloader. Any terminal state
// other than Complete means the device may hold a partial image and needs
// another transfer.
class ChunkTransferEngine {
public:
  explicit ChunkTransferEngine(TransferOptions opts = {},
                               OptListener listener = {})
      : m_opts{opts}, m_listener{listener} {}

  ChunkTransferEngine(const ChunkTransferEngine &) = delete;
  ChunkTransferEngine &operator=(const ChunkTransferEngine &) = delete;

  // expected_crc is compared to the runtime CRC the device reports after the
  // reset, when the transport supports querying it
  TransferResult transfer(ITransport &transport,
                          std::span<const Chunk> chunks,
                          std::optional<std::uint32_t> expected_crc = {});

  // Honoured before the next chunk is started, a chunk in flight completes
  void request_cancel() noexcept { m_cancel.store(true); }

  TransferOptions const &options() const noexcept { return m_opts; }

private:
  bool enter_bootloader(DeviceLink &link, TransferSession &session);
  bool send_chunk(DeviceLink &link, TransferSession &session,
                  Chunk const &chunk);
  void reset_device(DeviceLink &link);
  std::error_code verify(DeviceLink &link, TransferSession &session,
                         std::uint32_t expected_crc);

  void set_state(TransferSession &session, TransferState state);
  TransferResult finish(TransferSession &session, std::error_code reason = {},
                        std::optional<std::size_t> failed_chunk = {});

  TransferOptions m_opts;
  OptListener m_listener;
  std::atomic<bool> m_cancel{false};
  std::atomic<bool> m_busy{false};
};
