// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <MockAxiom.hpp>

#include <ByteCursor.hpp>
#include <Crc32.hpp>
#include <DeviceLink.hpp>
#include <Errors.hpp>
#include <FormatParser.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

using Protocol::Ack;
using Protocol::Opcode;
using Protocol::SystemCommand;

__attribute__((weak)) ITransport::Ptr
ITransport::Create(TransportConfig const &) {
  auto dev = MockAxiom::Create();
  dev->load_environment();
  return dev;
}

std::shared_ptr<MockAxiom> MockAxiom::Create() {
  return std::make_shared<MockAxiom>();
}

MockAxiom::MockAxiom(DeviceIdentity identity) : m_identity{identity} {}

DeviceIdentity MockAxiom::default_identity() noexcept {
  DeviceIdentity id{};
  id.device_id = 0x0070;
  id.firmware_version = 0x0408;
  id.firmware_patch = 10;
  id.variant = FirmwareVariant::ThreeD;
  id.status = FirmwareStatus::Production;
  id.silicon_version = 0x0002;
  id.silicon_revision = 1;
  return id;
}

void MockAxiom::load_environment() {
  if (const auto devid = std::getenv("MOCK_AXIOM_DEVICE_ID")) {
    try {
      m_identity.device_id =
          static_cast<std::uint16_t>(std::stoul(devid, nullptr, 0) & 0x7FFF);
    } catch (std::logic_error const &) {
      throw std::runtime_error(
          fmt::format("Invalid MOCK_AXIOM_DEVICE_ID '{}'", devid));
    }
  }
  if (const auto cfgfile = std::getenv("MOCK_AXIOM_CONFIG")) {
    load_config(Th2Cfg::parse_config(load_file(cfgfile)));
  }
  if (std::getenv("MOCK_AXIOM_FAIL_OPEN")) {
    fail_open();
  }
}

void MockAxiom::open() {
  if (m_fail_open) {
    throw Error("Simulated device not present");
  }
  m_open = true;
}

void MockAxiom::write(byte_span data) {
  if (!m_open) {
    throw Error("Write on closed simulated device");
  }
  Protocol::Frame frame{};
  try {
    frame = Protocol::parse_frame(data);
  } catch (FormatError const &e) {
    throw Error(fmt::format("Malformed frame: {}", e.what()));
  }
  handle(frame);
}

byte_vector MockAxiom::read(std::size_t max_len,
                            std::chrono::milliseconds timeout) {
  if (!m_open) {
    throw Error("Read on closed simulated device");
  }
  if (m_rx.empty()) {
    throw Timeout(fmt::format("No reply within {}ms", timeout.count()));
  }
  const auto n = std::min(max_len, m_rx.size());
  byte_vector res(m_rx.begin(), m_rx.begin() + n);
  m_rx.erase(m_rx.begin(), m_rx.begin() + n);
  return res;
}

DeviceIdentity MockAxiom::query_identity() {
  return DeviceLink(*this).identify();
}

void MockAxiom::fail_chunk(std::size_t index, ChunkFault fault,
                           unsigned times) {
  m_faults.insert_or_assign(index, PendingFault{fault, times});
}

void MockAxiom::set_usage(std::uint8_t usage, byte_vector content) {
  m_usages.insert_or_assign(usage, std::move(content));
  m_config_crc = stored_config_crc();
}

byte_vector const &MockAxiom::usage(std::uint8_t usage) const {
  const auto it = m_usages.find(usage);
  if (it == m_usages.end()) {
    throw std::out_of_range(fmt::format("No usage u{:02x}", usage));
  }
  return it->second;
}

void MockAxiom::load_config(ConfigContainer const &cfg) {
  for (auto const &rec : cfg.usages) {
    if (rec.usage == Th2Cfg::crc_usage) {
      m_runtime_crc = Th2Cfg::decode_crc_usage(rec.content).runtime_crc;
    }
    set_usage(rec.usage, rec.content);
  }
}

byte_vector MockAxiom::programmed_image() const {
  byte_vector img;
  for (auto const &c : m_accepted) {
    img.insert(img.end(), c.begin(), c.end());
  }
  return img;
}

void MockAxiom::handle(Protocol::Frame const &frame) {
  switch (frame.opcode) {
  case Opcode::IDENTIFY: {
    const auto id = Protocol::encode_identity(m_identity);
    reply(id);
    break;
  }
  case Opcode::ENTER_BOOTLOADER:
    on_enter_bootloader();
    break;
  case Opcode::CHUNK_DATA:
    on_chunk_data(frame.payload);
    break;
  case Opcode::WRITE_CHUNK:
    on_write_chunk(frame.payload);
    break;
  case Opcode::RESET:
    on_reset();
    break;
  case Opcode::READ_RUNTIME_CRC: {
    const auto crc = m_corrupt_crc ? ~m_runtime_crc : m_runtime_crc;
    const auto data = Th2Cfg::encode_crc_usage({crc, 0});
    reply(byte_span(data).first(4));
    break;
  }
  case Opcode::READ_USAGE:
    on_read_usage(frame.payload);
    break;
  case Opcode::WRITE_USAGE:
    on_write_usage(frame.payload);
    break;
  case Opcode::SYSTEM_COMMAND:
    on_system_command(frame.payload);
    break;
  default:
    throw Error(fmt::format("Unsupported opcode 0x{:02x}",
                            Protocol::to_underlying(frame.opcode)));
  }
}

void MockAxiom::on_enter_bootloader() {
  ++m_bl_requests;
  if (m_bootloader_refusals > 0) {
    if (m_bootloader_refusals != always) {
      --m_bootloader_refusals;
    }
    return;
  }
  if (!m_identity.bootloader_mode) {
    m_identity.bootloader_mode = true;
    m_accepted.clear();
  }
  m_staged.clear();
}

void MockAxiom::on_chunk_data(byte_span payload) {
  ++m_chunk_segments;
  m_staged.insert(m_staged.end(), payload.begin(), payload.end());
}

void MockAxiom::on_write_chunk(byte_span payload) {
  ++m_chunk_writes;
  auto chunk = std::exchange(m_staged, {});
  chunk.insert(chunk.end(), payload.begin(), payload.end());
  if (!m_identity.bootloader_mode) {
    reply_ack(Ack::NAK);
    return;
  }
  const auto idx = m_accepted.size();
  if (auto it = m_faults.find(idx); it != m_faults.end()) {
    auto &pending = it->second;
    const auto fault = pending.fault;
    if (pending.remaining != always && --pending.remaining == 0) {
      m_faults.erase(it);
    }
    switch (fault) {
    case ChunkFault::Nak:
      reply_ack(Ack::NAK);
      return;
    case ChunkFault::Timeout:
      return;
    case ChunkFault::IoError:
      throw Error(fmt::format("Simulated I/O error on chunk #{}", idx));
    }
  }
  m_accepted.push_back(std::move(chunk));
  reply_ack(Ack::ACK);
}

void MockAxiom::on_reset() {
  ++m_resets;
  if (m_identity.bootloader_mode && !m_accepted.empty()) {
    m_runtime_crc = crc32(programmed_image());
  }
  m_identity.bootloader_mode = false;
  m_stopped = false;
}

void MockAxiom::on_read_usage(byte_span payload) {
  ByteCursor cursor(payload);
  const auto usage = cursor.read_u8();
  byte_vector content;
  if (usage == Th2Cfg::crc_usage) {
    content = Th2Cfg::encode_crc_usage({m_runtime_crc, m_config_crc});
  } else if (auto it = m_usages.find(usage); it != m_usages.end()) {
    content = it->second;
  }
  byte_vector out{static_cast<std::uint8_t>(content.size() & 0xFF),
                  static_cast<std::uint8_t>(content.size() >> 8)};
  out.insert(out.end(), content.begin(), content.end());
  reply(out);
}

void MockAxiom::on_write_usage(byte_span payload) {
  ByteCursor cursor(payload);
  const auto usage = cursor.read_u8();
  const auto len = cursor.read_u16();
  const auto content = cursor.read_bytes(len);
  if (Th2Cfg::is_read_only(usage) || m_identity.bootloader_mode) {
    reply_ack(Ack::NAK);
    return;
  }
  m_usage_writes.push_back(usage);
  m_usages.insert_or_assign(usage, byte_vector(content.begin(), content.end()));
  reply_ack(Ack::ACK);
}

void MockAxiom::on_system_command(byte_span payload) {
  ByteCursor cursor(payload);
  const auto cmd = static_cast<SystemCommand>(cursor.read_u8());
  m_commands.push_back(cmd);
  switch (cmd) {
  case SystemCommand::STOP:
    m_stopped = true;
    break;
  case SystemCommand::FILL_CONFIG:
    for (auto &[usage, content] : m_usages) {
      if (!Th2Cfg::is_read_only(usage)) {
        std::fill(content.begin(), content.end(), 0);
      }
    }
    break;
  case SystemCommand::SAVE_CONFIG:
    break;
  case SystemCommand::SOFT_RESET:
    m_stopped = false;
    m_config_crc = stored_config_crc();
    break;
  default:
    reply_ack(Ack::NAK);
    return;
  }
  reply_ack(Ack::ACK);
}

void MockAxiom::reply(byte_span data) {
  m_rx.insert(m_rx.end(), data.begin(), data.end());
}

void MockAxiom::reply_ack(Ack ack) { m_rx.push_back(Protocol::to_underlying(ack)); }

std::uint32_t MockAxiom::stored_config_crc() const {
  std::vector<UsageRecord> records;
  records.reserve(m_usages.size());
  for (auto const &[usage, content] : m_usages) {
    records.push_back(UsageRecord{usage, 0, content, 0});
  }
  return Th2Cfg::config_crc(records);
}
