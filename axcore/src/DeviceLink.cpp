// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <DeviceLink.hpp>

#include <ByteCursor.hpp>

#include <fmt/format.h>

#include <array>

using Protocol::Ack;
using Protocol::Opcode;

void DeviceLink::send(Opcode op, byte_span payload) {
  const auto f = Protocol::frame(op, payload);
  m_transport->write(f);
}

byte_vector DeviceLink::read_exact(std::size_t n,
                                   std::chrono::milliseconds timeout) {
  byte_vector res;
  res.reserve(n);
  while (res.size() < n) {
    const auto part = m_transport->read(n - res.size(), timeout);
    if (part.empty()) {
      throw ITransport::Timeout(
          fmt::format("No data after {} of {} bytes", res.size(), n));
    }
    res.insert(res.end(), part.begin(), part.end());
  }
  return res;
}

DeviceIdentity DeviceLink::identify() {
  send(Opcode::IDENTIFY);
  return Protocol::decode_identity(read_exact(Protocol::identity_size));
}

void DeviceLink::request_bootloader() { send(Opcode::ENTER_BOOTLOADER); }

void DeviceLink::send_chunk(Chunk const &chunk) {
  byte_vector wire;
  wire.reserve(chunk.wire_size());
  chunk.append_to(wire);
  byte_span rest(wire);
  while (rest.size() > Protocol::chunk_segment_size) {
    send(Opcode::CHUNK_DATA, rest.first(Protocol::chunk_segment_size));
    rest = rest.subspan(Protocol::chunk_segment_size);
  }
  send(Opcode::WRITE_CHUNK, rest);
}

Ack DeviceLink::read_ack(std::chrono::milliseconds timeout) {
  const auto reply = read_exact(1, timeout);
  switch (const auto val = reply.front(); val) {
  case Protocol::to_underlying(Ack::ACK):
    return Ack::ACK;
  case Protocol::to_underlying(Ack::NAK):
    return Ack::NAK;
  default:
    throw ITransport::Error(
        fmt::format("Unexpected acknowledgment byte 0x{:02x}", val));
  }
}

void DeviceLink::expect_ack(std::string_view what) {
  if (read_ack(Timings::T_RESPONSE) != Ack::ACK) {
    throw ITransport::Error(fmt::format("Device refused {}", what));
  }
}

void DeviceLink::reset() { send(Opcode::RESET); }

std::uint32_t DeviceLink::runtime_crc() {
  send(Opcode::READ_RUNTIME_CRC);
  const auto reply = read_exact(4);
  ByteCursor cursor(reply);
  return cursor.read_u32();
}

byte_vector DeviceLink::read_usage(std::uint8_t usage) {
  send(Opcode::READ_USAGE, std::array{usage});
  const auto len_bytes = read_exact(2);
  const auto len =
      static_cast<std::size_t>(len_bytes[0] | (len_bytes[1] << 8));
  if (len == 0) {
    return {};
  }
  return read_exact(len);
}

void DeviceLink::write_usage(std::uint8_t usage, byte_span content) {
  if (content.size() > 0xFFFF - 3) {
    throw std::length_error(fmt::format(
        "usage u{:02x} content too long ({} bytes)", usage, content.size()));
  }
  byte_vector payload{usage,
                      static_cast<std::uint8_t>(content.size() & 0xFF),
                      static_cast<std::uint8_t>(content.size() >> 8)};
  payload.insert(payload.end(), content.begin(), content.end());
  send(Opcode::WRITE_USAGE, payload);
  expect_ack(fmt::format("write of usage u{:02x}", usage));
}

void DeviceLink::send_command(Protocol::SystemCommand cmd) {
  send(Opcode::SYSTEM_COMMAND, std::array{Protocol::to_underlying(cmd)});
  expect_ack(fmt::format("system command 0x{:02x}",
                         Protocol::to_underlying(cmd)));
}
