// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ByteCursor.hpp>
#include <DeviceIdentity.hpp>
#include <fwd.hpp>

#include <cstdint>
#include <stdexcept>
#include <type_traits>

// Request frames: <opcode:u8><length:u16 LE><payload>
namespace Protocol {

enum class Opcode : std::uint8_t {
  IDENTIFY = 0x31,
  READ_RUNTIME_CRC = 0x33,
  READ_USAGE = 0x52,
  WRITE_USAGE = 0x57,
  SYSTEM_COMMAND = 0x02,
  ENTER_BOOTLOADER = 0xB0,
  WRITE_CHUNK = 0xB1,
  RESET = 0xB2,
  // leading part of a chunk too large for one frame, no reply
  CHUNK_DATA = 0xB3,
};

enum class Ack : std::uint8_t { ACK = 0x06, NAK = 0x15 };

enum class SystemCommand : std::uint8_t {
  STOP = 0x01,
  FILL_CONFIG = 0x02,
  SAVE_CONFIG = 0x03,
  SOFT_RESET = 0x04,
};

inline constexpr std::size_t frame_header_size = 3;
inline constexpr std::size_t max_frame_payload = 0xFFFF;
// chunks longer than this go out as CHUNK_DATA frames followed by the
// WRITE_CHUNK frame that commits them
inline constexpr std::size_t chunk_segment_size = 0x8000;
inline constexpr std::size_t identity_size = 10;
inline constexpr std::uint16_t bootloader_mode_bit = 0x8000;

template <typename Enum> inline constexpr auto to_underlying(Enum e) {
  return static_cast<std::underlying_type_t<Enum>>(e);
}

inline byte_vector frame(Opcode op, byte_span payload = {}) {
  if (payload.size() > max_frame_payload) {
    throw std::length_error(
        fmt::format("frame payload too long ({} bytes)", payload.size()));
  }
  byte_vector out;
  out.reserve(frame_header_size + payload.size());
  out.push_back(to_underlying(op));
  out.push_back(static_cast<std::uint8_t>(payload.size() & 0xFF));
  out.push_back(static_cast<std::uint8_t>((payload.size() >> 8) & 0xFF));
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

struct Frame {
  Opcode opcode;
  byte_span payload;
};

// inverse of frame(), used by device simulations
inline Frame parse_frame(byte_span data) {
  ByteCursor cursor(data);
  const auto op = static_cast<Opcode>(cursor.read_u8());
  const auto len = cursor.read_u16();
  return Frame{op, cursor.read_bytes(len)};
}

inline DeviceIdentity decode_identity(byte_span data) {
  ByteCursor cursor(data);
  DeviceIdentity id{};
  const auto raw_id = cursor.read_u16();
  id.device_id = raw_id & ~bootloader_mode_bit;
  id.bootloader_mode = (raw_id & bootloader_mode_bit) != 0;
  const auto minor = cursor.read_u8();
  const auto major = cursor.read_u8();
  id.firmware_version = static_cast<std::uint16_t>((major << 8) | minor);
  id.firmware_patch = cursor.read_u8();
  id.variant = static_cast<FirmwareVariant>(cursor.read_u8());
  id.status = static_cast<FirmwareStatus>(cursor.read_u8());
  id.silicon_version = cursor.read_u16();
  id.silicon_revision = cursor.read_u8();
  return id;
}

inline byte_vector encode_identity(DeviceIdentity const &id) {
  const auto raw_id = static_cast<std::uint16_t>(
      id.device_id | (id.bootloader_mode ? bootloader_mode_bit : 0));
  return byte_vector{static_cast<std::uint8_t>(raw_id & 0xFF),
                     static_cast<std::uint8_t>(raw_id >> 8),
                     static_cast<std::uint8_t>(id.firmware_version & 0xFF),
                     static_cast<std::uint8_t>(id.firmware_version >> 8),
                     id.firmware_patch,
                     to_underlying(id.variant),
                     to_underlying(id.status),
                     static_cast<std::uint8_t>(id.silicon_version & 0xFF),
                     static_cast<std::uint8_t>(id.silicon_version >> 8),
                     id.silicon_revision};
}

} // namespace Protocol
