// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class FirmwareVariant : std::uint8_t { ThreeD = 0, TwoD = 1, Force = 2 };

enum class FirmwareStatus : std::uint8_t { Engineering = 0, Production = 1 };

inline constexpr std::string_view to_string(FirmwareVariant v) noexcept {
  switch (v) {
  case FirmwareVariant::ThreeD:
    return "3D"sv;
  case FirmwareVariant::TwoD:
    return "2D"sv;
  case FirmwareVariant::Force:
    return "Force"sv;
  default:
    return "Unknown"sv;
  }
}

inline constexpr std::string_view to_string(FirmwareStatus s) noexcept {
  switch (s) {
  case FirmwareStatus::Engineering:
    return "eng"sv;
  case FirmwareStatus::Production:
    return "prod"sv;
  default:
    return "Unknown"sv;
  }
}

// aXiom part names encode the channel count in the low 10 bits and the
// package variant letter in bits 10-14, e.g. 0x0070 -> AX112A
inline std::string device_id_str(std::uint16_t device_id) {
  const auto channels = device_id & 0x3FF;
  const auto variant = (device_id & 0x7C00) >> 10;
  return fmt::format("AX{}{}", channels, static_cast<char>('A' + variant));
}

inline std::string version_str(std::uint16_t version, std::uint8_t patch) {
  return fmt::format("{}.{}.{}", version >> 8, version & 0xFF, patch);
}

struct Chunk {
  static constexpr std::size_t header_size = 8;

  std::array<std::uint8_t, header_size> header{};
  byte_vector body;
  // position of the chunk header in the source buffer
  std::size_t offset{};

  std::size_t wire_size() const noexcept { return header.size() + body.size(); }

  void append_to(byte_vector &out) const {
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), body.begin(), body.end());
  }
};

using ChunkSequence = std::vector<Chunk>;

struct FirmwareMetadata {
  std::uint16_t device_id{};
  FirmwareVariant variant{};
  std::uint16_t version{};
  std::uint8_t patch{};
  FirmwareStatus status{};
  std::uint16_t silicon_version{};
  std::uint8_t silicon_revision{};
  std::uint32_t firmware_crc{};
};

struct FirmwareContainer {
  std::uint16_t format_version{};
  FirmwareMetadata metadata;
  std::uint32_t declared_crc{};
  // CRC32 of the payload region as found in the file, firmware_crc is
  // reported by the device after programming and need not match it
  std::uint32_t payload_crc{};
  ChunkSequence payload;
};

struct RawFirmwareContainer {
  ChunkSequence payload;
};

inline byte_vector serialize_chunks(ChunkSequence const &chunks) {
  byte_vector out;
  for (auto const &c : chunks) {
    c.append_to(out);
  }
  return out;
}

inline std::size_t payload_size(ChunkSequence const &chunks) {
  return rg::accumulate(chunks, std::size_t{0}, std::plus<>{},
                        &Chunk::wire_size);
}
