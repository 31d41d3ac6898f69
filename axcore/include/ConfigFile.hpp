// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <cstdint>
#include <span>
#include <vector>

struct UsageRecord {
  static constexpr std::size_t header_size = 5;

  std::uint8_t usage{};
  std::uint8_t revision{};
  byte_vector content;
  std::size_t offset{};

  std::uint16_t length() const noexcept {
    return static_cast<std::uint16_t>(content.size());
  }
};

struct ConfigRevision {
  std::uint8_t major{};
  std::uint8_t minor{};
  std::uint8_t patch{};
};

struct ConfigContainer {
  std::uint16_t format_version{};
  ConfigRevision revision;
  std::uint8_t tcp_version{};
  std::vector<UsageRecord> usages;
};

namespace Th2Cfg {

inline constexpr std::uint32_t signature = 0x20071969;
// signature(4) format(2) revision(3) tcp version(1) reserved(3)
inline constexpr std::size_t header_size = 13;

// usages with a fixed meaning for configuration transfer
inline constexpr std::uint8_t customer_usage = 0x04;
inline constexpr std::uint8_t device_info_usage = 0x31;
inline constexpr std::uint8_t crc_usage = 0x33;

ConfigContainer parse_config(byte_span data);

// u31 and u33 are reported by the firmware, a config only carries them
// for reference
constexpr bool is_read_only(std::uint8_t usage) noexcept {
  return usage == device_info_usage || usage == crc_usage;
}

// leading fields of u33, all little-endian
struct CrcUsage {
  static constexpr std::size_t size = 8;

  std::uint32_t runtime_crc{};
  std::uint32_t config_crc{};
};

CrcUsage decode_crc_usage(byte_span content);
byte_vector encode_crc_usage(CrcUsage const &crc);

// CRC32 over the contents of the usages the device folds into the config
// CRC of u33: every writable usage except u04, in ascending usage order
std::uint32_t config_crc(std::span<const UsageRecord> records);

} // namespace Th2Cfg
