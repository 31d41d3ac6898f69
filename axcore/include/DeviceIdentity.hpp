// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <FirmwareFile.hpp>

#include <cstdint>
#include <string>

#include <fmt/format.h>

struct DeviceIdentity {
  std::uint16_t device_id{};
  bool bootloader_mode{};
  std::uint16_t firmware_version{};
  std::uint8_t firmware_patch{};
  FirmwareVariant variant{};
  FirmwareStatus status{};
  std::uint16_t silicon_version{};
  std::uint8_t silicon_revision{};

  std::string deviceIdStr() const { return device_id_str(device_id); }

  std::string short_info() const {
    if (bootloader_mode) {
      return fmt::format("{} (bootloader)", deviceIdStr());
    }
    return fmt::format("{} fw {}-{} {} silicon 0x{:04x} rev {}",
                       deviceIdStr(),
                       version_str(firmware_version, firmware_patch),
                       to_string(variant), to_string(status), silicon_version,
                       static_cast<char>('A' + silicon_revision));
  }
};
