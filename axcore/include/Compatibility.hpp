// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceIdentity.hpp>
#include <Errors.hpp>
#include <FirmwareFile.hpp>

#include <optional>
#include <string>
#include <system_error>

struct ValidationOptions {
  // skip every check, the verdict is recorded as Bypassed
  bool force = false;
  // report AlreadyUpToDate when the device runs the same version
  bool skip_if_current = false;
  bool allow_variant_change = false;
};

enum class Compatibility {
  Verified,
  // device in bootloader mode, only the part number could be compared
  DeviceIdOnly,
  Bypassed,
  AlreadyUpToDate,
  Rejected
};

struct Verdict {
  Compatibility status{Compatibility::Rejected};
  std::error_code reason;

  // true when a transfer may be started, unverified verdicts included
  [[nodiscard]] bool proceed() const noexcept {
    return status == Compatibility::Verified ||
           status == Compatibility::DeviceIdOnly ||
           status == Compatibility::Bypassed;
  }
  [[nodiscard]] bool verified() const noexcept {
    return status == Compatibility::Verified;
  }

  std::string describe() const;
};

class CompatibilityValidator {
public:
  explicit CompatibilityValidator(ValidationOptions opts = {}) noexcept
      : m_opts{opts} {}

  Verdict validate(FirmwareContainer const &fw,
                   DeviceIdentity const &device) const;

  // raw containers carry no metadata, compatibility can't be established
  Verdict validate(RawFirmwareContainer const &, DeviceIdentity const &) const;

private:
  ValidationOptions m_opts;
};
