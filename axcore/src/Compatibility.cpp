// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Compatibility.hpp>

#include <fmt/format.h>

namespace {

Verdict reject(CompatibilityErrc e) {
  return Verdict{Compatibility::Rejected, make_error_code(e)};
}

} // namespace

std::string Verdict::describe() const {
  switch (status) {
  case Compatibility::Verified:
    return "compatible";
  case Compatibility::DeviceIdOnly:
    return "device in bootloader mode, only the device id was checked";
  case Compatibility::Bypassed:
    return "compatibility unknown, checks bypassed";
  case Compatibility::AlreadyUpToDate:
    return "firmware already on the device";
  case Compatibility::Rejected:
    return fmt::format("rejected: {}", reason.message());
  }
  return "unknown";
}

Verdict CompatibilityValidator::validate(FirmwareContainer const &fw,
                                         DeviceIdentity const &device) const {
  if (m_opts.force) {
    return Verdict{Compatibility::Bypassed, {}};
  }
  const auto &md = fw.metadata;
  if (md.device_id != device.device_id) {
    return reject(CompatibilityErrc::DeviceMismatch);
  }
  // a bootloader only reports the part number, there is no running
  // firmware to compare the remaining fields against
  if (device.bootloader_mode) {
    return Verdict{Compatibility::DeviceIdOnly, {}};
  }
  if (md.silicon_version != device.silicon_version ||
      md.silicon_revision > device.silicon_revision) {
    return reject(CompatibilityErrc::SiliconMismatch);
  }
  if (md.variant != device.variant && !m_opts.allow_variant_change) {
    return reject(CompatibilityErrc::VariantMismatch);
  }
  if (m_opts.skip_if_current && md.version == device.firmware_version &&
      md.patch == device.firmware_patch) {
    return Verdict{Compatibility::AlreadyUpToDate, {}};
  }
  return Verdict{Compatibility::Verified, {}};
}

Verdict CompatibilityValidator::validate(RawFirmwareContainer const &,
                                         DeviceIdentity const &) const {
  return Verdict{Compatibility::Bypassed, {}};
}
