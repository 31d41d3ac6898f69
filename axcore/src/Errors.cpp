// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>

#include <fmt/format.h>

namespace {

struct FormatCategory : std::error_category {
  const char *name() const noexcept override { return "axfw-format"; }
  std::string message(int ev) const override {
    switch (static_cast<FormatErrc>(ev)) {
    case FormatErrc::BadSignature:
      return "bad signature";
    case FormatErrc::UnsupportedVersion:
      return "unsupported format version";
    case FormatErrc::CrcMismatch:
      return "CRC mismatch";
    case FormatErrc::TruncatedChunk:
      return "truncated chunk";
    case FormatErrc::TruncatedUsage:
      return "truncated usage record";
    case FormatErrc::OutOfBounds:
      return "read out of bounds";
    }
    return "unknown format error";
  }
};

struct CompatibilityCategory : std::error_category {
  const char *name() const noexcept override { return "axfw-compat"; }
  std::string message(int ev) const override {
    switch (static_cast<CompatibilityErrc>(ev)) {
    case CompatibilityErrc::DeviceMismatch:
      return "file is for a different device";
    case CompatibilityErrc::SiliconMismatch:
      return "silicon version/revision not supported by the file";
    case CompatibilityErrc::VariantMismatch:
      return "firmware variant differs from the running firmware";
    }
    return "unknown compatibility error";
  }
};

struct TransferCategory : std::error_category {
  const char *name() const noexcept override { return "axfw-transfer"; }
  std::string message(int ev) const override {
    switch (static_cast<TransferErrc>(ev)) {
    case TransferErrc::BootloaderEntryFailed:
      return "failed to enter bootloader mode";
    case TransferErrc::ChunkTransferFailed:
      return "chunk transfer failed";
    case TransferErrc::VerificationFailed:
      return "firmware verification failed";
    case TransferErrc::Cancelled:
      return "transfer cancelled";
    }
    return "unknown transfer error";
  }
};

struct ConfigCategory : std::error_category {
  const char *name() const noexcept override { return "axcfg"; }
  std::string message(int ev) const override {
    switch (static_cast<ConfigErrc>(ev)) {
    case ConfigErrc::MissingUsage:
      return "config file lacks a required usage";
    case ConfigErrc::FirmwareMismatch:
      return "config was saved from a different firmware revision";
    case ConfigErrc::VerifyMismatch:
      return "config on the device does not match the file";
    }
    return "unknown config error";
  }
};

} // namespace

std::error_category const &format_category() noexcept {
  static const FormatCategory cat;
  return cat;
}
std::error_category const &compatibility_category() noexcept {
  static const CompatibilityCategory cat;
  return cat;
}
std::error_category const &transfer_category() noexcept {
  static const TransferCategory cat;
  return cat;
}
std::error_category const &config_category() noexcept {
  static const ConfigCategory cat;
  return cat;
}

FormatError::FormatError(FormatErrc code, std::size_t offset,
                         std::string const &what)
    : std::system_error(make_error_code(code),
                        fmt::format("{} (offset 0x{:x})", what, offset)),
      m_offset{offset} {}
