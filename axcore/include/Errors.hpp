// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <string>
#include <system_error>
#include <type_traits>

enum class FormatErrc {
  BadSignature = 1,
  UnsupportedVersion,
  CrcMismatch,
  TruncatedChunk,
  TruncatedUsage,
  OutOfBounds,
};

enum class CompatibilityErrc {
  DeviceMismatch = 1,
  SiliconMismatch,
  VariantMismatch,
};

enum class TransferErrc {
  BootloaderEntryFailed = 1,
  ChunkTransferFailed,
  VerificationFailed,
  Cancelled,
};

enum class ConfigErrc {
  MissingUsage = 1,
  FirmwareMismatch,
  VerifyMismatch,
};

template <> struct std::is_error_code_enum<FormatErrc> : std::true_type {};
template <>
struct std::is_error_code_enum<CompatibilityErrc> : std::true_type {};
template <> struct std::is_error_code_enum<TransferErrc> : std::true_type {};
template <> struct std::is_error_code_enum<ConfigErrc> : std::true_type {};

std::error_category const &format_category() noexcept;
std::error_category const &compatibility_category() noexcept;
std::error_category const &transfer_category() noexcept;
std::error_category const &config_category() noexcept;

inline std::error_code make_error_code(FormatErrc e) noexcept {
  return {static_cast<int>(e), format_category()};
}
inline std::error_code make_error_code(CompatibilityErrc e) noexcept {
  return {static_cast<int>(e), compatibility_category()};
}
inline std::error_code make_error_code(TransferErrc e) noexcept {
  return {static_cast<int>(e), transfer_category()};
}
inline std::error_code make_error_code(ConfigErrc e) noexcept {
  return {static_cast<int>(e), config_category()};
}

// Thrown by the container parsers, offset is the byte position in the
// input buffer where decoding failed
class FormatError : public std::system_error {
public:
  FormatError(FormatErrc code, std::size_t offset, std::string const &what);

  FormatErrc code_value() const noexcept {
    return static_cast<FormatErrc>(code().value());
  }
  std::size_t offset() const noexcept { return m_offset; }

private:
  std::size_t m_offset{};
};
