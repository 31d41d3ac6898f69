// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Errors.hpp>
#include <fwd.hpp>

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

// Sequential reader over a fixed byte buffer. Every read is bounds checked
// and fails with FormatErrc::OutOfBounds, the cursor never hands out bytes
// past the end of the buffer.
class ByteCursor {
public:
  constexpr explicit ByteCursor(byte_span data) noexcept : m_data{data} {}

  std::uint8_t read_u8() { return read_int<std::uint8_t>(std::endian::little); }

  std::uint16_t read_u16(std::endian e = std::endian::little) {
    return read_int<std::uint16_t>(e);
  }

  std::uint32_t read_u32(std::endian e = std::endian::little) {
    return read_int<std::uint32_t>(e);
  }

  byte_span read_bytes(std::size_t n) {
    ensure_available(n);
    auto res = m_data.subspan(m_pos, n);
    m_pos += n;
    return res;
  }

  void skip(std::size_t n) {
    ensure_available(n);
    m_pos += n;
  }

  void seek(std::size_t offset) {
    if (offset > m_data.size()) {
      throw FormatError(FormatErrc::OutOfBounds, offset,
                        fmt::format("seek beyond end of {} byte buffer",
                                    m_data.size()));
    }
    m_pos = offset;
  }

  [[nodiscard]] std::size_t position() const noexcept { return m_pos; }
  [[nodiscard]] std::size_t size() const noexcept { return m_data.size(); }
  [[nodiscard]] std::size_t remaining() const noexcept {
    return m_data.size() - m_pos;
  }
  [[nodiscard]] bool empty() const noexcept { return remaining() == 0; }

  // the part of the buffer not consumed yet
  [[nodiscard]] byte_span rest() const noexcept {
    return m_data.subspan(m_pos);
  }

private:
  template <std::unsigned_integral T> T read_int(std::endian e) {
    ensure_available(sizeof(T));
    T val{};
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      const auto shift =
          e == std::endian::little ? i * 8 : (sizeof(T) - 1 - i) * 8;
      val |= static_cast<T>(static_cast<T>(m_data[m_pos + i]) << shift);
    }
    m_pos += sizeof(T);
    return val;
  }

  void ensure_available(std::size_t n) const {
    if (n > remaining()) {
      throw FormatError(
          FormatErrc::OutOfBounds, m_pos,
          fmt::format("read of {} bytes with only {} remaining", n,
                      remaining()));
    }
  }

  byte_span m_data;
  std::size_t m_pos{};
};
