// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IDumper.hpp>
#include <fwd.hpp>

#include <cctype>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <fmt/format.h>
#include <range/v3/range/concepts.hpp>
#include <range/v3/range/traits.hpp>
#include <range/v3/view/chunk.hpp>

template <typename R>
concept byte_range =
    rg::forward_range<std::remove_reference_t<R>> &&
    std::integral<rg::range_value_t<std::remove_reference_t<R>>> &&
    sizeof(rg::range_value_t<std::remove_reference_t<R>>) == 1;

// Parses "0x31", "31" or "u31" as a hexadecimal usage number
inline std::optional<std::uint8_t> parse_usage(std::string_view str) {
  if (str.starts_with("0x") || str.starts_with("0X") || str.starts_with("u") ||
      str.starts_with("U")) {
    str.remove_prefix(str[0] == '0' ? 2 : 1);
  }
  if (str.empty() || str.size() > 2) {
    return std::nullopt;
  }
  unsigned val = 0;
  for (const auto c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    val = val * 16 +
          (std::isdigit(static_cast<unsigned char>(c))
               ? c - '0'
               : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
  }
  return static_cast<std::uint8_t>(val);
}

// Classic hexdump: offset | hex bytes | ascii
struct OstreamDumper : IDumper {
  explicit OstreamDumper(std::ostream &os, std::size_t bytes_per_line = 16)
      : os{os}, bytes_per_line{bytes_per_line} {
    if (bytes_per_line == 0) {
      throw std::invalid_argument("bytes per line must be positive");
    }
  }

  void dump_start() override {}
  void dump_end() override {}

  void dump_usage(std::uint8_t usage, byte_span content) override {
    os << fmt::format("u{:02x} ({} bytes)\n", usage, content.size());
    dump_memory(0, content);
  }

  template <byte_range Rng>
  void dump_memory(std::uint32_t addr, Rng &&data) {
    for (auto &&line : data | rgv::chunk(bytes_per_line)) {
      dump_line(addr, line);
      addr += bytes_per_line;
      os << '\n';
    }
  }

  template <byte_range Rng>
  void dump_line(std::uint32_t addr, Rng &&data) {
    std::ostream_iterator<char> out(os);
    fmt::format_to(out, "0x{:04x} | ", addr);
    const auto data_size = dump_data_padded(out, data);
    fmt::format_to(out, "| ");
    dump_ascii_padded(data_size, data);
    fmt::format_to(out, " |");
  }

private:
  template <typename Rng>
  std::size_t dump_data_padded(std::ostream_iterator<char> out, Rng &&data) {
    std::size_t i = 0;
    for (const auto val : data) {
      fmt::format_to(out, "{:02x} ", static_cast<std::uint8_t>(val));
      ++i;
    }
    for (auto pad = i; pad < bytes_per_line; ++pad) {
      fmt::format_to(out, "   ");
    }
    return i;
  }

  template <typename Rng>
  void dump_ascii_padded(std::size_t data_size, Rng &&data) {
    for (const auto v : data) {
      const int val = static_cast<std::uint8_t>(v);
      os << (std::isprint(val) ? static_cast<char>(val) : '.');
    }
    for (auto pad = data_size; pad < bytes_per_line; ++pad) {
      os << ' ';
    }
  }

  std::ostream &os;
  std::size_t bytes_per_line{};
};

// Writes the raw usage content, nothing else
struct BinaryDumper : IDumper {
  explicit BinaryDumper(std::ostream &os) : os{os} {}

  void dump_start() override {}
  void dump_end() override { os.flush(); }
  void dump_usage(std::uint8_t, byte_span content) override {
    os.write(reinterpret_cast<const char *>(content.data()),
             static_cast<std::streamsize>(content.size()));
    if (!os) {
      throw std::runtime_error("Failed to write usage content");
    }
  }

private:
  std::ostream &os;
};
