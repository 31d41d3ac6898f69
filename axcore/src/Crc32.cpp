// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Crc32.hpp>

#include <array>

namespace {

constexpr auto make_crc_table() noexcept {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < table.size(); ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
    }
    table[i] = c;
  }
  return table;
}

constexpr auto crc_table = make_crc_table();

} // namespace

std::uint32_t crc32(byte_span data, std::uint32_t crc) noexcept {
  crc = ~crc;
  for (const auto b : data) {
    crc = crc_table[(crc ^ b) & 0xFF] ^ (crc >> 8);
  }
  return ~crc;
}
