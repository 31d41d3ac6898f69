// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <cstdint>

// IEEE 802.3 CRC32 (reflected, poly 0xEDB88320), the same value zlib's and
// python's binascii crc32() produce. Pass a previous result as `crc` to
// continue a running checksum.
std::uint32_t crc32(byte_span data, std::uint32_t crc = 0) noexcept;
