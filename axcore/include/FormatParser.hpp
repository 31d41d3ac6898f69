// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ByteCursor.hpp>
#include <ConfigFile.hpp>
#include <FirmwareFile.hpp>
#include <fwd.hpp>

#include <array>
#include <bit>
#include <cstdint>
#include <filesystem>

namespace Axfw {

inline constexpr std::array<std::uint8_t, 4> signature{'A', 'X', 'F', 'W'};

// Offsets of the fixed prefix shared by every format revision, the format
// version has to be readable before a layout can be picked
inline constexpr std::size_t declared_crc_offset = 4;
inline constexpr std::size_t format_version_offset = 8;
inline constexpr std::size_t crc_range_start = 8;

// Description of one .axfw metadata revision. Revisions differ in field
// order/width and in the byte order of the chunk length, so each one is
// listed explicitly rather than derived from another.
struct Layout {
  std::uint16_t format_version;
  std::size_t payload_offset;
  std::endian chunk_length_order;
  FirmwareMetadata (*decode_metadata)(ByteCursor &cursor);
};

FirmwareMetadata decode_metadata_v0001(ByteCursor &cursor);
FirmwareMetadata decode_metadata_v0200(ByteCursor &cursor);

inline constexpr std::array layouts{
    Layout{0x0001, 24, std::endian::little, &decode_metadata_v0001},
    Layout{0x0200, 24, std::endian::big, &decode_metadata_v0200},
};

// .alc files carry the payload of the current .axfw revision without the
// metadata block
inline constexpr std::endian raw_chunk_length_order = std::endian::big;

Layout const *find_layout(std::uint16_t format_version) noexcept;

// Splits `cursor.rest()` into self-describing chunks until the buffer is
// exhausted. Throws FormatError(TruncatedChunk) on a partial header or on a
// length running past the end of the buffer.
ChunkSequence walk_chunks(ByteCursor &cursor, std::endian length_order);

FirmwareContainer parse_firmware(byte_span data);

RawFirmwareContainer parse_raw_firmware(byte_span data);

} // namespace Axfw

byte_vector load_file(std::filesystem::path const &path);
