// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <FormatParser.hpp>

#include <ByteCursor.hpp>
#include <Crc32.hpp>
#include <Errors.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace Axfw {

FirmwareMetadata decode_metadata_v0001(ByteCursor &cursor) {
  FirmwareMetadata md{};
  md.device_id = cursor.read_u16();
  md.variant = static_cast<FirmwareVariant>(cursor.read_u8());
  md.status = static_cast<FirmwareStatus>(cursor.read_u8());
  const auto minor = cursor.read_u8();
  const auto major = cursor.read_u8();
  md.version = static_cast<std::uint16_t>((major << 8) | minor);
  md.patch = cursor.read_u8();
  md.silicon_revision = cursor.read_u8();
  md.silicon_version = cursor.read_u16();
  md.firmware_crc = cursor.read_u32();
  return md;
}

FirmwareMetadata decode_metadata_v0200(ByteCursor &cursor) {
  FirmwareMetadata md{};
  md.device_id = cursor.read_u16();
  md.variant = static_cast<FirmwareVariant>(cursor.read_u8());
  const auto minor = cursor.read_u8();
  const auto major = cursor.read_u8();
  md.version = static_cast<std::uint16_t>((major << 8) | minor);
  md.patch = cursor.read_u8();
  md.status = static_cast<FirmwareStatus>(cursor.read_u8());
  md.silicon_version = cursor.read_u16();
  md.silicon_revision = cursor.read_u8();
  md.firmware_crc = cursor.read_u32();
  return md;
}

Layout const *find_layout(std::uint16_t format_version) noexcept {
  const auto it = rg::find_if(layouts, [format_version](Layout const &l) {
    return l.format_version == format_version;
  });
  return it != layouts.end() ? &*it : nullptr;
}

ChunkSequence walk_chunks(ByteCursor &cursor, std::endian length_order) {
  ChunkSequence chunks;
  while (!cursor.empty()) {
    const auto offset = cursor.position();
    if (cursor.remaining() < Chunk::header_size) {
      throw FormatError(FormatErrc::TruncatedChunk, offset,
                        fmt::format("chunk #{} header needs {} bytes, {} left",
                                    chunks.size(), Chunk::header_size,
                                    cursor.remaining()));
    }
    auto &chunk = chunks.emplace_back();
    chunk.offset = offset;
    rg::copy(cursor.read_bytes(Chunk::header_size), chunk.header.begin());

    // the body length lives in the trailing two header bytes
    ByteCursor length_field(byte_span(chunk.header).subspan<6, 2>());
    const auto length = length_field.read_u16(length_order);
    if (length > cursor.remaining()) {
      throw FormatError(FormatErrc::TruncatedChunk, offset,
                        fmt::format("chunk #{} declares {} body bytes, {} left",
                                    chunks.size() - 1, length,
                                    cursor.remaining()));
    }
    const auto body = cursor.read_bytes(length);
    chunk.body.assign(body.begin(), body.end());
  }
  return chunks;
}

FirmwareContainer parse_firmware(byte_span data) {
  ByteCursor cursor(data);
  if (!std::ranges::equal(cursor.read_bytes(signature.size()), signature)) {
    throw FormatError(FormatErrc::BadSignature, 0, "invalid .axfw signature");
  }

  FirmwareContainer fw{};
  fw.declared_crc = cursor.read_u32();
  fw.format_version = cursor.read_u16();

  const auto *layout = find_layout(fw.format_version);
  if (layout == nullptr) {
    throw FormatError(
        FormatErrc::UnsupportedVersion, format_version_offset,
        fmt::format("unknown .axfw format version 0x{:04x}", fw.format_version));
  }

  const auto computed = crc32(data.subspan(crc_range_start));
  if (computed != fw.declared_crc) {
    throw FormatError(FormatErrc::CrcMismatch, declared_crc_offset,
                      fmt::format(".axfw CRC mismatch, declared 0x{:08x}, "
                                  "computed 0x{:08x}",
                                  fw.declared_crc, computed));
  }

  fw.metadata = layout->decode_metadata(cursor);
  cursor.seek(layout->payload_offset);
  fw.payload_crc = crc32(cursor.rest());
  fw.payload = walk_chunks(cursor, layout->chunk_length_order);
  return fw;
}

RawFirmwareContainer parse_raw_firmware(byte_span data) {
  ByteCursor cursor(data);
  return RawFirmwareContainer{walk_chunks(cursor, raw_chunk_length_order)};
}

} // namespace Axfw

byte_vector load_file(std::filesystem::path const &path) {
  namespace fs = std::filesystem;
  if (const auto exists = fs::exists(path);
      !exists || !fs::is_regular_file(path)) {
    throw fs::filesystem_error(
        "Input file non-existent or not a file", path,
        std::make_error_code(!exists ? std::errc::no_such_file_or_directory
                                     : std::errc::is_a_directory));
  }
  std::ifstream ifs(path, std::ios::binary);
  byte_vector data{std::istreambuf_iterator<char>(ifs),
                   std::istreambuf_iterator<char>()};
  if (ifs.bad()) {
    throw std::runtime_error(
        fmt::format("Failed to read input file {}", path.string()));
  }
  return data;
}
