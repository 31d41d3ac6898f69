// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <ConfigFile.hpp>

#include <ByteCursor.hpp>
#include <Crc32.hpp>
#include <Errors.hpp>

#include <algorithm>
#include <bit>

namespace Th2Cfg {

namespace {

UsageRecord read_usage_record(ByteCursor &cursor) {
  const auto offset = cursor.position();
  if (cursor.remaining() < UsageRecord::header_size) {
    throw FormatError(FormatErrc::TruncatedUsage, offset,
                      fmt::format("usage header needs {} bytes, {} left",
                                  UsageRecord::header_size,
                                  cursor.remaining()));
  }
  UsageRecord rec{};
  rec.offset = offset;
  rec.usage = cursor.read_u8();
  rec.revision = cursor.read_u8();
  cursor.skip(1);
  const auto length = cursor.read_u16();
  if (length > cursor.remaining()) {
    throw FormatError(
        FormatErrc::TruncatedUsage, offset,
        fmt::format("usage u{:02x} declares {} bytes, {} left", rec.usage,
                    length, cursor.remaining()));
  }
  const auto content = cursor.read_bytes(length);
  rec.content.assign(content.begin(), content.end());
  return rec;
}

} // namespace

ConfigContainer parse_config(byte_span data) {
  ByteCursor cursor(data);
  if (cursor.read_u32(std::endian::big) != signature) {
    throw FormatError(FormatErrc::BadSignature, 0,
                      "invalid .th2cfgbin signature");
  }
  ConfigContainer cfg{};
  cfg.format_version = cursor.read_u16();
  cfg.revision.major = cursor.read_u8();
  cfg.revision.minor = cursor.read_u8();
  cfg.revision.patch = cursor.read_u8();
  cfg.tcp_version = cursor.read_u8();
  cursor.seek(header_size);

  while (!cursor.empty()) {
    cfg.usages.push_back(read_usage_record(cursor));
  }
  return cfg;
}

CrcUsage decode_crc_usage(byte_span content) {
  ByteCursor cursor(content);
  CrcUsage crc{};
  crc.runtime_crc = cursor.read_u32();
  crc.config_crc = cursor.read_u32();
  return crc;
}

byte_vector encode_crc_usage(CrcUsage const &crc) {
  byte_vector out;
  out.reserve(CrcUsage::size);
  for (const auto val : {crc.runtime_crc, crc.config_crc}) {
    for (int shift = 0; shift < 32; shift += 8) {
      out.push_back(static_cast<std::uint8_t>((val >> shift) & 0xFF));
    }
  }
  return out;
}

std::uint32_t config_crc(std::span<const UsageRecord> records) {
  std::vector<UsageRecord const *> covered;
  for (auto const &r : records) {
    if (!is_read_only(r.usage) && r.usage != customer_usage) {
      covered.push_back(&r);
    }
  }
  std::stable_sort(covered.begin(), covered.end(),
                   [](auto const *a, auto const *b) { return a->usage < b->usage; });
  std::uint32_t crc{};
  for (auto const *r : covered) {
    crc = crc32(r->content, crc);
  }
  return crc;
}

} // namespace Th2Cfg
