#include <catch2/catch.hpp>

#include <Errors.hpp>
#include <FormatParser.hpp>

#include "test_utils.hpp"

#include <filesystem>

namespace {

FormatErrc parse_error(byte_span data) {
  try {
    Axfw::parse_firmware(data);
  } catch (FormatError const &e) {
    return e.code_value();
  }
  FAIL("parse_firmware accepted the image");
  return {};
}

} // namespace

TEST_CASE("Parsing a minimal .axfw image", "[FormatParser]") {
  AxfwImage img;
  const auto data = img.build();
  REQUIRE(data.size() == 24 + 8 + 4);

  const auto fw = Axfw::parse_firmware(data);
  REQUIRE(fw.format_version == 0x0001);
  REQUIRE(fw.metadata.device_id == 0x0070);
  REQUIRE(device_id_str(fw.metadata.device_id) == "AX112A");
  REQUIRE(fw.payload.size() == 1);
  REQUIRE(fw.payload[0].body == byte_vector{0x01, 0x02, 0x03, 0x04});
  REQUIRE(fw.payload[0].offset == 24);
  REQUIRE(fw.payload_crc == fw.metadata.firmware_crc);
}

TEST_CASE("Corrupting the image is detected by the declared CRC",
          "[FormatParser]") {
  AxfwImage img;
  img.bodies = {{0x01, 0x02, 0x03, 0x04}, {0x05, 0x06}};
  const auto data = img.build();
  // every byte covered by the CRC, metadata and chunk headers included
  for (std::size_t i = Axfw::crc_range_start; i < data.size(); ++i) {
    auto corrupt = data;
    corrupt[i] ^= 0x01;
    INFO("flipped byte " << i);
    REQUIRE(parse_error(corrupt) == FormatErrc::CrcMismatch);
  }
  SECTION("the declared CRC itself") {
    auto corrupt = data;
    corrupt[Axfw::declared_crc_offset] ^= 0xFF;
    REQUIRE(parse_error(corrupt) == FormatErrc::CrcMismatch);
  }
}

TEST_CASE("Header validation order", "[FormatParser]") {
  AxfwImage img;

  SECTION("bad signature") {
    auto data = img.build();
    data[0] = 'X';
    REQUIRE(parse_error(data) == FormatErrc::BadSignature);
  }
  SECTION("unknown version is rejected before the CRC") {
    img.format_version = 0x0003;
    auto data = img.build();
    data[4] ^= 0xFF;
    REQUIRE(parse_error(data) == FormatErrc::UnsupportedVersion);
  }
  SECTION("buffer shorter than the metadata") {
    auto data = img.build();
    data.resize(14);
    AxfwImage::fix_crc(data);
    REQUIRE(parse_error(data) == FormatErrc::OutOfBounds);
  }
  SECTION("buffer shorter than the fixed prefix") {
    const byte_vector data{'A', 'X', 'F', 'W', 0x00};
    REQUIRE(parse_error(data) == FormatErrc::OutOfBounds);
  }
  SECTION("empty buffer") {
    REQUIRE(parse_error(byte_span{}) == FormatErrc::OutOfBounds);
  }
}

TEST_CASE("Chunk walk stops on truncated chunks", "[FormatParser]") {
  AxfwImage img;
  img.bodies = {{0x01, 0x02, 0x03, 0x04}, {0x05, 0x06, 0x07}};

  SECTION("body runs past the end") {
    auto data = img.build();
    data.pop_back();
    AxfwImage::fix_crc(data);
    try {
      Axfw::parse_firmware(data);
      FAIL("expected FormatError");
    } catch (FormatError const &e) {
      REQUIRE(e.code_value() == FormatErrc::TruncatedChunk);
      // offset of the second chunk header
      REQUIRE(e.offset() == 24 + 8 + 4);
    }
  }
  SECTION("partial chunk header") {
    auto data = img.build();
    data.insert(data.end(), {0xAA, 0xBB, 0xCC});
    AxfwImage::fix_crc(data);
    REQUIRE(parse_error(data) == FormatErrc::TruncatedChunk);
  }
  SECTION("empty payload is valid") {
    img.bodies.clear();
    const auto fw = Axfw::parse_firmware(img.build());
    REQUIRE(fw.payload.empty());
  }
  SECTION("zero length chunk") {
    img.bodies = {{}, {0x01}};
    const auto fw = Axfw::parse_firmware(img.build());
    REQUIRE(fw.payload.size() == 2);
    REQUIRE(fw.payload[0].body.empty());
  }
}

TEST_CASE("Both format revisions decode the same metadata",
          "[FormatParser]") {
  AxfwImage img;
  img.metadata.device_id = 0x0442;
  img.metadata.variant = FirmwareVariant::Force;
  img.metadata.version = 0x0A03;
  img.metadata.patch = 17;
  img.metadata.status = FirmwareStatus::Engineering;
  img.metadata.silicon_version = 0x1234;
  img.metadata.silicon_revision = 3;
  img.bodies = {byte_vector(300, 0x5A), {0x01, 0x02}};

  for (const auto version : {std::uint16_t{0x0001}, std::uint16_t{0x0200}}) {
    img.format_version = version;
    INFO("format version " << version);
    const auto data = img.build();
    const auto fw = Axfw::parse_firmware(data);
    const auto &md = fw.metadata;
    REQUIRE(fw.format_version == version);
    REQUIRE(md.device_id == 0x0442);
    REQUIRE(md.variant == FirmwareVariant::Force);
    REQUIRE(md.version == 0x0A03);
    REQUIRE(md.patch == 17);
    REQUIRE(md.status == FirmwareStatus::Engineering);
    REQUIRE(md.silicon_version == 0x1234);
    REQUIRE(md.silicon_revision == 3);
    REQUIRE(fw.payload.size() == 2);
    REQUIRE(fw.payload[0].body.size() == 300);
    REQUIRE(version_str(md.version, md.patch) == "10.3.17");
    // payload bytes are preserved exactly
    REQUIRE(serialize_chunks(fw.payload) == img.payload());
    REQUIRE(payload_size(fw.payload) == img.payload().size());
  }
}

TEST_CASE("Chunk length byte order follows the layout", "[FormatParser]") {
  // a v0x0200 image parsed as v0x0001 must fail, 300 = 0x012C and
  // 0x2C01 runs past the end
  AxfwImage img;
  img.format_version = 0x0200;
  img.bodies = {byte_vector(300, 0x00)};
  auto data = img.build();
  data[8] = 0x01;
  data[9] = 0x00;
  AxfwImage::fix_crc(data);
  REQUIRE(parse_error(data) == FormatErrc::TruncatedChunk);
}

TEST_CASE("Parsing raw .alc payloads", "[FormatParser]") {
  SECTION("chunks in file order") {
    const auto data = make_alc({{0x01, 0x02}, byte_vector(256, 0xEE), {}});
    const auto raw = Axfw::parse_raw_firmware(data);
    REQUIRE(raw.payload.size() == 3);
    REQUIRE(raw.payload[1].body.size() == 256);
    REQUIRE(raw.payload[2].offset == 8 + 2 + 8 + 256);
    REQUIRE(serialize_chunks(raw.payload) == data);
  }
  SECTION("largest chunk the length field can describe") {
    const auto data = make_alc({byte_vector(0xFFFF, 0x11), {0x22}});
    const auto raw = Axfw::parse_raw_firmware(data);
    REQUIRE(raw.payload.size() == 2);
    REQUIRE(raw.payload[0].body.size() == 0xFFFF);
    REQUIRE(raw.payload[1].offset == 8 + 0xFFFF);
  }
  SECTION("empty file") {
    REQUIRE(Axfw::parse_raw_firmware(byte_span{}).payload.empty());
  }
  SECTION("truncated") {
    auto data = make_alc({{0x01, 0x02, 0x03}});
    data.pop_back();
    REQUIRE_THROWS_AS(Axfw::parse_raw_firmware(data), FormatError);
  }
}

TEST_CASE("Loading files", "[FormatParser]") {
  namespace fs = std::filesystem;
  REQUIRE_THROWS_AS(load_file("/nonexistent/firmware.axfw"),
                    fs::filesystem_error);
  REQUIRE_THROWS_AS(load_file(fs::temp_directory_path()), fs::filesystem_error);
}
