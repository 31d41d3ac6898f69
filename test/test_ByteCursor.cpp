#include <catch2/catch.hpp>

#include <ByteCursor.hpp>
#include <Crc32.hpp>
#include <Errors.hpp>

#include <string_view>

TEST_CASE("ByteCursor reads with explicit byte order", "[ByteCursor]") {
  const byte_vector data{0x12, 0x34, 0x56, 0x78, 0x9a, 0xbc, 0xde, 0xf0};
  ByteCursor cursor(data);

  SECTION("little endian") {
    REQUIRE(cursor.read_u16() == 0x3412);
    REQUIRE(cursor.read_u32() == 0x9a785634);
    REQUIRE(cursor.position() == 6);
    REQUIRE(cursor.remaining() == 2);
  }
  SECTION("big endian") {
    REQUIRE(cursor.read_u16(std::endian::big) == 0x1234);
    REQUIRE(cursor.read_u32(std::endian::big) == 0x56789abc);
  }
  SECTION("bytes and seek") {
    cursor.seek(5);
    const auto bytes = cursor.read_bytes(3);
    REQUIRE(bytes.size() == 3);
    REQUIRE(bytes[0] == 0xbc);
    REQUIRE(cursor.empty());
    cursor.seek(0);
    REQUIRE(cursor.read_u8() == 0x12);
    cursor.skip(6);
    REQUIRE(cursor.rest().size() == 1);
  }
}

TEST_CASE("ByteCursor never reads past the end", "[ByteCursor]") {
  const byte_vector data{0x01, 0x02, 0x03};
  ByteCursor cursor(data);

  SECTION("integer read") {
    cursor.skip(2);
    try {
      cursor.read_u16();
      FAIL("expected FormatError");
    } catch (FormatError const &e) {
      REQUIRE(e.code_value() == FormatErrc::OutOfBounds);
      REQUIRE(e.offset() == 2);
    }
    // a failed read doesn't move the cursor
    REQUIRE(cursor.position() == 2);
    REQUIRE(cursor.read_u8() == 0x03);
  }
  SECTION("byte run") {
    REQUIRE_THROWS_AS(cursor.read_bytes(4), FormatError);
    REQUIRE(cursor.read_bytes(3).size() == 3);
    REQUIRE_THROWS_AS(cursor.read_u8(), FormatError);
  }
  SECTION("seek") {
    REQUIRE_NOTHROW(cursor.seek(3));
    REQUIRE(cursor.empty());
    REQUIRE_THROWS_AS(cursor.seek(4), FormatError);
  }
  SECTION("empty buffer") {
    ByteCursor empty{byte_span{}};
    REQUIRE(empty.empty());
    REQUIRE_THROWS_AS(empty.read_u8(), FormatError);
  }
}

TEST_CASE("CRC32 matches the IEEE reference", "[crc32]") {
  constexpr std::string_view check = "123456789";
  const byte_vector data(check.begin(), check.end());
  REQUIRE(crc32(data) == 0xCBF43926u);
  REQUIRE(crc32(byte_span{}) == 0);

  SECTION("running checksum") {
    const auto part = crc32(byte_span(data).first(4));
    REQUIRE(crc32(byte_span(data).subspan(4), part) == 0xCBF43926u);
  }
}
