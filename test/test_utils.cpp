#include <catch2/catch.hpp>

#include <array>
#include <cstdint>
#include <sstream>
#include <utils.hpp>

TEST_CASE("test dump hex line", "[utils][dump_line]") {
  SECTION("full line, line width = 8") {
    std::stringstream ss;
    OstreamDumper dumper(ss, 8);
    dumper.dump_line(0x3f, std::array<uint8_t, 8>{0x48, 0x03, 0x6c, 0x6c, 0x00,
                                                  0x20, 0x57, 0x6f});
    REQUIRE(ss.str() == "0x003f | 48 03 6c 6c 00 20 57 6f | H.ll. Wo |");
  }
  SECTION("partial line, line width = 16") {
    std::stringstream ss;
    OstreamDumper dumper(ss);
    dumper.dump_line(0x3f, std::array<uint8_t, 8>{0x48, 0x03, 0x6c, 0x6c, 0x00,
                                                  0x20, 0x57, 0x00});
    REQUIRE(ss.str() ==
            "0x003f | 48 03 6c 6c 00 20 57 00                         | "
            "H.ll. W.         |");
  }
  SECTION("zero width lines are refused") {
    std::stringstream ss;
    REQUIRE_THROWS_AS(OstreamDumper(ss, 0), std::invalid_argument);
  }
}

TEST_CASE("test dump memory", "[utils][dump_memory]") {
  std::stringstream ss;
  OstreamDumper dumper(ss, 8);
  dumper.dump_memory(0xa0, std::array<uint8_t, 14>{0x48, 0x03, 0x6c, 0x6c,
                                                   0x00, 0x20, 0x57, 0x6f,
                                                   0x72, 0x6c, 0x64, 0x21,
                                                   0x21, 0x21});
  REQUIRE(ss.str() == "0x00a0 | 48 03 6c 6c 00 20 57 6f | H.ll. Wo |\n"
                      "0x00a8 | 72 6c 64 21 21 21       | rld!!!   |\n");
}

TEST_CASE("test dump usage", "[utils][dump_usage]") {
  const byte_vector content{0x41, 0x58, 0x31, 0x31, 0x32, 0x00};

  SECTION("hexdump with a title line") {
    std::stringstream ss;
    OstreamDumper dumper(ss, 8);
    dumper.dump_start();
    dumper.dump_usage(0x36, content);
    dumper.dump_end();
    REQUIRE(ss.str() == "u36 (6 bytes)\n"
                        "0x0000 | 41 58 31 31 32 00       | AX112.   |\n");
  }
  SECTION("empty usage") {
    std::stringstream ss;
    OstreamDumper dumper(ss);
    dumper.dump_usage(0x36, byte_span{});
    REQUIRE(ss.str() == "u36 (0 bytes)\n");
  }
  SECTION("binary") {
    std::stringstream ss;
    BinaryDumper dumper(ss);
    dumper.dump_start();
    dumper.dump_usage(0x36, content);
    dumper.dump_end();
    const auto out = ss.str();
    REQUIRE(byte_vector(out.begin(), out.end()) == content);
  }
}

TEST_CASE("usage number parsing", "[utils][parse_usage]") {
  REQUIRE(parse_usage("36") == std::uint8_t{0x36});
  REQUIRE(parse_usage("0x36") == std::uint8_t{0x36});
  REQUIRE(parse_usage("u36") == std::uint8_t{0x36});
  REQUIRE(parse_usage("4") == std::uint8_t{0x04});
  REQUIRE(parse_usage("Af") == std::uint8_t{0xAF});
  REQUIRE_FALSE(parse_usage(""));
  REQUIRE_FALSE(parse_usage("0x"));
  REQUIRE_FALSE(parse_usage("123"));
  REQUIRE_FALSE(parse_usage("zz"));
}
