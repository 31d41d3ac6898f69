#include <catch2/catch.hpp>

#include "cli_utils.hpp"

#include <Errors.hpp>
#include <ITransport.hpp>

#include "test_utils.hpp"

#include <array>
#include <filesystem>
#include <fstream>

#include <stdlib.h>

namespace {

void write_file(fs::path const &p, byte_vector const &data) {
  std::ofstream ofs(p, std::ios::binary);
  ofs.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
}

} // namespace

TEST_CASE("Firmware files are checked before the device is opened",
          "[cli]") {
  const auto path = fs::temp_directory_path() / "axflash_cli_test.axfw";
  auto image = AxfwImage{}.build();

  // every transport the CLI creates fails to open
  ::setenv("MOCK_AXIOM_FAIL_OPEN", "1", 1);
  finally cleanup{[&path]() {
    ::unsetenv("MOCK_AXIOM_FAIL_OPEN");
    std::error_code ec;
    fs::remove(path, ec);
  }};

  auto pparser = get_parser();
  auto &parser = pparser->parser;
  const std::array<const char *, 6> argv{"axflash", "-i", "usb", "-q", "-f",
                                         path.c_str()};
  parser.parse_args(static_cast<int>(argv.size()), argv.data());
  const Console console(Verbosity::ERROR, true);

  SECTION("a corrupt image never reaches the transport") {
    image.back() ^= 0xFF;
    write_file(path, image);
    REQUIRE_THROWS_AS(
        execFirmware(parser, console, path, FileType::Firmware), FormatError);
  }
  SECTION("a truncated raw image never reaches the transport") {
    auto raw = make_alc({{0x01, 0x02, 0x03}});
    raw.pop_back();
    write_file(path, raw);
    REQUIRE_THROWS_AS(
        execFirmware(parser, console, path, FileType::RawFirmware),
        FormatError);
  }
  SECTION("a valid image goes on to open the device") {
    write_file(path, image);
    REQUIRE_THROWS_AS(
        execFirmware(parser, console, path, FileType::Firmware),
        ITransport::Error);
  }
}
