#include <catch2/catch.hpp>

#include <ConfigWriter.hpp>
#include <Errors.hpp>
#include <MockAxiom.hpp>
#include <UsageTableWalker.hpp>

#include "test_utils.hpp"

#include <algorithm>
#include <vector>

using Protocol::SystemCommand;

namespace {

constexpr std::uint32_t device_runtime_crc = 0x5EED1234;

struct ProgressRecorder : IProgressListener {
  void onProgress(std::size_t done, std::size_t total) override {
    calls.emplace_back(done, total);
  }
  std::vector<std::pair<std::size_t, std::size_t>> calls;
};

// running device with its own settings, same firmware as the saved config
void prepare_device(MockAxiom &dev) {
  dev.set_runtime_crc(device_runtime_crc);
  dev.set_usage(0x04, {'C', 'U', 'S', 'T'});
  dev.set_usage(0x22, {0x00, 0x00, 0x00});
  dev.set_usage(0x42, {0x01, 0x01, 0x01, 0x01, 0x01});
}

ConfigContainer saved_config_container(std::uint32_t runtime_crc) {
  return Th2Cfg::parse_config(make_th2cfg(saved_config(runtime_crc)));
}

} // namespace

TEST_CASE("Loading a config into a device", "[ConfigWriter]") {
  auto objs = setup();
  auto &dev = *objs.device;
  prepare_device(dev);
  const auto cfg = saved_config_container(device_runtime_crc);
  ProgressRecorder progress;

  SECTION("customer data is kept by default") {
    ConfigWriter writer({}, &progress);
    const auto ec = writer.write(dev, cfg);
    REQUIRE_FALSE(ec);
    REQUIRE(writer.detail().empty());
    REQUIRE(dev.usage(0x22) == byte_vector{0x10, 0x20, 0x30});
    REQUIRE(dev.usage(0x42) == byte_vector{0xAA, 0xBB, 0xCC, 0xDD, 0xEE});
    REQUIRE(dev.usage(0x04) == byte_vector{'C', 'U', 'S', 'T'});
    REQUIRE(dev.commands() ==
            std::vector<SystemCommand>{
                SystemCommand::STOP, SystemCommand::FILL_CONFIG,
                SystemCommand::SAVE_CONFIG, SystemCommand::SOFT_RESET});
    // u04 is only restored after FILL_CONFIG, read-only usages never written
    REQUIRE(dev.usage_writes() == std::vector<std::uint8_t>{0x04, 0x22, 0x42});
    REQUIRE(std::count(dev.delays().begin(), dev.delays().end(),
                       Timings::T_SAVE_CONFIG) == 1);
    REQUIRE_FALSE(dev.stopped());
  }
  SECTION("customer data is overwritten on request") {
    ConfigWriteOptions opts{};
    opts.overwrite_u04 = true;
    ConfigWriter writer(opts);
    REQUIRE_FALSE(writer.write(dev, cfg));
    REQUIRE(dev.usage(0x04) == byte_vector{'S', 'N', '0', '1'});
  }
  SECTION("progress covers every usage") {
    ConfigWriter writer({}, &progress);
    REQUIRE_FALSE(writer.write(dev, cfg));
    const auto total = UsageTableWalker(cfg).content_size();
    REQUIRE(progress.calls.front() == std::pair<std::size_t, std::size_t>{0, total});
    REQUIRE(progress.calls.back() == std::pair<std::size_t, std::size_t>{total, total});
    REQUIRE(progress.calls.size() == cfg.usages.size() + 1);
  }
}

TEST_CASE("Configs from other firmware are refused", "[ConfigWriter]") {
  auto objs = setup();
  auto &dev = *objs.device;
  prepare_device(dev);
  const auto cfg = saved_config_container(device_runtime_crc + 1);

  ConfigWriter writer;
  const auto ec = writer.write(dev, cfg);
  REQUIRE(ec == ConfigErrc::FirmwareMismatch);
  REQUIRE_FALSE(writer.detail().empty());
  // nothing was touched
  REQUIRE(dev.commands().empty());
  REQUIRE(dev.usage_writes().empty());
  REQUIRE(dev.usage(0x22) == byte_vector{0x00, 0x00, 0x00});
}

TEST_CASE("Config write failures", "[ConfigWriter]") {
  auto objs = setup();
  auto &dev = *objs.device;
  prepare_device(dev);
  ConfigWriter writer;

  SECTION("no u33 in the file") {
    const auto cfg = Th2Cfg::parse_config(make_th2cfg({{0x22, 1, {1}}}));
    REQUIRE(writer.write(dev, cfg) == ConfigErrc::MissingUsage);
    REQUIRE(dev.commands().empty());
  }
  SECTION("device content differs after the reset") {
    auto usages = saved_config(device_runtime_crc);
    auto &u33 = usages.back();
    auto crc = Th2Cfg::decode_crc_usage(u33.content);
    crc.config_crc ^= 0xFFFFFFFF;
    u33.content = Th2Cfg::encode_crc_usage(crc);
    const auto cfg = Th2Cfg::parse_config(make_th2cfg(usages));
    REQUIRE(writer.write(dev, cfg) == ConfigErrc::VerifyMismatch);
    REQUIRE(dev.commands().back() == SystemCommand::SOFT_RESET);
  }
  SECTION("transport without usage access") {
    dev.set_capabilities(ITransport::RUNTIME_CRC);
    const auto cfg = saved_config_container(device_runtime_crc);
    REQUIRE(writer.write(dev, cfg) == std::errc::operation_not_supported);
  }
  SECTION("transport errors propagate") {
    dev.close();
    const auto cfg = saved_config_container(device_runtime_crc);
    REQUIRE_THROWS_AS(writer.write(dev, cfg), ITransport::Error);
  }
}
