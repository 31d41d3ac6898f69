#include <catch2/catch.hpp>

#include <Compatibility.hpp>
#include <Errors.hpp>

#include "test_utils.hpp"

namespace {

FirmwareContainer firmware() {
  FirmwareContainer fw{};
  fw.format_version = 0x0001;
  fw.metadata = default_metadata();
  return fw;
}

DeviceIdentity running_device() {
  DeviceIdentity id{};
  id.device_id = 0x0070;
  id.firmware_version = 0x0408;
  id.firmware_patch = 10;
  id.variant = FirmwareVariant::ThreeD;
  id.status = FirmwareStatus::Production;
  id.silicon_version = 0x0002;
  id.silicon_revision = 1;
  return id;
}

} // namespace

TEST_CASE("Matching firmware is verified", "[Compatibility]") {
  const CompatibilityValidator validator;
  const auto verdict = validator.validate(firmware(), running_device());
  REQUIRE(verdict.status == Compatibility::Verified);
  REQUIRE(verdict.proceed());
  REQUIRE(verdict.verified());
  REQUIRE_FALSE(verdict.reason);
}

TEST_CASE("Rejection reasons", "[Compatibility]") {
  const CompatibilityValidator validator;
  auto fw = firmware();
  auto dev = running_device();

  SECTION("different part") {
    dev.device_id = 0x0071;
    const auto verdict = validator.validate(fw, dev);
    REQUIRE(verdict.status == Compatibility::Rejected);
    REQUIRE_FALSE(verdict.proceed());
    REQUIRE(verdict.reason == CompatibilityErrc::DeviceMismatch);
  }
  SECTION("device id is checked before silicon") {
    dev.device_id = 0x0071;
    dev.silicon_version = 0x0009;
    REQUIRE(validator.validate(fw, dev).reason ==
            CompatibilityErrc::DeviceMismatch);
  }
  SECTION("silicon version differs") {
    dev.silicon_version = 0x0003;
    REQUIRE(validator.validate(fw, dev).reason ==
            CompatibilityErrc::SiliconMismatch);
  }
  SECTION("file needs a newer silicon revision") {
    fw.metadata.silicon_revision = 2;
    REQUIRE(validator.validate(fw, dev).reason ==
            CompatibilityErrc::SiliconMismatch);
  }
  SECTION("older silicon revision in the file is accepted") {
    fw.metadata.silicon_revision = 0;
    REQUIRE(validator.validate(fw, dev).verified());
  }
  SECTION("variant change") {
    fw.metadata.variant = FirmwareVariant::TwoD;
    REQUIRE(validator.validate(fw, dev).reason ==
            CompatibilityErrc::VariantMismatch);
    const CompatibilityValidator permissive({.allow_variant_change = true});
    REQUIRE(permissive.validate(fw, dev).verified());
  }
  SECTION("silicon is checked before variant") {
    fw.metadata.variant = FirmwareVariant::TwoD;
    dev.silicon_version = 0x0003;
    REQUIRE(validator.validate(fw, dev).reason ==
            CompatibilityErrc::SiliconMismatch);
  }
  SECTION("reason renders as text") {
    dev.device_id = 0x0071;
    REQUIRE_FALSE(validator.validate(fw, dev).describe().empty());
  }
}

TEST_CASE("Already up to date short circuit", "[Compatibility]") {
  auto fw = firmware();
  const auto dev = running_device();
  fw.metadata.version = dev.firmware_version;
  fw.metadata.patch = dev.firmware_patch;

  SECTION("only when asked for") {
    REQUIRE(CompatibilityValidator{}.validate(fw, dev).verified());
  }
  SECTION("same version") {
    const CompatibilityValidator validator({.skip_if_current = true});
    const auto verdict = validator.validate(fw, dev);
    REQUIRE(verdict.status == Compatibility::AlreadyUpToDate);
    REQUIRE_FALSE(verdict.proceed());
  }
  SECTION("different patch is loaded") {
    fw.metadata.patch = dev.firmware_patch + 1;
    const CompatibilityValidator validator({.skip_if_current = true});
    REQUIRE(validator.validate(fw, dev).verified());
  }
  SECTION("incompatible files are still rejected") {
    fw.metadata.device_id = 0x0071;
    const CompatibilityValidator validator({.skip_if_current = true});
    REQUIRE(validator.validate(fw, dev).status == Compatibility::Rejected);
  }
}

TEST_CASE("Devices in bootloader mode", "[Compatibility]") {
  const CompatibilityValidator validator;
  DeviceIdentity dev{};
  dev.device_id = 0x0070;
  dev.bootloader_mode = true;
  // silicon and variant are unknown to a bootloader
  dev.silicon_version = 0x0099;
  dev.variant = FirmwareVariant::Force;
  const auto verdict = validator.validate(firmware(), dev);
  REQUIRE(verdict.status == Compatibility::DeviceIdOnly);
  REQUIRE(verdict.proceed());
  REQUIRE_FALSE(verdict.verified());
  dev.device_id = 0x0071;
  REQUIRE(validator.validate(firmware(), dev).reason ==
          CompatibilityErrc::DeviceMismatch);
}

TEST_CASE("Bypassed checks are recorded", "[Compatibility]") {
  auto dev = running_device();
  dev.device_id = 0x0071;

  SECTION("forced") {
    const CompatibilityValidator validator({.force = true});
    const auto verdict = validator.validate(firmware(), dev);
    REQUIRE(verdict.status == Compatibility::Bypassed);
    REQUIRE(verdict.proceed());
    REQUIRE_FALSE(verdict.verified());
  }
  SECTION("raw container") {
    const CompatibilityValidator validator;
    const auto verdict = validator.validate(RawFirmwareContainer{}, dev);
    REQUIRE(verdict.status == Compatibility::Bypassed);
    REQUIRE(verdict.proceed());
  }
}
