// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceIdentity.hpp>
#include <fwd.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

enum class Interface { USB, SPI, I2C };

inline constexpr std::string_view to_string(Interface i) noexcept {
  switch (i) {
  case Interface::USB:
    return "usb"sv;
  case Interface::SPI:
    return "spi"sv;
  case Interface::I2C:
    return "i2c"sv;
  }
  return "unknown"sv;
}

struct TransportConfig {
  Interface interface = Interface::USB;
  unsigned i2c_bus = 1;
  std::uint8_t i2c_address = 0x67;
  unsigned spi_bus = 0;
  unsigned spi_device = 0;
  // /dev/hidrawN of the USB protocol bridge, empty means first match
  std::string hid_path;
};

// Byte level link to an aXiom device. Implementations move opaque frames,
// framing and meaning are owned by DeviceLink.
struct ITransport {
  using Ptr = std::shared_ptr<ITransport>;

  struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  struct Timeout : Error {
    using Error::Error;
  };

  struct Interrupted : std::exception {
    const char *what() const noexcept override {
      return "Transport Interrupted";
    }
  };

  enum Capability : unsigned {
    NONE = 0,
    // device reports the runtime firmware CRC after a reset
    RUNTIME_CRC = 1u << 0,
    USAGE_ACCESS = 1u << 1,
  };

  virtual void open() = 0;
  virtual void close() noexcept = 0;
  [[nodiscard]] virtual bool is_open() const noexcept = 0;

  virtual void write(byte_span data) = 0;
  // returns between 1 and max_len bytes, throws Timeout if nothing arrived
  virtual byte_vector read(std::size_t max_len,
                           std::chrono::milliseconds timeout) = 0;

  virtual DeviceIdentity query_identity() = 0;

  [[nodiscard]] virtual unsigned capabilities() const noexcept = 0;
  [[nodiscard]] bool supports(Capability c) const noexcept {
    return (capabilities() & c) != 0;
  }

  virtual void delay(std::chrono::milliseconds) = 0;

  static Ptr Create(TransportConfig const &config);

  virtual ~ITransport() = default;
};
