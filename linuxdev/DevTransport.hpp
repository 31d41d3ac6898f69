// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ITransport.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : m_fd{fd} {}
  UniqueFd(UniqueFd &&other) noexcept : m_fd{std::exchange(other.m_fd, -1)} {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    reset(std::exchange(other.m_fd, -1));
    return *this;
  }
  ~UniqueFd() { reset(); }

  int get() const noexcept { return m_fd; }
  explicit operator bool() const noexcept { return m_fd >= 0; }
  void reset(int fd = -1) noexcept;

private:
  int m_fd{-1};
};

// Common part of the /dev node based transports
class DevTransport : public ITransport {
public:
  explicit DevTransport(std::filesystem::path node) : m_node{std::move(node)} {}

  void open() override;
  void close() noexcept override { m_fd.reset(); }
  bool is_open() const noexcept override { return static_cast<bool>(m_fd); }

  DeviceIdentity query_identity() override;
  unsigned capabilities() const noexcept override {
    return RUNTIME_CRC | USAGE_ACCESS;
  }
  void delay(std::chrono::milliseconds d) override;

  std::filesystem::path const &node() const noexcept { return m_node; }

protected:
  virtual void configure() {}
  int fd() const;
  [[noreturn]] void fail(std::string_view what) const;

private:
  std::filesystem::path m_node;
  UniqueFd m_fd;
};

// SPI and I2C replies are clocked out by the host: the device signals a
// pending reply with a ready marker in a one byte status read
inline constexpr std::uint8_t reply_ready_marker = 0xA5;
inline constexpr auto T_POLL = std::chrono::milliseconds{2};

class SpiDevTransport : public DevTransport {
public:
  SpiDevTransport(unsigned bus, unsigned device,
                  std::uint32_t speed_hz = 1'000'000);

  void write(byte_span data) override;
  byte_vector read(std::size_t max_len,
                   std::chrono::milliseconds timeout) override;

protected:
  void configure() override;

private:
  byte_vector transfer(byte_span tx, std::size_t len);

  std::uint32_t m_speed_hz;
};

class I2CDevTransport : public DevTransport {
public:
  I2CDevTransport(unsigned bus, std::uint8_t address);

  void write(byte_span data) override;
  byte_vector read(std::size_t max_len,
                   std::chrono::milliseconds timeout) override;

protected:
  void configure() override;

private:
  std::uint8_t m_address;
};

// USB protocol bridge, 64 byte reports: byte 0 holds the number of valid
// data bytes that follow
class HidrawTransport : public DevTransport {
public:
  static constexpr std::size_t report_size = 64;

  explicit HidrawTransport(std::filesystem::path node);

  // first hidraw node announced by a TouchNetix bridge
  static std::filesystem::path find_bridge();

  void write(byte_span data) override;
  byte_vector read(std::size_t max_len,
                   std::chrono::milliseconds timeout) override;

private:
  byte_vector m_pending;
};
