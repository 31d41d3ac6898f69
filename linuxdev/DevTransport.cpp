// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "DevTransport.hpp"

#include <DeviceLink.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <linux/spi/spidev.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

ITransport::Ptr ITransport::Create(TransportConfig const &config) {
  switch (config.interface) {
  case Interface::SPI:
    return std::make_shared<SpiDevTransport>(config.spi_bus,
                                             config.spi_device);
  case Interface::I2C:
    return std::make_shared<I2CDevTransport>(config.i2c_bus,
                                             config.i2c_address);
  case Interface::USB:
    return std::make_shared<HidrawTransport>(
        config.hid_path.empty() ? HidrawTransport::find_bridge()
                                : fs::path(config.hid_path));
  }
  throw std::invalid_argument("Unknown interface");
}

void UniqueFd::reset(int fd) noexcept {
  if (m_fd >= 0) {
    ::close(m_fd);
  }
  m_fd = fd;
}

void DevTransport::open() {
  if (m_fd) {
    return;
  }
  UniqueFd fd(::open(m_node.c_str(), O_RDWR | O_CLOEXEC));
  if (!fd) {
    fail(fmt::format("Cannot open {}", m_node.string()));
  }
  m_fd = std::move(fd);
  configure();
}

int DevTransport::fd() const {
  if (!m_fd) {
    throw Error(fmt::format("{} is not open", m_node.string()));
  }
  return m_fd.get();
}

void DevTransport::fail(std::string_view what) const {
  throw Error(fmt::format("{}: {}", what, std::strerror(errno)));
}

DeviceIdentity DevTransport::query_identity() {
  return DeviceLink(*this).identify();
}

void DevTransport::delay(std::chrono::milliseconds d) {
  std::this_thread::sleep_for(d);
}

namespace {

template <typename Poll>
void wait_ready(Poll &&poll_once, std::chrono::milliseconds timeout,
                std::string_view node) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!poll_once()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw ITransport::Timeout(
          fmt::format("{}: no reply within {}ms", node, timeout.count()));
    }
    std::this_thread::sleep_for(T_POLL);
  }
}

} // namespace

SpiDevTransport::SpiDevTransport(unsigned bus, unsigned device,
                                 std::uint32_t speed_hz)
    : DevTransport(fmt::format("/dev/spidev{}.{}", bus, device)),
      m_speed_hz{speed_hz} {}

void SpiDevTransport::configure() {
  std::uint8_t mode = SPI_MODE_0;
  std::uint8_t bits = 8;
  if (::ioctl(fd(), SPI_IOC_WR_MODE, &mode) < 0 ||
      ::ioctl(fd(), SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
      ::ioctl(fd(), SPI_IOC_WR_MAX_SPEED_HZ, &m_speed_hz) < 0) {
    fail(fmt::format("Cannot configure {}", node().string()));
  }
}

byte_vector SpiDevTransport::transfer(byte_span tx, std::size_t len) {
  byte_vector txbuf(tx.begin(), tx.end());
  txbuf.resize(len, 0x00);
  byte_vector rx(len);
  spi_ioc_transfer xfer{};
  xfer.tx_buf = reinterpret_cast<std::uintptr_t>(txbuf.data());
  xfer.rx_buf = reinterpret_cast<std::uintptr_t>(rx.data());
  xfer.len = static_cast<std::uint32_t>(len);
  xfer.speed_hz = m_speed_hz;
  xfer.bits_per_word = 8;
  if (::ioctl(fd(), SPI_IOC_MESSAGE(1), &xfer) < 0) {
    fail(fmt::format("SPI transfer on {} failed", node().string()));
  }
  return rx;
}

void SpiDevTransport::write(byte_span data) { transfer(data, data.size()); }

byte_vector SpiDevTransport::read(std::size_t max_len,
                                  std::chrono::milliseconds timeout) {
  wait_ready(
      [this]() { return transfer({}, 1).front() == reply_ready_marker; },
      timeout, node().string());
  return transfer({}, max_len);
}

I2CDevTransport::I2CDevTransport(unsigned bus, std::uint8_t address)
    : DevTransport(fmt::format("/dev/i2c-{}", bus)), m_address{address} {}

void I2CDevTransport::configure() {
  if (::ioctl(fd(), I2C_SLAVE, static_cast<unsigned long>(m_address)) < 0) {
    fail(fmt::format("Cannot address 0x{:02x} on {}", m_address,
                     node().string()));
  }
}

void I2CDevTransport::write(byte_span data) {
  const auto n = ::write(fd(), data.data(), data.size());
  if (n < 0 || static_cast<std::size_t>(n) != data.size()) {
    fail(fmt::format("I2C write to 0x{:02x} failed", m_address));
  }
}

byte_vector I2CDevTransport::read(std::size_t max_len,
                                  std::chrono::milliseconds timeout) {
  wait_ready(
      [this]() {
        std::uint8_t status{};
        if (::read(fd(), &status, 1) != 1) {
          fail(fmt::format("I2C status read from 0x{:02x} failed", m_address));
        }
        return status == reply_ready_marker;
      },
      timeout, node().string());
  byte_vector res(max_len);
  const auto n = ::read(fd(), res.data(), res.size());
  if (n <= 0) {
    fail(fmt::format("I2C read from 0x{:02x} failed", m_address));
  }
  res.resize(static_cast<std::size_t>(n));
  return res;
}

HidrawTransport::HidrawTransport(fs::path node)
    : DevTransport(std::move(node)) {}

fs::path HidrawTransport::find_bridge() {
  const fs::path sysfs{"/sys/class/hidraw"};
  std::error_code ec;
  for (auto const &entry : fs::directory_iterator(sysfs, ec)) {
    std::ifstream uevent(entry.path() / "device" / "uevent");
    for (std::string line; std::getline(uevent, line);) {
      if (line.starts_with("HID_NAME=") &&
          line.find("TouchNetix") != std::string::npos) {
        return fs::path("/dev") / entry.path().filename();
      }
    }
  }
  if (ec) {
    throw Error(fmt::format("Cannot list {}: {}", sysfs.string(), ec.message()));
  }
  throw Error("No TouchNetix USB bridge found");
}

void HidrawTransport::write(byte_span data) {
  constexpr auto max_data = report_size - 1;
  do {
    const auto n = std::min(data.size(), max_data);
    // report id 0 followed by the report itself
    std::array<std::uint8_t, report_size + 1> report{};
    report[1] = static_cast<std::uint8_t>(n);
    std::copy_n(data.begin(), n, report.begin() + 2);
    if (::write(fd(), report.data(), report.size()) < 0) {
      fail(fmt::format("Write to {} failed", node().string()));
    }
    data = data.subspan(n);
  } while (!data.empty());
}

byte_vector HidrawTransport::read(std::size_t max_len,
                                  std::chrono::milliseconds timeout) {
  if (m_pending.empty()) {
    pollfd pfd{fd(), POLLIN, 0};
    const auto rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
      fail(fmt::format("Poll on {} failed", node().string()));
    }
    if (rc == 0) {
      throw Timeout(fmt::format("{}: no report within {}ms", node().string(),
                                timeout.count()));
    }
    std::array<std::uint8_t, report_size> report{};
    if (::read(fd(), report.data(), report.size()) <= 0) {
      fail(fmt::format("Read from {} failed", node().string()));
    }
    const auto len = std::min<std::size_t>(report[0], report_size - 1);
    m_pending.assign(report.begin() + 1, report.begin() + 1 + len);
  }
  const auto n = std::min(max_len, m_pending.size());
  byte_vector res(m_pending.begin(), m_pending.begin() + n);
  m_pending.erase(m_pending.begin(), m_pending.begin() + n);
  return res;
}
