// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ConfigFile.hpp>
#include <DeviceIdentity.hpp>
#include <ITransport.hpp>
#include <Protocol.hpp>
#include <fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <vector>

// Simulated aXiom device speaking the DeviceLink frame protocol. Runs
// synchronously inside write(), replies are queued for read().
struct MockAxiom : public ITransport {
  enum class ChunkFault { Nak, Timeout, IoError };

  static constexpr unsigned always = std::numeric_limits<unsigned>::max();

  explicit MockAxiom(DeviceIdentity identity = default_identity());

  static DeviceIdentity default_identity() noexcept;

  static std::shared_ptr<MockAxiom> Create();

  // seeds the device from MOCK_AXIOM_DEVICE_ID and MOCK_AXIOM_CONFIG,
  // MOCK_AXIOM_FAIL_OPEN makes open() fail
  void load_environment();

  // ITransport
  void open() override;
  void close() noexcept override { m_open = false; }
  bool is_open() const noexcept override { return m_open; }
  void write(byte_span data) override;
  byte_vector read(std::size_t max_len,
                   std::chrono::milliseconds timeout) override;
  DeviceIdentity query_identity() override;
  unsigned capabilities() const noexcept override { return m_capabilities; }
  void delay(std::chrono::milliseconds d) override { m_delays.push_back(d); }

  // fault injection
  void fail_chunk(std::size_t index, ChunkFault fault, unsigned times = 1);
  void refuse_bootloader(unsigned times = always) {
    m_bootloader_refusals = times;
  }
  void corrupt_runtime_crc(bool val = true) { m_corrupt_crc = val; }
  void set_capabilities(unsigned caps) noexcept { m_capabilities = caps; }
  void fail_open(bool val = true) noexcept { m_fail_open = val; }

  // device state
  DeviceIdentity const &identity() const noexcept { return m_identity; }
  void set_identity(DeviceIdentity const &id) { m_identity = id; }
  void set_usage(std::uint8_t usage, byte_vector content);
  byte_vector const &usage(std::uint8_t usage) const;
  bool has_usage(std::uint8_t usage) const {
    return m_usages.contains(usage);
  }
  void set_runtime_crc(std::uint32_t crc) noexcept { m_runtime_crc = crc; }
  std::uint32_t runtime_crc() const noexcept { return m_runtime_crc; }
  void load_config(ConfigContainer const &cfg);
  // measurements halted by a STOP command
  bool stopped() const noexcept { return m_stopped; }

  // observations
  std::vector<byte_vector> const &accepted_chunks() const noexcept {
    return m_accepted;
  }
  byte_vector programmed_image() const;
  std::size_t chunk_writes() const noexcept { return m_chunk_writes; }
  std::size_t chunk_segments() const noexcept { return m_chunk_segments; }
  unsigned bootloader_requests() const noexcept { return m_bl_requests; }
  unsigned resets() const noexcept { return m_resets; }
  std::vector<Protocol::SystemCommand> const &commands() const noexcept {
    return m_commands;
  }
  std::vector<std::uint8_t> const &usage_writes() const noexcept {
    return m_usage_writes;
  }
  std::vector<std::chrono::milliseconds> const &delays() const noexcept {
    return m_delays;
  }

private:
  struct PendingFault {
    ChunkFault fault;
    unsigned remaining;
  };

  void handle(Protocol::Frame const &frame);
  void on_enter_bootloader();
  void on_chunk_data(byte_span payload);
  void on_write_chunk(byte_span payload);
  void on_reset();
  void on_read_usage(byte_span payload);
  void on_write_usage(byte_span payload);
  void on_system_command(byte_span payload);
  void reply(byte_span data);
  void reply_ack(Protocol::Ack ack);
  std::uint32_t stored_config_crc() const;

  DeviceIdentity m_identity;
  unsigned m_capabilities = RUNTIME_CRC | USAGE_ACCESS;
  bool m_open{};
  bool m_fail_open{};
  bool m_stopped{};
  bool m_corrupt_crc{};
  unsigned m_bootloader_refusals{};
  std::uint32_t m_runtime_crc{};
  std::uint32_t m_config_crc{};

  std::map<std::size_t, PendingFault> m_faults;
  std::map<std::uint8_t, byte_vector> m_usages;
  byte_vector m_rx;
  // CHUNK_DATA received since the last WRITE_CHUNK
  byte_vector m_staged;

  std::vector<byte_vector> m_accepted;
  std::size_t m_chunk_writes{};
  std::size_t m_chunk_segments{};
  unsigned m_bl_requests{};
  unsigned m_resets{};
  std::vector<Protocol::SystemCommand> m_commands;
  std::vector<std::uint8_t> m_usage_writes;
  std::vector<std::chrono::milliseconds> m_delays;
};
