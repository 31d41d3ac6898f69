// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceIdentity.hpp>
#include <FirmwareFile.hpp>
#include <ITransport.hpp>
#include <Protocol.hpp>
#include <Timings.hpp>
#include <fwd.hpp>

#include <chrono>
#include <cstdint>

// Request/response codec on top of a borrowed transport. All I/O failures
// surface as ITransport::Error, unexpected replies included.
class DeviceLink {
public:
  explicit DeviceLink(ITransport &transport) noexcept
      : m_transport{&transport} {}

  DeviceIdentity identify();

  void request_bootloader();
  void send_chunk(Chunk const &chunk);
  Protocol::Ack
  read_ack(std::chrono::milliseconds timeout = Timings::T_CHUNK_ACK);
  void reset();
  std::uint32_t runtime_crc();

  byte_vector read_usage(std::uint8_t usage);
  void write_usage(std::uint8_t usage, byte_span content);
  void send_command(Protocol::SystemCommand cmd);

  ITransport &transport() const noexcept { return *m_transport; }

private:
  void send(Protocol::Opcode op, byte_span payload = {});
  byte_vector read_exact(std::size_t n, std::chrono::milliseconds timeout =
                                            Timings::T_RESPONSE);
  void expect_ack(std::string_view what);

  ITransport *m_transport;
};
