// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ChunkTransferEngine.hpp>
#include <ConfigFile.hpp>
#include <DeviceLink.hpp>
#include <ITransport.hpp>
#include <Timings.hpp>

#include <chrono>
#include <string>
#include <system_error>

struct ConfigWriteOptions {
  // replace the customer data in u04 with the copy from the file
  bool overwrite_u04 = false;
  std::chrono::milliseconds save_delay = Timings::T_SAVE_CONFIG;
  std::chrono::milliseconds reset_delay = Timings::T_SOFT_RESET;
};

// Loads a .th2cfgbin into a running device:
// STOP, FILL_CONFIG (u04 preserved), usage writes, SAVE_CONFIG, SOFT_RESET
// and a final u33 comparison. Transport failures propagate as
// ITransport::Error.
class ConfigWriter {
public:
  explicit ConfigWriter(ConfigWriteOptions opts = {},
                        IProgressListener *listener = nullptr) noexcept
      : m_opts{opts}, m_listener{listener} {}

  [[nodiscard]] std::error_code write(ITransport &transport,
                                      ConfigContainer const &cfg);

  // human readable context of the last failure
  std::string const &detail() const noexcept { return m_detail; }

private:
  std::error_code check_firmware(DeviceLink &link, ConfigContainer const &cfg,
                                 Th2Cfg::CrcUsage const &file_crc);
  void load_usages(DeviceLink &link, ConfigContainer const &cfg);
  void progress(std::size_t done, std::size_t total) {
    if (m_listener)
      m_listener->onProgress(done, total);
  }

  ConfigWriteOptions m_opts;
  IProgressListener *m_listener{};
  std::string m_detail;
};
