// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <ConfigWriter.hpp>

#include <Errors.hpp>
#include <UsageTableWalker.hpp>

#include <fmt/format.h>

using Protocol::SystemCommand;

std::error_code ConfigWriter::write(ITransport &transport,
                                    ConfigContainer const &cfg) {
  m_detail.clear();
  if (!transport.supports(ITransport::USAGE_ACCESS)) {
    m_detail = "transport has no usage access";
    return std::make_error_code(std::errc::operation_not_supported);
  }

  const UsageTableWalker walker(cfg);
  const auto file_u33 = walker.find(Th2Cfg::crc_usage);
  if (!file_u33) {
    m_detail = fmt::format("no u{:02x} in the config file", Th2Cfg::crc_usage);
    return make_error_code(ConfigErrc::MissingUsage);
  }
  const auto file_crc = Th2Cfg::decode_crc_usage(file_u33->content);

  DeviceLink link(transport);
  if (auto ec = check_firmware(link, cfg, file_crc); ec) {
    return ec;
  }

  link.send_command(SystemCommand::STOP);

  // FILL_CONFIG zeroes every usage, u04 included
  const auto u04 = link.read_usage(Th2Cfg::customer_usage);
  link.send_command(SystemCommand::FILL_CONFIG);
  link.write_usage(Th2Cfg::customer_usage, u04);

  load_usages(link, cfg);

  link.send_command(SystemCommand::SAVE_CONFIG);
  transport.delay(m_opts.save_delay);
  link.send_command(SystemCommand::SOFT_RESET);
  transport.delay(m_opts.reset_delay);

  const auto device_u33 = link.read_usage(Th2Cfg::crc_usage);
  const auto device_crc = Th2Cfg::decode_crc_usage(device_u33);
  if (device_crc.runtime_crc != file_crc.runtime_crc ||
      device_crc.config_crc != file_crc.config_crc) {
    m_detail = fmt::format(
        "device config CRC 0x{:08x}, file 0x{:08x}", device_crc.config_crc,
        file_crc.config_crc);
    return make_error_code(ConfigErrc::VerifyMismatch);
  }
  return {};
}

std::error_code ConfigWriter::check_firmware(DeviceLink &link,
                                             ConfigContainer const &cfg,
                                             Th2Cfg::CrcUsage const &file_crc) {
  const auto device_crc =
      Th2Cfg::decode_crc_usage(link.read_usage(Th2Cfg::crc_usage));
  if (device_crc.runtime_crc == file_crc.runtime_crc) {
    return {};
  }
  const auto device = link.transport().query_identity();
  m_detail = fmt::format(
      "device runtime CRC 0x{:08x} ({}), config saved from 0x{:08x} "
      "(rev {}.{}.{})",
      device_crc.runtime_crc, device.short_info(), file_crc.runtime_crc,
      cfg.revision.major, cfg.revision.minor, cfg.revision.patch);
  return make_error_code(ConfigErrc::FirmwareMismatch);
}

void ConfigWriter::load_usages(DeviceLink &link, ConfigContainer const &cfg) {
  const UsageTableWalker walker(cfg);
  const auto total = walker.content_size();
  std::size_t done = 0;
  progress(done, total);
  for (auto const &rec : walker) {
    const bool skip =
        Th2Cfg::is_read_only(rec.usage) ||
        (rec.usage == Th2Cfg::customer_usage && !m_opts.overwrite_u04);
    if (!skip) {
      link.write_usage(rec.usage, rec.content);
    }
    done += rec.content.size();
    progress(done, total);
  }
}
