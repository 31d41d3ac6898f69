// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "cli_utils.hpp"

#include <DeviceLink.hpp>
#include <Errors.hpp>
#include <FormatParser.hpp>
#include <UsageTableWalker.hpp>
#include <utils.hpp>

#include <csignal>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <signal.h>

namespace {
volatile sig_atomic_t s_interrupted = 0;

void catch_signals(int sig) {
  s_interrupted = 1;
  signal(sig, catch_signals);
}

void register_signal_handler(int sig, sighandler_t handler) {
  if (::signal(sig, handler) == SIG_ERR) {
    std::cerr << fmt::format("Warning: can't register signal handler for {}!\n",
                             sig);
  }
}

std::uint8_t i2c_address(std::string const &str) {
  if (str == "0x66") {
    return 0x66;
  }
  if (str == "0x67") {
    return 0x67;
  }
  throw std::invalid_argument(
      fmt::format("Invalid I2C address '{}', expected 0x66 or 0x67", str));
}

// opens the transport for the lifetime of the returned guard
auto open_transport(argparse::ArgumentParser const &parser,
                    Console const &console) {
  const auto cfg = transport_config(parser);
  auto transport = ITransport::Create(cfg);
  console.debug("Opening {} transport", to_string(cfg.interface));
  transport->open();
  return transport;
}

} // namespace

void install_interrupt_handler() {
  register_signal_handler(SIGINT, catch_signals);
  register_signal_handler(SIGTERM, catch_signals);
}

bool interrupted() noexcept { return s_interrupted != 0; }

ExitCode exit_code(TransferResult const &res) noexcept {
  if (res.ok()) {
    return ExitCode::Success;
  }
  if (res.reason.category() != transfer_category()) {
    return ExitCode::Error;
  }
  switch (static_cast<TransferErrc>(res.reason.value())) {
  case TransferErrc::BootloaderEntryFailed:
    return ExitCode::BootloaderFailed;
  case TransferErrc::ChunkTransferFailed:
    return ExitCode::ChunkFailed;
  case TransferErrc::VerificationFailed:
    return ExitCode::VerifyFailed;
  case TransferErrc::Cancelled:
    return ExitCode::Interrupted;
  }
  return ExitCode::Error;
}

ExitCode exit_code(std::error_code const &config_ec) noexcept {
  if (!config_ec) {
    return ExitCode::Success;
  }
  if (config_ec.category() != config_category()) {
    return ExitCode::Error;
  }
  switch (static_cast<ConfigErrc>(config_ec.value())) {
  case ConfigErrc::MissingUsage:
    return ExitCode::InvalidFile;
  case ConfigErrc::FirmwareMismatch:
    return ExitCode::ConfigIncompatible;
  case ConfigErrc::VerifyMismatch:
    return ExitCode::ConfigMismatch;
  }
  return ExitCode::Error;
}

std::unique_ptr<AugmentedParser> get_parser() {
  std::unique_ptr<AugmentedParser> parser(new AugmentedParser{
      argparse::ArgumentParser{"axflash", AXFLASH_VER,
                               argparse::default_arguments::all},
      0});

  auto *program = &parser->parser;
  program->add_description(
      "Loads firmware (.axfw, .alc) and configuration (.th2cfgbin) files "
      "into aXiom touch controllers");

  program->add_argument("-i", "--interface")
      .help("comms interface to communicate with aXiom")
      .choices("usb", "spi", "i2c")
      .required();
  program->add_argument("--i2c-bus")
      .help("I2C bus number, as per /dev/i2c-<bus>")
      .default_value(TransportConfig{}.i2c_bus)
      .scan<'i', unsigned>();
  program->add_argument("--i2c-address")
      .help("I2C address, either 0x66 or 0x67")
      .choices("0x66", "0x67")
      .default_value(std::string{"0x67"});
  program->add_argument("--spi-bus")
      .help("SPI bus number, as per /dev/spidev<bus>.<device>")
      .default_value(TransportConfig{}.spi_bus)
      .scan<'i', unsigned>();
  program->add_argument("--spi-device")
      .help("SPI chip select, as per /dev/spidev<bus>.<device>")
      .default_value(TransportConfig{}.spi_device)
      .scan<'i', unsigned>();
  program->add_argument("--hidraw")
      .help("hidraw node of the USB bridge, found automatically if missing");

  program->add_argument("-f", "--file")
      .help("firmware (.axfw/.alc) or config (.th2cfgbin) file");

  auto &exec_group = program->add_mutually_exclusive_group();
  exec_group.add_argument("--info")
      .help("print information on the file if `--file` is specified or "
            "otherwise on the device, then exits")
      .flag();
  exec_group.add_argument("--dump-usage")
      .help("dump a usage (hex number, e.g. 36) from the config file if "
            "`--file` is specified or otherwise from the device");

  program->add_argument("-o", "--output")
      .help("write the dumped usage content as binary into this file");

  program->add_argument("--force")
      .help("skip every compatibility check before loading firmware")
      .flag();
  program->add_argument("--skip-if-current")
      .help("don't load firmware that is already running on the device")
      .flag();
  program->add_argument("--allow-variant-change")
      .help("allow loading a firmware variant different from the running one")
      .flag();
  program->add_argument("-c", "--load-u04")
      .help("load u04 (customer data) from the config file into the device")
      .flag();

  program->add_argument("--retries")
      .help("retries per chunk before the transfer is aborted")
      .default_value(TransferOptions{}.chunk_retries)
      .scan<'i', unsigned>();
  program->add_argument("--ack-timeout")
      .help("chunk acknowledgment timeout in milliseconds")
      .default_value(static_cast<unsigned>(TransferOptions{}.ack_timeout.count()))
      .scan<'i', unsigned>();

  program->add_argument("-q", "--quiet")
      .help("quiet mode, only errors are printed")
      .flag();
  program->add_argument("-V", "--verbose")
      .action([verbose = std::addressof(parser->verbosity)](const auto &) {
        *verbose += 1;
      })
      .append()
      .nargs(0)
      .help("print more information about the operation")
      .default_value(false)
      .implicit_value(true);
  return parser;
}

std::optional<FileType> file_type(fs::path const &p) {
  const auto ext = p.extension().string();
  if (ext == ".axfw") {
    return FileType::Firmware;
  }
  if (ext == ".alc") {
    return FileType::RawFirmware;
  }
  if (ext == ".th2cfgbin") {
    return FileType::Config;
  }
  return std::nullopt;
}

TransportConfig transport_config(argparse::ArgumentParser const &parser) {
  TransportConfig cfg{};
  const auto iface = parser.get<std::string>("--interface");
  if (iface == "spi") {
    cfg.interface = Interface::SPI;
  } else if (iface == "i2c") {
    cfg.interface = Interface::I2C;
  } else {
    cfg.interface = Interface::USB;
  }
  cfg.i2c_bus = parser.get<unsigned>("--i2c-bus");
  cfg.i2c_address = i2c_address(parser.get<std::string>("--i2c-address"));
  cfg.spi_bus = parser.get<unsigned>("--spi-bus");
  cfg.spi_device = parser.get<unsigned>("--spi-device");
  if (auto hid = parser.present("--hidraw")) {
    cfg.hid_path = *hid;
  }
  return cfg;
}

TransferOptions transfer_options(argparse::ArgumentParser const &parser) {
  TransferOptions opts{};
  opts.chunk_retries = parser.get<unsigned>("--retries");
  opts.ack_timeout =
      std::chrono::milliseconds{parser.get<unsigned>("--ack-timeout")};
  return opts;
}

ValidationOptions validation_options(argparse::ArgumentParser const &parser) {
  ValidationOptions opts{};
  opts.force = parser["--force"] == true;
  opts.skip_if_current = parser["--skip-if-current"] == true;
  opts.allow_variant_change = parser["--allow-variant-change"] == true;
  return opts;
}

void print_progress(std::size_t done, std::size_t total) {
  constexpr std::size_t width = 40;
  const auto filled = total ? done * width / total : width;
  const auto percent = total ? done * 100 / total : 100;
  fmt::print("\r[{:#<{}}{: <{}}] {:3}% ({}/{} bytes)", "", filled, "",
             width - filled, percent, done, total);
  std::fflush(stdout);
}

void ConsoleTransferListener::check_interrupt() {
  if (m_engine && interrupted()) {
    m_engine->request_cancel();
  }
}

void ConsoleTransferListener::onProgress(std::size_t done, std::size_t total) {
  check_interrupt();
  if (m_console.enabled(Verbosity::INFO)) {
    print_progress(done, total);
    m_bar_open = done < total;
    if (!m_bar_open) {
      fmt::print("\n");
    }
  }
}

void ConsoleTransferListener::onStateChange(TransferState state) {
  check_interrupt();
  if (m_bar_open) {
    fmt::print("\n");
    m_bar_open = false;
  }
  m_console.debug("Transfer state: {}", to_string(state));
}

void ConsoleTransferListener::onRetry(TransferState phase, std::size_t index,
                                      unsigned attempt,
                                      std::string_view reason) {
  check_interrupt();
  if (phase == TransferState::Handshaking) {
    m_console.debug("Bootloader entry attempt {} failed: {}", attempt, reason);
  } else {
    m_console.debug("Chunk #{} attempt {} failed: {}", index, attempt, reason);
  }
}

void ConsoleTransferListener::onNotice(std::string_view message) {
  m_console.info("{}", message);
}

void ConsoleProgress::onProgress(std::size_t done, std::size_t total) {
  if (interrupted()) {
    throw ITransport::Interrupted{};
  }
  if (m_console.enabled(Verbosity::INFO)) {
    print_progress(done, total);
    if (done >= total) {
      fmt::print("\n");
    }
  }
}

void print_device_info(Console const &console, ITransport &transport) {
  const auto id = transport.query_identity();
  fmt::print("Device ID         : 0x{:04x} ({})\n", id.device_id,
             id.deviceIdStr());
  fmt::print("Mode              : {}\n",
             id.bootloader_mode ? "bootloader" : "runtime");
  if (id.bootloader_mode) {
    return;
  }
  fmt::print("Firmware          : {} {} {}\n",
             version_str(id.firmware_version, id.firmware_patch),
             to_string(id.variant), to_string(id.status));
  fmt::print("Silicon           : 0x{:04x} rev {}\n", id.silicon_version,
             static_cast<char>('A' + id.silicon_revision));
  if (transport.supports(ITransport::RUNTIME_CRC)) {
    fmt::print("Runtime CRC       : 0x{:08x}\n",
               DeviceLink(transport).runtime_crc());
  } else {
    console.debug("Transport can't report the runtime CRC");
  }
}

void print_firmware_info(Console const &console, fs::path const &p,
                         FirmwareContainer const &fw) {
  const auto &md = fw.metadata;
  fmt::print("Info from firmware file : {}\n", p.string());
  fmt::print("  Format version : 0x{:04x}\n", fw.format_version);
  fmt::print("  Device ID      : 0x{:04x} ({})\n", md.device_id,
             device_id_str(md.device_id));
  fmt::print("  Firmware       : {} {} {}\n",
             version_str(md.version, md.patch), to_string(md.variant),
             to_string(md.status));
  fmt::print("  Silicon        : 0x{:04x} rev {}\n", md.silicon_version,
             static_cast<char>('A' + md.silicon_revision));
  fmt::print("  Firmware CRC   : 0x{:08x}\n", md.firmware_crc);
  fmt::print("  Chunks         : {} ({} bytes)\n", fw.payload.size(),
             payload_size(fw.payload));
  console.debug("  File CRC       : 0x{:08x}", fw.declared_crc);
  console.debug("  Payload CRC    : 0x{:08x}", fw.payload_crc);
}

void print_raw_firmware_info(Console const &, fs::path const &p,
                             RawFirmwareContainer const &fw) {
  fmt::print("Info from raw firmware file : {}\n", p.string());
  fmt::print("  Chunks : {} ({} bytes)\n", fw.payload.size(),
             payload_size(fw.payload));
}

void print_config_info(Console const &console, fs::path const &p,
                       ConfigContainer const &cfg) {
  const UsageTableWalker walker(cfg);
  fmt::print("Info from config file : {}\n", p.string());
  fmt::print("  Format version : 0x{:04x}\n", cfg.format_version);
  fmt::print("  Revision       : {}.{}.{}\n", cfg.revision.major,
             cfg.revision.minor, cfg.revision.patch);
  fmt::print("  TCP version    : {}\n", cfg.tcp_version);
  fmt::print("  Usages         : {} ({} bytes)\n", walker.size(),
             walker.content_size());
  if (const auto u33 = walker.find(Th2Cfg::crc_usage)) {
    const auto crc = Th2Cfg::decode_crc_usage(u33->content);
    fmt::print("  Runtime CRC    : 0x{:08x}\n", crc.runtime_crc);
  }
  if (console.enabled(Verbosity::DEBUG)) {
    for (auto const &rec : walker) {
      fmt::print("    u{:02x} rev {:2} {:5} bytes{}\n", rec.usage, rec.revision,
                 rec.content.size(),
                 Th2Cfg::is_read_only(rec.usage) ? " (read only)" : "");
    }
  }
}

ExitCode execInfo(argparse::ArgumentParser const &parser,
                  Console const &console) {
  if (auto file = parser.present("--file")) {
    const fs::path p{*file};
    const auto type = file_type(p);
    if (!type) {
      console.error("Unsupported file type '{}'", p.extension().string());
      return ExitCode::UnsupportedFile;
    }
    const auto data = load_file(p);
    switch (*type) {
    case FileType::Firmware:
      print_firmware_info(console, p, Axfw::parse_firmware(data));
      break;
    case FileType::RawFirmware:
      print_raw_firmware_info(console, p, Axfw::parse_raw_firmware(data));
      break;
    case FileType::Config:
      print_config_info(console, p, Th2Cfg::parse_config(data));
      break;
    }
    return ExitCode::Success;
  }
  auto transport = open_transport(parser, console);
  print_device_info(console, *transport);
  return ExitCode::Success;
}

ExitCode execFirmware(argparse::ArgumentParser const &parser,
                      Console const &console, fs::path const &file,
                      FileType type) {
  // the file is fully parsed before the device is touched
  const auto data = load_file(file);
  ChunkSequence chunks;
  std::optional<FirmwareContainer> fw;
  std::optional<RawFirmwareContainer> raw;
  if (type == FileType::Firmware) {
    fw = Axfw::parse_firmware(data);
    console.info("File  : {} {} {}", device_id_str(fw->metadata.device_id),
                 version_str(fw->metadata.version, fw->metadata.patch),
                 to_string(fw->metadata.variant));
  } else {
    raw = Axfw::parse_raw_firmware(data);
  }

  auto transport = open_transport(parser, console);
  const auto device = transport->query_identity();
  console.info("Device: {}", device.short_info());

  const CompatibilityValidator validator(validation_options(parser));
  std::optional<std::uint32_t> expected_crc;
  Verdict verdict{};
  if (fw) {
    verdict = validator.validate(*fw, device);
    expected_crc = fw->metadata.firmware_crc;
    chunks = std::move(fw->payload);
  } else {
    verdict = validator.validate(*raw, device);
    chunks = std::move(raw->payload);
  }

  switch (verdict.status) {
  case Compatibility::Rejected:
    console.error("Firmware file is not compatible with the device: {}",
                  verdict.reason.message());
    return ExitCode::Incompatible;
  case Compatibility::AlreadyUpToDate:
    console.info("Firmware is already on the device, nothing to do");
    return ExitCode::AlreadyCurrent;
  case Compatibility::DeviceIdOnly:
  case Compatibility::Bypassed:
    console.info("Warning: {}", verdict.describe());
    break;
  case Compatibility::Verified:
    console.debug("Firmware file is {}", verdict.describe());
    break;
  }

  ConsoleTransferListener listener(console);
  ChunkTransferEngine engine(transfer_options(parser), &listener);
  listener.attach(&engine);
  const auto res = engine.transfer(*transport, chunks, expected_crc);
  if (!res.ok()) {
    console.error("{} after {} of {} chunks: {}", res.reason.message(),
                  res.chunks_sent, chunks.size(), res.detail);
    return exit_code(res);
  }
  console.info("Firmware loaded, {} chunks ({} bytes)", res.chunks_sent,
               res.bytes_sent);
  return ExitCode::Success;
}

ExitCode execConfig(argparse::ArgumentParser const &parser,
                    Console const &console, fs::path const &file) {
  const auto cfg = Th2Cfg::parse_config(load_file(file));
  auto transport = open_transport(parser, console);
  console.info("Device: {}", transport->query_identity().short_info());

  ConsoleProgress progress(console);
  ConfigWriteOptions opts{};
  opts.overwrite_u04 = parser["--load-u04"] == true;
  ConfigWriter writer(opts, &progress);
  if (const auto ec = writer.write(*transport, cfg); ec) {
    console.error("{}: {}", ec.message(), writer.detail());
    return exit_code(ec);
  }
  console.info("Config loaded");
  return ExitCode::Success;
}

ExitCode execDumpUsage(argparse::ArgumentParser const &parser,
                       Console const &console) {
  const auto arg = parser.get<std::string>("--dump-usage");
  const auto usage = parse_usage(arg);
  if (!usage) {
    console.error("Invalid usage number '{}'", arg);
    return ExitCode::Usage;
  }

  byte_vector content;
  if (auto file = parser.present("--file")) {
    const fs::path p{*file};
    if (file_type(p) != FileType::Config) {
      console.error("Usages can only be dumped from a .th2cfgbin file");
      return ExitCode::UnsupportedFile;
    }
    const auto cfg = Th2Cfg::parse_config(load_file(p));
    const auto rec = UsageTableWalker(cfg).find(*usage);
    if (!rec) {
      console.error("No u{:02x} in {}", *usage, p.string());
      return ExitCode::InvalidFile;
    }
    content = rec->content;
  } else {
    auto transport = open_transport(parser, console);
    content = DeviceLink(*transport).read_usage(*usage);
  }

  if (auto out = parser.present("--output")) {
    std::ofstream ofs(*out, std::ios::binary);
    if (!ofs) {
      throw fs::filesystem_error("Cannot create output file", fs::path(*out),
                                 std::make_error_code(std::errc::io_error));
    }
    BinaryDumper dumper(ofs);
    dumper.dump_start();
    dumper.dump_usage(*usage, content);
    dumper.dump_end();
    console.info("u{:02x} written to {} ({} bytes)", *usage, *out,
                 content.size());
  } else {
    OstreamDumper dumper(std::cout);
    dumper.dump_start();
    dumper.dump_usage(*usage, content);
    dumper.dump_end();
  }
  return ExitCode::Success;
}
