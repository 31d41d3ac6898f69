// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ChunkTransferEngine.hpp>
#include <Compatibility.hpp>
#include <ConfigWriter.hpp>
#include <ITransport.hpp>

#include <argparse/argparse.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <concepts>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace fs = std::filesystem;

enum class Verbosity { ERROR = 0, INFO = 1, DEBUG = 2, MAX = DEBUG };

template <std::integral T> Verbosity verbosity(T val) {
  return static_cast<Verbosity>(
      std::clamp(val, T{0}, static_cast<T>(Verbosity::MAX)));
}

enum class ExitCode : int {
  Success = 0,
  Error = 1,
  Usage = 2,
  UnsupportedFile = 3,
  BootloaderFailed = 4,
  InvalidFile = 5,
  Incompatible = 6,
  AlreadyCurrent = 7,
  ChunkFailed = 8,
  VerifyFailed = 9,
  ConfigIncompatible = 10,
  ConfigMismatch = 11,
  Interrupted = 130,
};

constexpr int to_int(ExitCode c) noexcept { return static_cast<int>(c); }

ExitCode exit_code(TransferResult const &res) noexcept;
ExitCode exit_code(std::error_code const &config_ec) noexcept;

// Verbosity gated output, errors always go to stderr
class Console {
public:
  Console(Verbosity level, bool quiet) noexcept
      : m_level{level}, m_quiet{quiet} {}

  template <typename... Args>
  void error(fmt::format_string<Args...> f, Args &&...args) const {
    fmt::print(stderr, "ERROR: {}\n",
               fmt::format(f, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void info(fmt::format_string<Args...> f, Args &&...args) const {
    if (enabled(Verbosity::INFO)) {
      fmt::print("{}\n", fmt::format(f, std::forward<Args>(args)...));
    }
  }
  template <typename... Args>
  void debug(fmt::format_string<Args...> f, Args &&...args) const {
    if (enabled(Verbosity::DEBUG)) {
      fmt::print("{}\n", fmt::format(f, std::forward<Args>(args)...));
    }
  }

  bool enabled(Verbosity v) const noexcept { return !m_quiet && m_level >= v; }

private:
  Verbosity m_level;
  bool m_quiet;
};

struct AugmentedParser {
  argparse::ArgumentParser parser;
  int verbosity = 0;
};

std::unique_ptr<AugmentedParser> get_parser();

enum class FileType { Firmware, RawFirmware, Config };

std::optional<FileType> file_type(fs::path const &p);

TransportConfig transport_config(argparse::ArgumentParser const &parser);
TransferOptions transfer_options(argparse::ArgumentParser const &parser);
ValidationOptions validation_options(argparse::ArgumentParser const &parser);

// SIGINT/SIGTERM only raise a flag, the transfer stops at the next chunk
void install_interrupt_handler();
bool interrupted() noexcept;

class ConsoleTransferListener : public ITransferListener {
public:
  explicit ConsoleTransferListener(Console const &console) noexcept
      : m_console{console} {}

  void attach(ChunkTransferEngine *engine) noexcept { m_engine = engine; }

  void onProgress(std::size_t done, std::size_t total) override;
  void onStateChange(TransferState state) override;
  void onRetry(TransferState phase, std::size_t index, unsigned attempt,
               std::string_view reason) override;
  void onNotice(std::string_view message) override;

private:
  void check_interrupt();

  Console const &m_console;
  ChunkTransferEngine *m_engine{};
  bool m_bar_open{};
};

// progress of a config load, throws ITransport::Interrupted on SIGINT
class ConsoleProgress : public IProgressListener {
public:
  explicit ConsoleProgress(Console const &console) noexcept
      : m_console{console} {}

  void onProgress(std::size_t done, std::size_t total) override;

private:
  Console const &m_console;
};

void print_progress(std::size_t done, std::size_t total);

void print_device_info(Console const &console, ITransport &transport);
void print_firmware_info(Console const &console, fs::path const &p,
                         FirmwareContainer const &fw);
void print_raw_firmware_info(Console const &console, fs::path const &p,
                             RawFirmwareContainer const &fw);
void print_config_info(Console const &console, fs::path const &p,
                       ConfigContainer const &cfg);

ExitCode execInfo(argparse::ArgumentParser const &parser,
                  Console const &console);
ExitCode execFirmware(argparse::ArgumentParser const &parser,
                      Console const &console, fs::path const &file,
                      FileType type);
ExitCode execConfig(argparse::ArgumentParser const &parser,
                    Console const &console, fs::path const &file);
ExitCode execDumpUsage(argparse::ArgumentParser const &parser,
                       Console const &console);
