// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos
// <attila.gombos@effective-range.com> SPDX-License-Identifier: MIT

#include <iostream>
#include <ostream>

#include "cli_utils.hpp"

#include <Errors.hpp>
#include <ITransport.hpp>

#include <argparse/argparse.hpp>

int main(int argc, char *argv[]) try {
  auto pparser = get_parser();
  auto &aug_parser = *pparser;
  auto &parser = aug_parser.parser;
  try {
    parser.parse_args(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << e.what() << '\n' << parser;
    return to_int(ExitCode::Usage);
  }
  const Console console(verbosity(aug_parser.verbosity),
                        parser["--quiet"] == true);
  install_interrupt_handler();

  if (parser["--info"] == true) {
    return to_int(execInfo(parser, console));
  }
  if (parser.is_used("--dump-usage")) {
    return to_int(execDumpUsage(parser, console));
  }

  const auto file = parser.present("--file");
  if (!file) {
    std::cerr << "One of --file, --info or --dump-usage is required\n"
              << parser;
    return to_int(ExitCode::Usage);
  }
  const fs::path path{*file};
  const auto type = file_type(path);
  if (!type) {
    console.error("Unsupported file type '{}', expected .axfw, .alc or "
                  ".th2cfgbin",
                  path.extension().string());
    return to_int(ExitCode::UnsupportedFile);
  }
  if (*type == FileType::Config) {
    return to_int(execConfig(parser, console, path));
  }
  return to_int(execFirmware(parser, console, path, *type));
} catch (ITransport::Interrupted const &e) {
  std::cerr << e.what() << '\n';
  return to_int(ExitCode::Interrupted);
} catch (FormatError const &e) {
  std::cerr << "ERROR: invalid file: " << e.what() << '\n';
  return to_int(ExitCode::InvalidFile);
} catch (const std::exception &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return to_int(ExitCode::Error);
} catch (...) {
  std::cerr << "ERROR: Unknown exception occurred...\n";
  return to_int(ExitCode::Error);
}
