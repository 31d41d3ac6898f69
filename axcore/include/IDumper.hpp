// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <cstdint>

struct IDumper {
  virtual void dump_start() = 0;
  virtual void dump_end() = 0;
  virtual void dump_usage(std::uint8_t usage, byte_span content) = 0;

protected:
  ~IDumper() = default;
};
