// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>

namespace Timings {
using namespace std::chrono_literals;
constexpr auto T_BL_ENTRY = 100ms;
constexpr auto T_CHUNK_ACK = 1000ms;
constexpr auto T_RETRY_BACKOFF = 50ms;
constexpr auto T_RESET = 2000ms;
constexpr auto T_RESPONSE = 500ms;
constexpr auto T_SAVE_CONFIG = 2000ms;
constexpr auto T_SOFT_RESET = 1000ms;
} // namespace Timings
