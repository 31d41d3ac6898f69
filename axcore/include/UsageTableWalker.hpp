// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ConfigFile.hpp>
#include <fwd.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>

#include <range/v3/view/filter.hpp>
#include <range/v3/view/subrange.hpp>

// Read-only view over the usage records of a decoded config container.
// Iteration always restarts from the first record. The walker and the views
// it hands out refer to the container's records, the container must outlive
// them, the walker need not.
class UsageTableWalker {
public:
  explicit UsageTableWalker(ConfigContainer const &cfg) noexcept
      : m_records{cfg.usages} {}

  auto begin() const noexcept { return m_records.begin(); }
  auto end() const noexcept { return m_records.end(); }
  std::size_t size() const noexcept { return m_records.size(); }

  auto iter() const noexcept {
    return rg::make_subrange(m_records.begin(), m_records.end());
  }

  template <std::predicate<UsageRecord const &> Pred>
  auto select(Pred pred) const {
    return iter() | rgv::filter(std::move(pred));
  }

  // first record with the given usage number
  std::optional<UsageRecord> find(std::uint8_t usage) const {
    const auto it = rg::find_if(
        m_records, [usage](UsageRecord const &r) { return r.usage == usage; });
    if (it == m_records.end()) {
      return std::nullopt;
    }
    return *it;
  }

  std::size_t content_size() const {
    return rg::accumulate(m_records, std::size_t{0}, std::plus<>{},
                          [](UsageRecord const &r) { return r.content.size(); });
  }

private:
  std::span<const UsageRecord> m_records;
};
