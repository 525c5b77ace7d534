/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "monitor/device.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace usbwatch::monitor {

struct Statistics {
  std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

  std::uint64_t refresh_count = 0;
  std::set<ModelId> ever_seen;
  std::set<ModelId> bootloader_ever_seen;
  std::size_t peak_devices = 0;
  std::chrono::steady_clock::duration last_latency{};
  std::uint64_t connects = 0;
  std::uint64_t disconnects = 0;

  std::chrono::steady_clock::duration uptime(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const {
    return now - start_time;
  }

  // Refreshes per second of uptime; 0 before any time has passed.
  double refresh_rate(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const;
};

// "MM:SS", or "HH:MM:SS" once an hour has passed.
std::string format_uptime(std::chrono::steady_clock::duration d);

// The only mutable long-lived state. apply() must see every delivered
// snapshot exactly once, in delivery order.
class Session {
public:
  Session() = default;

  void apply(Snapshot snap);

  void select_next();
  void select_previous();

  const std::vector<Device>& devices() const noexcept { return devices_; }
  const Statistics& stats() const noexcept { return stats_; }

  std::optional<std::size_t> selected_index() const noexcept { return selected_index_; }
  const std::optional<TransientKey>& selected_key() const noexcept { return selected_key_; }
  const Device* selected_device() const noexcept;

  std::size_t bootloader_count() const noexcept;
  std::uint64_t last_sequence() const noexcept { return last_sequence_; }

private:
  void select_(std::size_t idx);
  void restore_selection_();

  std::vector<Device> devices_;
  Statistics stats_;

  std::optional<std::size_t> selected_index_;
  std::optional<TransientKey> selected_key_;

  std::uint64_t last_sequence_ = 0;
};

} // namespace usbwatch::monitor
