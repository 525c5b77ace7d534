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

#include "monitor/session.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace usbwatch::monitor {

namespace {

std::set<TransientKey> keys_of(const std::vector<Device>& devs) {
  std::set<TransientKey> out;
  for (const auto& d : devs) out.insert(d.key());
  return out;
}

std::size_t count_missing(const std::set<TransientKey>& from, const std::set<TransientKey>& in) {
  return static_cast<std::size_t>(
      std::count_if(from.begin(), from.end(), [&](const TransientKey& k) { return !in.contains(k); }));
}

} // namespace

double Statistics::refresh_rate(std::chrono::steady_clock::time_point now) const {
  const double secs = std::chrono::duration<double>(uptime(now)).count();
  return secs > 0.0 ? static_cast<double>(refresh_count) / secs : 0.0;
}

std::string format_uptime(std::chrono::steady_clock::duration d) {
  auto s = std::chrono::duration_cast<std::chrono::seconds>(d).count();
  if (s < 0) s = 0;
  const auto h = s / 3600;
  const auto m = (s % 3600) / 60;
  s %= 60;
  if (h > 0) return fmt::format("{:02}:{:02}:{:02}", h, m, s);
  return fmt::format("{:02}:{:02}", m, s);
}

void Session::apply(Snapshot snap) {
  if (snap.sequence != 0 && last_sequence_ != 0 && snap.sequence > last_sequence_ + 1)
    spdlog::debug("Skipped {} stale snapshot(s)", snap.sequence - last_sequence_ - 1);
  if (snap.sequence != 0) last_sequence_ = snap.sequence;

  // The first snapshot populates the list; it is not a change.
  if (stats_.refresh_count > 0) {
    const auto old_keys = keys_of(devices_);
    const auto new_keys = keys_of(snap.devices);
    const auto connects = count_missing(new_keys, old_keys);
    const auto disconnects = count_missing(old_keys, new_keys);
    stats_.connects += connects;
    stats_.disconnects += disconnects;
    if (connects || disconnects)
      spdlog::debug("Refresh {}: +{} / -{}", stats_.refresh_count + 1, connects, disconnects);
  }

  devices_ = std::move(snap.devices);
  stats_.refresh_count += 1;
  stats_.last_latency = snap.elapsed;
  stats_.peak_devices = std::max(stats_.peak_devices, devices_.size());

  for (const auto& d : devices_) {
    stats_.ever_seen.insert(d.model());
    if (d.is_bootloader_mode) stats_.bootloader_ever_seen.insert(d.model());
  }

  restore_selection_();
}

void Session::restore_selection_() {
  if (devices_.empty()) {
    selected_index_.reset();
    selected_key_.reset();
    return;
  }

  if (!selected_key_) {
    select_(0);
    return;
  }

  const auto it = std::find_if(devices_.begin(), devices_.end(),
                               [&](const Device& d) { return d.key() == *selected_key_; });
  if (it != devices_.end()) {
    select_(static_cast<std::size_t>(it - devices_.begin()));
    return;
  }

  // Selected device is gone: hold the row position, clamped to the list.
  select_(std::min(selected_index_.value_or(0), devices_.size() - 1));
}

void Session::select_(std::size_t idx) {
  selected_index_ = idx;
  selected_key_ = devices_[idx].key();
}

void Session::select_next() {
  if (devices_.empty()) return;
  if (!selected_index_) { select_(0); return; }
  select_(*selected_index_ + 1 >= devices_.size() ? 0 : *selected_index_ + 1);
}

void Session::select_previous() {
  if (devices_.empty()) return;
  if (!selected_index_) { select_(0); return; }
  select_(*selected_index_ == 0 ? devices_.size() - 1 : *selected_index_ - 1);
}

const Device* Session::selected_device() const noexcept {
  if (!selected_index_ || *selected_index_ >= devices_.size()) return nullptr;
  return &devices_[*selected_index_];
}

std::size_t Session::bootloader_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(devices_.begin(), devices_.end(), [](const Device& d) { return d.is_bootloader_mode; }));
}

} // namespace usbwatch::monitor
