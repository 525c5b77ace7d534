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

#include "platform/linux/sysfs_tty.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace usbwatch::monitor {

// (bus, address) as printed by the enumeration tool. Valid only while the
// device stays plugged in; a replug gets a new address.
struct TransientKey {
  std::string bus;
  std::string address;

  auto operator<=>(const TransientKey&) const = default;

  std::string str() const { return bus + ":" + address; }
};

// (vendor, product). Survives replugs, shared by every unit of a model.
struct ModelId {
  std::string vendor;
  std::string product;

  auto operator<=>(const ModelId&) const = default;

  std::string str() const { return vendor + ":" + product; }
};

using linux::BusDev;

struct Device {
  std::string bus;
  std::string address;
  std::string vendor_id;
  std::string product_id;
  std::string display_name;
  bool is_bootloader_mode = false;
  std::string raw_device_path;
  std::optional<std::string> terminal_path;

  bool operator==(const Device&) const = default;

  TransientKey key() const { return {bus, address}; }
  ModelId model() const { return {vendor_id, product_id}; }

  // Unparsable bus/address become 0 and match nothing.
  BusDev bus_dev() const;

  const std::string& display_path() const { return terminal_path ? *terminal_path : raw_device_path; }
};

struct Snapshot {
  std::vector<Device> devices;
  std::chrono::steady_clock::duration elapsed{};
  std::uint64_t sequence = 0;
};

} // namespace usbwatch::monitor
