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

#include <array>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace usbwatch::linux {

// Numeric (busnum, devnum) of a USB device as exposed by sysfs.
struct BusDev {
  std::uint32_t bus = 0;
  std::uint32_t dev = 0;

  auto operator<=>(const BusDev&) const = default;
};

using TtyMap = std::map<BusDev, std::string>;

struct TtyLookupPaths {
  std::filesystem::path dev_dir = "/dev";
  std::filesystem::path by_id_dir = "/dev/serial/by-id";
  std::filesystem::path sys_class_tty = "/sys/class/tty";
};

inline constexpr std::array<std::string_view, 2> kTtyFamilies = {"ttyUSB", "ttyACM"};
inline constexpr int kTtyProbeCount = 16;
inline constexpr int kSysfsWalkDepth = 5;

// Follows <sys_class_tty>/<name>/device and walks up to kSysfsWalkDepth
// parents looking for busnum + devnum.
std::optional<BusDev> tty_bus_dev(std::string_view tty_name, const TtyLookupPaths& paths = {});

// by-id links first, then direct probing of ttyUSB0..15 / ttyACM0..15.
// The first path found for a key wins.
TtyMap resolve_tty_paths(const TtyLookupPaths& paths = {});

} // namespace usbwatch::linux
