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

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace usbwatch::monitor {

inline constexpr std::string_view kUnknownName = "Unknown";
inline constexpr std::string_view kDefaultLsusb = "lsusb";

// Case-insensitive substring test against "dfu", "download", "boot".
bool looks_like_bootloader(std::string_view name) noexcept;

std::string raw_device_path(std::string_view bus, std::string_view address);

// "Bus 001 Device 004: ID 0483:df11 STM Device in DFU Mode"
std::optional<Device> parse_lsusb_line(std::string_view line);

// Malformed lines are skipped; they never stop the remaining lines.
std::vector<Device> parse_lsusb_output(std::string_view text);

inline constexpr std::size_t kMaxLsusbOutput = 1u << 20;

// Runs the tool and parses its stdout. Any spawn failure yields an empty list.
// Output past max_bytes is cut back to the last complete line.
std::vector<Device> enumerate_lsusb(const std::string& command = std::string(kDefaultLsusb),
                                    std::size_t max_bytes = kMaxLsusbOutput);

} // namespace usbwatch::monitor
