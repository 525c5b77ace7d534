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

#include "core/status.hpp"

#include <chrono>
#include <string>

namespace usbwatch::app {

struct Options {
    bool help = false;
    bool version = false;
    bool verbose = false;

    bool list = false;
    bool list_only = false; // bare display paths, one per line

    bool no_color = false;

    std::chrono::milliseconds interval{200};
    std::string lsusb = "lsusb";
};

inline constexpr long kMinIntervalMs = 50;
inline constexpr long kMaxIntervalMs = 5000;

core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace usbwatch::app
