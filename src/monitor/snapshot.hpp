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
#include "platform/linux/sysfs_tty.hpp"

#include <functional>
#include <string>
#include <vector>

namespace usbwatch::monitor {

struct SnapshotSources {
  std::function<std::vector<Device>()> enumerate;
  std::function<linux::TtyMap()> resolve_ttys;
};

SnapshotSources system_sources(std::string lsusb_command, linux::TtyLookupPaths paths = {});

// Attaches the terminal path of every device found in the map.
void attach_terminal_paths(std::vector<Device>& devices, const linux::TtyMap& ttys);

// Times enumerate + resolve together; sequence is left at 0.
Snapshot build_snapshot(const SnapshotSources& src);

} // namespace usbwatch::monitor
