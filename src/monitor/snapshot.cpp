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

#include "monitor/snapshot.hpp"

#include "monitor/lsusb.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

namespace usbwatch::monitor {

SnapshotSources system_sources(std::string lsusb_command, linux::TtyLookupPaths paths) {
  SnapshotSources s;
  s.enumerate = [cmd = std::move(lsusb_command)] { return enumerate_lsusb(cmd); };
  s.resolve_ttys = [p = std::move(paths)] { return linux::resolve_tty_paths(p); };
  return s;
}

void attach_terminal_paths(std::vector<Device>& devices, const linux::TtyMap& ttys) {
  for (auto& d : devices) {
    const auto it = ttys.find(d.bus_dev());
    if (it != ttys.end()) d.terminal_path = it->second;
    else d.terminal_path.reset();
  }
}

Snapshot build_snapshot(const SnapshotSources& src) {
  const auto t0 = std::chrono::steady_clock::now();

  Snapshot snap;
  if (src.enumerate) snap.devices = src.enumerate();
  linux::TtyMap ttys;
  if (src.resolve_ttys) ttys = src.resolve_ttys();
  attach_terminal_paths(snap.devices, ttys);

  snap.elapsed = std::chrono::steady_clock::now() - t0;

  spdlog::debug("Snapshot: {} device(s), {} tty mapping(s), {}us", snap.devices.size(), ttys.size(),
                std::chrono::duration_cast<std::chrono::microseconds>(snap.elapsed).count());
  return snap;
}

} // namespace usbwatch::monitor
