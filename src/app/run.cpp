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

#include "app/run.hpp"

#include "app/dashboard.hpp"
#include "monitor/poller.hpp"
#include "monitor/session.hpp"
#include "monitor/snapshot.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <utility>

#include <spdlog/spdlog.h>

namespace usbwatch::app {

namespace {

constexpr auto kFirstSnapshotWait = std::chrono::seconds(1);
constexpr auto kInputPoll = std::chrono::milliseconds(16);

void print_snapshot(const monitor::Snapshot& s, bool only) {
  for (const auto& d : s.devices) {
    if (only) { std::cout << d.display_path() << "\n"; continue; }
    spdlog::info("Found device: {} {} [{}]{}", d.display_path(), d.display_name, d.model().str(),
                 d.is_bootloader_mode ? " (DFU)" : "");
  }
  std::cout << std::flush;
}

} // namespace

int run_list(const Options& opt) {
  const auto snap = monitor::build_snapshot(monitor::system_sources(opt.lsusb));

  if (!opt.list_only) {
    spdlog::info("{} USB device(s), scanned in {:.2f}ms", snap.devices.size(),
                 std::chrono::duration<double, std::milli>(snap.elapsed).count());
  }
  print_snapshot(snap, opt.list_only);
  return EXIT_SUCCESS;
}

int run_dashboard(const Options& opt) {
  monitor::Poller poller([src = monitor::system_sources(opt.lsusb)] { return monitor::build_snapshot(src); },
                         opt.interval);
  monitor::Session session;

  poller.refresh();
  if (auto first = poller.wait_next(std::chrono::duration_cast<std::chrono::milliseconds>(kFirstSnapshotWait))) {
    session.apply(std::move(*first));
  } else {
    spdlog::warn("No snapshot within {}s; continuing", kFirstSnapshotWait.count());
  }

  Dashboard ui(true, !opt.no_color);
  KeyReader keys;
  if (!keys.interactive()) spdlog::debug("stdin is not a terminal; keyboard input disabled");

  bool force = true;
  for (;;) {
    if (auto snap = poller.try_latest()) {
      session.apply(std::move(*snap));
      force = true;
    }

    ui.draw(session, force);
    force = false;

    bool quit = false;
    for (const auto in : keys.poll(kInputPoll)) {
      switch (in) {
        case Intent::Next: session.select_next(); force = true; break;
        case Intent::Previous: session.select_previous(); force = true; break;
        case Intent::Refresh: poller.refresh(); break;
        case Intent::Quit: quit = true; break;
      }
    }
    if (quit) break;
  }

  poller.stop();
  spdlog::debug("Dashboard closed after {} refresh(es), {} snapshot(s) superseded", session.stats().refresh_count,
                poller.dropped());
  return EXIT_SUCCESS;
}

int run(const Options& opt) {
  if (opt.list || opt.list_only) return run_list(opt);
  return run_dashboard(opt);
}

} // namespace usbwatch::app
