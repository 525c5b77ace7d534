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

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

using namespace usbwatch;
using namespace std::chrono_literals;

static int g_pass = 0;
static int g_fail = 0;

template <class T, class U>
static void check_eq(const char* label, const T& got, const U& expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void check(const char* label, bool ok) { check_eq(label, ok, true); }

static monitor::Device dev(const char* bus, const char* addr, const char* vid = "1234", const char* pid = "5678",
                           bool dfu = false) {
  monitor::Device d;
  d.bus = bus;
  d.address = addr;
  d.vendor_id = vid;
  d.product_id = pid;
  d.display_name = dfu ? "Widget DFU" : "Widget";
  d.is_bootloader_mode = dfu;
  d.raw_device_path = std::string("/dev/bus/usb/") + bus + "/" + addr;
  return d;
}

static monitor::Snapshot snap(std::vector<monitor::Device> devs, std::uint64_t seq = 0) {
  monitor::Snapshot s;
  s.devices = std::move(devs);
  s.elapsed = 3ms;
  s.sequence = seq;
  return s;
}

static std::string selected(const monitor::Session& s) {
  return s.selected_key() ? s.selected_key()->str() : std::string("-");
}

// ----- counters -----

static void test_connect_disconnect() {
  monitor::Session s;
  s.apply(snap({dev("1", "2"), dev("1", "3")}));
  check_eq("first_connects", s.stats().connects, std::uint64_t{0});
  check_eq("first_disconnects", s.stats().disconnects, std::uint64_t{0});

  s.apply(snap({dev("1", "3"), dev("1", "4")}));
  check_eq("connects", s.stats().connects, std::uint64_t{1});
  check_eq("disconnects", s.stats().disconnects, std::uint64_t{1});
  check_eq("refresh_count", s.stats().refresh_count, std::uint64_t{2});
  check("latency", s.stats().last_latency == std::chrono::steady_clock::duration(3ms));

  s.apply(snap({dev("1", "3"), dev("1", "4")}));
  check_eq("unchanged_connects", s.stats().connects, std::uint64_t{1});
  check_eq("unchanged_disconnects", s.stats().disconnects, std::uint64_t{1});
}

static void test_first_empty_then_devices() {
  monitor::Session s;
  s.apply(snap({}));
  check("empty_no_selection", !s.selected_index().has_value());
  check("empty_no_device", s.selected_device() == nullptr);

  s.apply(snap({dev("2", "1"), dev("2", "2")}));
  check_eq("after_empty_connects", s.stats().connects, std::uint64_t{2});
  check_eq("after_empty_selects_first", selected(s), std::string("2:1"));
}

static void test_peak_and_models() {
  monitor::Session s;
  s.apply(snap({dev("1", "2", "aaaa", "0001"), dev("1", "3", "aaaa", "0001"), dev("1", "4", "bbbb", "0002", true)}));
  s.apply(snap({dev("1", "5", "aaaa", "0001")}));

  check_eq("peak", s.stats().peak_devices, std::size_t{3});
  check_eq("ever_seen_dedupe", s.stats().ever_seen.size(), std::size_t{2});
  check_eq("dfu_seen", s.stats().bootloader_ever_seen.size(), std::size_t{1});
  check_eq("bootloader_count_now", s.bootloader_count(), std::size_t{0});
  check_eq("devices_now", s.devices().size(), std::size_t{1});
}

// ----- selection -----

static void test_selection_follows_key() {
  monitor::Session s;
  s.apply(snap({dev("1", "2"), dev("1", "3"), dev("1", "4")}));
  check_eq("initial_selection", selected(s), std::string("1:2"));

  s.select_next();
  check_eq("next", selected(s), std::string("1:3"));

  // 1:3 moves from index 1 to index 0.
  s.apply(snap({dev("1", "3"), dev("1", "9")}));
  check_eq("follow_key", selected(s), std::string("1:3"));
  check("follow_index", s.selected_index() == std::optional<std::size_t>(0));
}

static void test_selection_clamps() {
  monitor::Session s;
  s.apply(snap({dev("1", "2"), dev("1", "3"), dev("1", "4")}));
  s.select_previous();
  check_eq("wrap_to_last", selected(s), std::string("1:4"));

  // Selected device gone; index 2 clamps to the new last row.
  s.apply(snap({dev("1", "2"), dev("1", "3")}));
  check("clamped_index", s.selected_index() == std::optional<std::size_t>(1));
  check_eq("clamped_key", selected(s), std::string("1:3"));

  // Selected device gone, old index still in range: same row, new key.
  s.apply(snap({dev("1", "2"), dev("1", "7")}));
  check("kept_index", s.selected_index() == std::optional<std::size_t>(1));
  check_eq("kept_index_key", selected(s), std::string("1:7"));

  s.apply(snap({}));
  check("cleared_index", !s.selected_index().has_value());
  check("cleared_key", !s.selected_key().has_value());

  s.apply(snap({dev("1", "8")}));
  check_eq("reselect_after_empty", selected(s), std::string("1:8"));
}

static void test_navigation() {
  monitor::Session s;
  s.select_next();
  s.select_previous();
  check("nav_empty_noop", !s.selected_index().has_value());

  s.apply(snap({dev("1", "1"), dev("1", "2")}));
  s.select_next();
  s.select_next();
  check_eq("nav_wrap_forward", selected(s), std::string("1:1"));
  s.select_previous();
  check_eq("nav_wrap_backward", selected(s), std::string("1:2"));

  const auto* d = s.selected_device();
  check("nav_selected_device", d != nullptr && d->address == "2");
}

// ----- misc -----

static void test_sequence_and_uptime() {
  monitor::Session s;
  s.apply(snap({}, 1));
  s.apply(snap({}, 4));
  check_eq("last_sequence", s.last_sequence(), std::uint64_t{4});

  check_eq("uptime_mmss", monitor::format_uptime(std::chrono::seconds(65)), std::string("01:05"));
  check_eq("uptime_hhmmss", monitor::format_uptime(std::chrono::seconds(3600 + 2 * 60 + 3)), std::string("01:02:03"));
  check_eq("uptime_zero", monitor::format_uptime(std::chrono::steady_clock::duration::zero()), std::string("00:00"));

  monitor::Statistics st;
  check("rate_zero_at_start", st.refresh_rate(st.start_time) == 0.0);
  st.refresh_count = 10;
  check("rate_per_second", st.refresh_rate(st.start_time + std::chrono::seconds(5)) == 2.0);
}

int main() {
  test_connect_disconnect();
  test_first_empty_then_devices();
  test_peak_and_models();
  test_selection_follows_key();
  test_selection_clamps();
  test_navigation();
  test_sequence_and_uptime();

  std::fprintf(stdout, "session: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
