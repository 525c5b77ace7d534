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

#include "monitor/lsusb.hpp"
#include "monitor/snapshot.hpp"
#include "platform/posix-common/subprocess.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

using namespace usbwatch;
namespace fs = std::filesystem;

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

static monitor::Device make_dev(const char* bus, const char* addr) {
  monitor::Device d;
  d.bus = bus;
  d.address = addr;
  d.vendor_id = "10c4";
  d.product_id = "ea60";
  d.display_name = "CP2102";
  d.raw_device_path = monitor::raw_device_path(bus, addr);
  return d;
}

// Executable /bin/sh script printing `body`, then exiting with `code`.
static fs::path write_tool(const std::string& name, const std::string& body, int code = 0) {
  const fs::path p = fs::temp_directory_path() / fmt::format("usbwatch-{}-{}", name, ::getpid());
  std::ofstream(p) << "#!/bin/sh\ncat <<'OUT'\n" << body << "OUT\nexit " << code << "\n";
  fs::permissions(p, fs::perms::owner_all);
  return p;
}

// ----- terminal path attachment -----

static void test_attach() {
  std::vector<monitor::Device> devs = {make_dev("001", "004"), make_dev("002", "010"), make_dev("bad", "1")};
  devs[1].terminal_path = "/dev/stale";

  const linux::TtyMap ttys = {{linux::BusDev{1, 4}, "/dev/ttyUSB0"}, {linux::BusDev{9, 9}, "/dev/ttyACM3"}};
  monitor::attach_terminal_paths(devs, ttys);

  check("attach_hit", devs[0].terminal_path == std::optional<std::string>("/dev/ttyUSB0"));
  check_eq("attach_display_path", devs[0].display_path(), std::string("/dev/ttyUSB0"));
  check("attach_miss_cleared", !devs[1].terminal_path.has_value());
  check_eq("attach_miss_display_path", devs[1].display_path(), std::string("/dev/bus/usb/002/010"));
  check("attach_unparsable", !devs[2].terminal_path.has_value());

  const auto once = devs;
  monitor::attach_terminal_paths(devs, ttys);
  check("attach_idempotent", devs == once);
}

// ----- build_snapshot with fake sources -----

static void test_end_to_end() {
  monitor::SnapshotSources src;
  src.enumerate = [] { return monitor::parse_lsusb_output("Bus 001 Device 004: ID 0483:df11 STM Device in DFU Mode\n"); };
  src.resolve_ttys = [] { return linux::TtyMap{}; };

  const auto snap = monitor::build_snapshot(src);
  check_eq("e2e_count", snap.devices.size(), std::size_t{1});
  check_eq("e2e_sequence", snap.sequence, std::uint64_t{0});
  if (snap.devices.empty()) return;
  const auto& d = snap.devices[0];
  check_eq("e2e_bus", d.bus, std::string("001"));
  check_eq("e2e_address", d.address, std::string("004"));
  check_eq("e2e_vendor", d.vendor_id, std::string("0483"));
  check_eq("e2e_product", d.product_id, std::string("df11"));
  check("e2e_bootloader", d.is_bootloader_mode);
  check("e2e_no_tty", !d.terminal_path.has_value());
  check_eq("e2e_raw", d.raw_device_path, std::string("/dev/bus/usb/001/004"));
}

static void test_with_tty() {
  monitor::SnapshotSources src;
  src.enumerate = [] { return std::vector<monitor::Device>{make_dev("003", "002"), make_dev("003", "005")}; };
  src.resolve_ttys = [] { return linux::TtyMap{{linux::BusDev{3, 5}, "/dev/ttyACM0"}}; };

  const auto a = monitor::build_snapshot(src);
  const auto b = monitor::build_snapshot(src);
  check_eq("tty_count", a.devices.size(), std::size_t{2});
  if (a.devices.size() != 2) return;
  check("tty_first_raw", !a.devices[0].terminal_path.has_value());
  check_eq("tty_second", a.devices[1].display_path(), std::string("/dev/ttyACM0"));
  check("tty_repeatable", a.devices == b.devices);
}

static void test_empty_sources() {
  const auto snap = monitor::build_snapshot(monitor::SnapshotSources{});
  check("empty_sources", snap.devices.empty());
}

// ----- enumerate_lsusb against real processes -----

static void test_fake_tool() {
  const auto tool = write_tool("lsusb-ok",
                               "Bus 001 Device 001: ID 1d6b:0002 Linux Foundation 2.0 root hub\n"
                               "not a device line\n"
                               "Bus 001 Device 004: ID 0483:df11 STM Device in DFU Mode\n");
  const auto devs = monitor::enumerate_lsusb(tool.string());
  check_eq("tool_count", devs.size(), std::size_t{2});
  if (devs.size() == 2) {
    check_eq("tool_first_name", devs[0].display_name, std::string("Linux Foundation 2.0 root hub"));
    check("tool_second_dfu", devs[1].is_bootloader_mode);
  }
  std::error_code ec;
  fs::remove(tool, ec);
}

static void test_tool_nonzero_exit() {
  const auto tool = write_tool("lsusb-fail", "Bus 002 Device 003: ID abcd:0001 Gadget\n", 3);
  const auto devs = monitor::enumerate_lsusb(tool.string());
  check_eq("nonzero_exit_still_parsed", devs.size(), std::size_t{1});
  std::error_code ec;
  fs::remove(tool, ec);
}

static void test_capture_cap() {
  const auto cut = posix_common::run_capture({"/bin/sh", "-c", "printf abcdef"}, 4);
  check("cap_ran", static_cast<bool>(cut));
  if (cut) {
    check_eq("cap_bytes", cut->out, std::string("abcd"));
    check("cap_truncated", cut->truncated);
    check_eq("cap_exit", cut->exit_code, 0);
  }

  const auto whole = posix_common::run_capture({"/bin/sh", "-c", "printf abcd"}, 4);
  check("exact_fit_ran", static_cast<bool>(whole));
  if (whole) {
    check_eq("exact_fit_bytes", whole->out, std::string("abcd"));
    check("exact_fit_not_truncated", !whole->truncated);
  }
}

static void test_tool_output_capped() {
  const std::string first = "Bus 001 Device 001: ID 1d6b:0002 Linux Foundation 2.0 root hub\n";
  const std::string second = "Bus 001 Device 004: ID 0483:df11 STM Device in DFU Mode\n";
  const auto tool = write_tool("lsusb-capped", first + second);

  // The cap lands inside the device name of the second line.
  const auto devs = monitor::enumerate_lsusb(tool.string(), first.size() + 40);
  check_eq("capped_count", devs.size(), std::size_t{1});
  if (!devs.empty()) check_eq("capped_first_intact", devs[0].display_name, std::string("Linux Foundation 2.0 root hub"));

  const auto none = monitor::enumerate_lsusb(tool.string(), 20);
  check("capped_inside_first_line", none.empty());

  std::error_code ec;
  fs::remove(tool, ec);
}

static void test_missing_tool() {
  check("missing_tool_empty", monitor::enumerate_lsusb("/nonexistent/usbwatch-lsusb").empty());
  check("missing_on_path_empty", monitor::enumerate_lsusb("usbwatch-no-such-tool-on-path").empty());
}

int main() {
  test_attach();
  test_end_to_end();
  test_with_tty();
  test_empty_sources();
  test_fake_tool();
  test_tool_nonzero_exit();
  test_capture_cap();
  test_tool_output_capped();
  test_missing_tool();

  std::fprintf(stdout, "snapshot: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
