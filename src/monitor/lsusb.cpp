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

#include "core/str.hpp"
#include "platform/posix-common/subprocess.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace usbwatch::monitor {

namespace {

constexpr std::string_view kIdSep = ": ID ";
constexpr std::array<std::string_view, 3> kBootloaderMarkers = {"dfu", "download", "boot"};

bool is_usb_id(std::string_view s) noexcept {
  if (s.empty() || s.size() > 4) return false;
  return std::all_of(s.begin(), s.end(), [](char c) { return core::is_hex_digit(c); });
}

} // namespace

bool looks_like_bootloader(std::string_view name) noexcept {
  return std::any_of(kBootloaderMarkers.begin(), kBootloaderMarkers.end(),
                     [&](std::string_view m) { return core::contains_ci(name, m); });
}

std::string raw_device_path(std::string_view bus, std::string_view address) {
  return fmt::format("/dev/bus/usb/{}/{}", bus, address);
}

std::optional<Device> parse_lsusb_line(std::string_view line) {
  const auto sep = line.find(kIdSep);
  if (sep == std::string_view::npos) return std::nullopt;

  const auto prefix = core::split_ws(line.substr(0, sep));
  if (prefix.size() < 4) return std::nullopt;

  std::string_view rest = line.substr(sep + kIdSep.size());
  std::string_view id = rest;
  std::string_view name;
  if (const auto sp = rest.find(' '); sp != std::string_view::npos) {
    id = rest.substr(0, sp);
    name = rest.substr(sp + 1);
  }
  id = core::trim(id);
  name = core::trim(name);

  const auto colon = id.find(':');
  if (colon == std::string_view::npos) return std::nullopt;
  const auto vendor = id.substr(0, colon);
  const auto product = id.substr(colon + 1);
  if (!is_usb_id(vendor) || !is_usb_id(product)) return std::nullopt;

  Device d;
  d.bus = std::string(prefix[1]);
  d.address = std::string(prefix[3]);
  d.vendor_id = std::string(vendor);
  d.product_id = std::string(product);
  d.display_name = name.empty() ? std::string(kUnknownName) : std::string(name);
  d.is_bootloader_mode = looks_like_bootloader(d.display_name);
  d.raw_device_path = raw_device_path(d.bus, d.address);
  return d;
}

std::vector<Device> parse_lsusb_output(std::string_view text) {
  std::vector<Device> out;
  std::size_t skipped = 0;

  while (!text.empty()) {
    const auto nl = text.find('\n');
    const auto line = text.substr(0, nl);
    text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

    if (core::trim(line).empty()) continue;
    if (auto d = parse_lsusb_line(line)) {
      out.push_back(std::move(*d));
    } else {
      ++skipped;
      spdlog::debug("Skipping malformed lsusb line: '{}'", line);
    }
  }

  if (skipped) spdlog::debug("lsusb: {} device(s), {} line(s) skipped", out.size(), skipped);
  return out;
}

std::vector<Device> enumerate_lsusb(const std::string& command, std::size_t max_bytes) {
  auto r = posix_common::run_capture({command}, max_bytes);
  if (!r) {
    spdlog::debug("USB enumeration unavailable: {}", r.st.msg);
    return {};
  }

  std::string_view out = r->out;
  if (r->truncated) {
    const auto nl = out.rfind('\n');
    out = (nl == std::string_view::npos) ? std::string_view{} : out.substr(0, nl + 1);
  }
  return parse_lsusb_output(core::utf8_lossy(out));
}

} // namespace usbwatch::monitor
