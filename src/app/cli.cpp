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

#include "app/cli.hpp"
#include "app/version.hpp"

#include <charconv>
#include <optional>
#include <string_view>

namespace usbwatch::app {

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                        std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return core::Result<std::string_view>::Fail(std::string(opt) + " requires value");
  return core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static core::Result<long> read_long_value(int& i, int argc, char** argv,
                                          std::string_view a, std::string_view opt) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<long>::Fail(std::move(vr.st.msg));

  const std::string_view s = vr.value();
  long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
    return core::Result<long>::Failf("{} expects an integer, got '{}'", opt, s);
  return core::Result<long>::Ok(v);
}

std::string usage_text() {
  std::string out;
  out.reserve(1024);

  out += "usbwatch v";
  out += usbwatch::app::version_string();
  out += "\n\n";

  out += R"(Usage:
  usbwatch [--interval <ms>] [--lsusb <cmd>] [--no-color] [-v]
  usbwatch --list | --list-only

Options:
  --help, -h
  --version
  --verbose, -v                enable verbose logging (stderr)
  --interval <ms>              idle refresh interval, 50..5000 (default 200)
  --lsusb <cmd>                USB listing tool to run (default lsusb)
  --list                       print the attached devices once and exit
  --list-only                  like --list, but only the device paths, one per line
  --no-color                   disable colors (NO_COLOR is honored too)

Keys:
  Up/k, Down/j                 move selection
  r                            refresh now
  q, Esc                       quit
)";
  return out;
}

core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }
    if (a == "--verbose" || a == "-v") { o.verbose = true; continue; }
    if (a == "--list") { o.list = true; continue; }
    if (a == "--list-only") { o.list_only = true; continue; }
    if (a == "--no-color") { o.no_color = true; continue; }

    if (is_opt(a, "--interval")) {
      auto vr = read_long_value(i, argc, argv, a, "--interval");
      if (!vr) return core::Result<Options>::Fail(std::move(vr.st.msg));
      if (vr.value() < kMinIntervalMs || vr.value() > kMaxIntervalMs)
        return core::Result<Options>::Failf("--interval must be between {} and {} ms", kMinIntervalMs, kMaxIntervalMs);
      o.interval = std::chrono::milliseconds(vr.value());
      continue;
    }

    if (is_opt(a, "--lsusb")) {
      auto vr = read_string_value(i, argc, argv, a, "--lsusb");
      if (!vr) return core::Result<Options>::Fail(std::move(vr.st.msg));
      if (vr.value().empty()) return core::Result<Options>::Fail("--lsusb requires a non-empty command");
      o.lsusb = std::string(vr.value());
      continue;
    }

    if (a.starts_with("-")) {
      return core::Result<Options>::Fail("Unknown option: " + std::string(a));
    }

    return core::Result<Options>::Fail("Positional arguments are not supported: " + std::string(a));
  }

  if (o.list && o.list_only) return core::Result<Options>::Fail("--list and --list-only are mutually exclusive");

  return core::Result<Options>::Ok(std::move(o));
}

} // namespace usbwatch::app
