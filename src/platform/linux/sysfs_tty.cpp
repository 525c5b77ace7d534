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

#include "platform/linux/sysfs_tty.hpp"

#include "core/str.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace usbwatch::linux {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> read_text_file(const fs::path &p) {
  std::ifstream in(p);
  if (!in.is_open())
    return std::nullopt;
  // Whole file; the value may be preceded by blank lines.
  std::string s{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad())
    return std::nullopt;
  return s;
}

std::optional<std::uint32_t> read_u32_file(const fs::path &p) {
  const auto text = read_text_file(p);
  if (!text) {
    spdlog::debug("Cannot read {}", p.string());
    return std::nullopt;
  }
  auto v = core::parse_u32_dec(*text);
  if (!v)
    spdlog::debug("Not an integer in {}: '{}'", p.string(), core::trim(*text));
  return v;
}

bool is_file(const fs::path &p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

bool is_tty_family(std::string_view name) {
  for (const auto fam : kTtyFamilies)
    if (name.starts_with(fam))
      return true;
  return false;
}

std::string tty_devnode(const TtyLookupPaths &paths, std::string_view name) {
  return (paths.dev_dir / std::string(name)).string();
}

void add_from_by_id(const TtyLookupPaths &paths, TtyMap &out) {
  std::error_code ec;
  fs::directory_iterator it(paths.by_id_dir, ec);
  if (ec) {
    spdlog::debug("No serial by-id directory at {}: {}", paths.by_id_dir.string(), ec.message());
    return;
  }

  for (; it != fs::directory_iterator{}; it.increment(ec)) {
    if (ec)
      break;

    std::error_code lec;
    const auto target = fs::read_symlink(it->path(), lec);
    if (lec)
      continue;

    const auto name = target.filename().string();
    if (!is_tty_family(name))
      continue;

    if (auto key = tty_bus_dev(name, paths)) {
      if (out.emplace(*key, tty_devnode(paths, name)).second)
        spdlog::debug("by-id {} -> {} (bus {}, dev {})", it->path().filename().string(), name, key->bus, key->dev);
    }
  }
}

void add_from_probe(const TtyLookupPaths &paths, TtyMap &out) {
  for (const auto fam : kTtyFamilies) {
    for (int i = 0; i < kTtyProbeCount; ++i) {
      const std::string name = fmt::format("{}{}", fam, i);
      if (auto key = tty_bus_dev(name, paths))
        out.emplace(*key, tty_devnode(paths, name));
    }
  }
}

} // namespace

std::optional<BusDev> tty_bus_dev(std::string_view tty_name, const TtyLookupPaths &paths) {
  std::error_code ec;
  const fs::path link = paths.sys_class_tty / std::string(tty_name) / "device";
  const fs::path real = fs::canonical(link, ec);
  if (ec)
    return std::nullopt;

  fs::path cur = real;
  for (int depth = 0; depth < kSysfsWalkDepth; ++depth) {
    if (!cur.has_relative_path())
      return std::nullopt;
    cur = cur.parent_path();

    const fs::path busnum = cur / "busnum";
    const fs::path devnum = cur / "devnum";
    if (!is_file(busnum) || !is_file(devnum))
      continue;

    const auto bus = read_u32_file(busnum);
    const auto dev = read_u32_file(devnum);
    if (!bus || !dev)
      return std::nullopt;
    return BusDev{*bus, *dev};
  }

  spdlog::debug("No USB device above {} within {} levels", real.string(), kSysfsWalkDepth);
  return std::nullopt;
}

TtyMap resolve_tty_paths(const TtyLookupPaths &paths) {
  TtyMap out;
  add_from_by_id(paths, out);
  add_from_probe(paths, out);
  return out;
}

} // namespace usbwatch::linux
