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

#include <string>
#include <string_view>

// The build passes the project version; a stage other than "release" and
// the commit count are appended as pre-release and build metadata.
#ifndef USBWATCH_VERSION
#error "USBWATCH_VERSION must be defined by the build"
#endif

#ifndef USBWATCH_VERSION_STAGE
#define USBWATCH_VERSION_STAGE "beta"
#endif

#ifndef USBWATCH_COMMIT_COUNT
#define USBWATCH_COMMIT_COUNT "0"
#endif

namespace usbwatch::app {

inline constexpr std::string_view kVersion = USBWATCH_VERSION;

inline const std::string& version_string() {
  static const std::string v = [] {
    constexpr std::string_view stage = USBWATCH_VERSION_STAGE;
    std::string out(kVersion);
    if (stage != "release") out.append("-").append(stage);
    out.append("+").append(USBWATCH_COMMIT_COUNT);
    return out;
  }();
  return v;
}

} // namespace usbwatch::app
