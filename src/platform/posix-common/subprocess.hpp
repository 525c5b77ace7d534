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

#include <cstddef>
#include <string>
#include <vector>

namespace usbwatch::posix_common {

struct CaptureOutput {
  std::string out;   // raw stdout bytes
  int exit_code = -1; // -1 if terminated by a signal
  bool truncated = false; // stdout went past max_bytes
};

// Runs argv[0] (looked up on PATH) with stdin on /dev/null and stderr
// discarded, and collects its stdout up to max_bytes. Fails only when the
// process could not be started; a non-zero exit is reported, not failed.
core::Result<CaptureOutput> run_capture(const std::vector<std::string>& argv,
                                        std::size_t max_bytes = 1u << 20) noexcept;

} // namespace usbwatch::posix_common
