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
#include "app/run.hpp"
#include "app/version.hpp"

#include <cstdlib>
#include <exception>

#include <unistd.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  // stdout belongs to the dashboard and --list-only output.
  spdlog::set_default_logger(spdlog::stderr_color_mt("usbwatch"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  try {
    auto opt = usbwatch::app::parse_cli(argc, argv);
    if (!opt) {
      spdlog::error("{}. Use --help to see usage.", opt.st.msg);
      return EXIT_FAILURE;
    }

    if (opt->help) {
      spdlog::info(usbwatch::app::usage_text());
      return EXIT_SUCCESS;
    }
    if (opt->version) {
      spdlog::info("usbwatch v{}", usbwatch::app::version_string());
      return EXIT_SUCCESS;
    }

    const bool dashboard = !opt->list && !opt->list_only;
    if (opt->verbose) {
      spdlog::set_level(spdlog::level::debug);
    } else if (dashboard && ::isatty(STDOUT_FILENO) == 1) {
      // The alternate screen owns the terminal.
      spdlog::set_level(spdlog::level::off);
    }

    return usbwatch::app::run(opt.value());
  } catch (const std::exception &e) {
    spdlog::error(e.what());
    return EXIT_FAILURE;
  }
}
