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

#include "monitor/session.hpp"
#include "platform/posix-common/filehandle.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <termios.h>

namespace usbwatch::app {

enum class Intent { Next, Previous, Refresh, Quit };

// Maps raw terminal bytes to intents. Unknown bytes and escape sequences
// are ignored; a lone ESC is Quit.
std::vector<Intent> decode_keys(std::string_view bytes);

// Puts stdin in non-canonical, no-echo mode while alive (only if stdin is
// a terminal) and reads pending keys.
class KeyReader {
public:
  KeyReader();
  ~KeyReader();

  KeyReader(const KeyReader &) = delete;
  KeyReader &operator=(const KeyReader &) = delete;

  // Waits up to timeout for input and decodes whatever is available.
  std::vector<Intent> poll(std::chrono::milliseconds timeout);

  bool interactive() const noexcept { return raw_; }

private:
  FileHandle in_;
  termios saved_{};
  bool raw_ = false;
};

class Dashboard {
public:
  explicit Dashboard(bool is_tty_enabled, bool allow_color = true);
  ~Dashboard();

  Dashboard(const Dashboard &) = delete;
  Dashboard &operator=(const Dashboard &) = delete;

  void draw(const monitor::Session &s, bool force = false);

  bool tty() const noexcept { return tty_; }

private:
  struct TermSize {
    int rows = 0;
    int cols = 0;
  };
  struct Clip {
    std::string s;
    std::size_t w = 0;
  };
  struct Seg {
    const char *color = nullptr;
    std::string text;
    bool bold = false;
  };
  using Line = std::vector<Seg>;

  void draw_tty_(const monitor::Session &s);
  void draw_plain_(const monitor::Session &s);

  Line header_(const monitor::Session &s) const;
  Line footer_(const monitor::Session &s) const;
  std::vector<Line> device_list_(const monitor::Session &s, std::size_t rows) const;
  std::vector<Line> details_(const monitor::Session &s) const;
  std::vector<Line> stats_(const monitor::Session &s) const;

  TermSize term_size_() const;

  static bool is_tty_();
  static bool colors_enabled_();
  static bool utf8_enabled_();

  Clip clip_(std::string_view s, std::size_t max_cols) const;
  std::string render_(const Line &l, std::size_t cols) const;
  std::string rule_(std::size_t cols) const;

  bool tty_ = false, color_ = false, utf8_ = false;

  std::chrono::steady_clock::time_point last_redraw_{};

  std::uint64_t plain_refresh_ = 0;
  std::vector<monitor::TransientKey> plain_keys_;
};

} // namespace usbwatch::app
