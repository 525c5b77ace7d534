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

#include "app/dashboard.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <array>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace usbwatch::app {

namespace {

static std::size_t u8_advance(std::string_view s, std::size_t i) {
  if (i >= s.size()) return s.size();
  const auto c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) return i + 1;
  if ((c & 0xE0) == 0xC0) return std::min(i + 2, s.size());
  if ((c & 0xF0) == 0xE0) return std::min(i + 3, s.size());
  if ((c & 0xF8) == 0xF0) return std::min(i + 4, s.size());
  return i + 1;
}

constexpr const char *kAltOn = "\x1b[?1049h";
constexpr const char *kAltOff = "\x1b[?1049l";
constexpr const char *kHideCursor = "\x1b[?25l";
constexpr const char *kShowCursor = "\x1b[?25h";

constexpr const char *kReset = "\x1b[0m";
constexpr const char *kBold = "\x1b[1m";

constexpr const char *kRed = "\x1b[31m";
constexpr const char *kGreen = "\x1b[32m";
constexpr const char *kYellow = "\x1b[33m";
constexpr const char *kBlue = "\x1b[34m";
constexpr const char *kMagenta = "\x1b[35m";
constexpr const char *kCyan = "\x1b[36m";
constexpr const char *kGray = "\x1b[90m";

constexpr char kEsc = '\x1b';

static bool env_has_utf8() {
  auto has = [](const char *v) {
    if (!v || !*v) return false;
    const std::string_view s(v);
    return core::contains_ci(s, "utf-8") || core::contains_ci(s, "utf8");
  };
  return has(std::getenv("LC_ALL")) || has(std::getenv("LC_CTYPE")) || has(std::getenv("LANG"));
}

// Puts the terminal back if we die from a signal while the alternate
// screen or raw input mode is active.
struct TermSignalGuard {
  using H = void (*)(int);

  static inline int users = 0;
  static inline H old_int = SIG_DFL;
  static inline H old_term = SIG_DFL;
  static inline H old_quit = SIG_DFL;
  static inline H old_hup = SIG_DFL;

  static inline termios saved_tio{};
  static inline volatile std::sig_atomic_t have_tio = 0;
  static inline volatile std::sig_atomic_t screen_active = 0;

  static void restore_now_() noexcept {
    if (have_tio) (void)::tcsetattr(STDIN_FILENO, TCSANOW, &saved_tio);
    if (screen_active) {
      static constexpr char seq[] = "\x1b[0m\x1b[?25h\x1b[?1049l";
      (void)::write(STDOUT_FILENO, seq, sizeof(seq) - 1);
    }
  }

  static void handler_(int signo) noexcept {
    restore_now_();
    std::_Exit(128 + signo);
  }

  static void install() noexcept {
    if (users++ > 0) return;
    old_int = std::signal(SIGINT, &handler_);
    old_term = std::signal(SIGTERM, &handler_);
    old_quit = std::signal(SIGQUIT, &handler_);
    old_hup = std::signal(SIGHUP, &handler_);
  }

  static void uninstall() noexcept {
    if (users == 0 || --users > 0) return;
    std::signal(SIGINT, old_int);
    std::signal(SIGTERM, old_term);
    std::signal(SIGQUIT, old_quit);
    std::signal(SIGHUP, old_hup);
  }
};

} // namespace

std::vector<Intent> decode_keys(std::string_view bytes) {
  std::vector<Intent> out;

  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const char c = bytes[i];

    if (c == kEsc) {
      const bool seq = i + 1 < bytes.size() && (bytes[i + 1] == '[' || bytes[i + 1] == 'O');
      if (!seq) { out.push_back(Intent::Quit); continue; }

      // CSI / SS3: parameters, then one final byte in 0x40..0x7E.
      std::size_t j = i + 2;
      while (j < bytes.size() && !(bytes[j] >= 0x40 && bytes[j] <= 0x7E)) ++j;
      if (j < bytes.size()) {
        if (bytes[j] == 'A') out.push_back(Intent::Previous);
        else if (bytes[j] == 'B') out.push_back(Intent::Next);
      }
      i = j;
      continue;
    }

    switch (c) {
      case 'q': case 'Q': case '\x03': out.push_back(Intent::Quit); break;
      case 'r': case 'R': out.push_back(Intent::Refresh); break;
      case 'j': out.push_back(Intent::Next); break;
      case 'k': out.push_back(Intent::Previous); break;
      default: break;
    }
  }
  return out;
}

KeyReader::KeyReader() {
  if (::isatty(STDIN_FILENO) != 1) return;

  in_ = FileHandle{::fcntl(STDIN_FILENO, F_DUPFD_CLOEXEC, 0)};
  if (!in_.valid()) return;
  if (::tcgetattr(in_.fd, &saved_) != 0) return;

  termios raw = saved_;
  raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;

  TermSignalGuard::saved_tio = saved_;
  TermSignalGuard::have_tio = 1;
  TermSignalGuard::install();

  if (::tcsetattr(in_.fd, TCSANOW, &raw) != 0) {
    spdlog::debug("tcsetattr failed; keyboard input disabled");
    TermSignalGuard::have_tio = 0;
    TermSignalGuard::uninstall();
    return;
  }
  raw_ = true;
}

KeyReader::~KeyReader() {
  if (!raw_) return;
  (void)::tcsetattr(in_.fd, TCSANOW, &saved_);
  TermSignalGuard::have_tio = 0;
  TermSignalGuard::uninstall();
}

std::vector<Intent> KeyReader::poll(std::chrono::milliseconds timeout) {
  if (!raw_) {
    std::this_thread::sleep_for(timeout);
    return {};
  }
  if (!in_.wait_readable(static_cast<int>(timeout.count()))) return {};

  std::array<char, 64> buf{};
  const ssize_t n = in_.read(buf.data(), buf.size());
  if (n <= 0) return {};
  return decode_keys(std::string_view(buf.data(), static_cast<std::size_t>(n)));
}

bool Dashboard::is_tty_() { return ::isatty(STDOUT_FILENO) == 1; }

bool Dashboard::colors_enabled_() {
  if (!is_tty_()) return false;
  const char *no = std::getenv("NO_COLOR");
  return !(no && *no);
}

bool Dashboard::utf8_enabled_() { return is_tty_() && env_has_utf8(); }

Dashboard::Dashboard(bool is_tty_enabled, bool allow_color) {
  if (is_tty_enabled) {
    tty_ = is_tty_();
    color_ = allow_color && colors_enabled_();
    utf8_ = utf8_enabled_();
  }

  if (tty_) {
    TermSignalGuard::screen_active = 1;
    TermSignalGuard::install();
    std::cout << kAltOn << kHideCursor << std::flush;
  }
}

Dashboard::~Dashboard() {
  if (tty_) {
    std::cout << kReset << kShowCursor << kAltOff << std::flush;
    TermSignalGuard::screen_active = 0;
    TermSignalGuard::uninstall();
  }
}

void Dashboard::draw(const monitor::Session &s, bool force) {
  if (!tty_) {
    draw_plain_(s);
    return;
  }

  const auto now = std::chrono::steady_clock::now();
  if (!force && (now - last_redraw_) < std::chrono::milliseconds(33)) return;
  last_redraw_ = now;
  draw_tty_(s);
}

Dashboard::TermSize Dashboard::term_size_() const {
  winsize ws{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0)
    return {static_cast<int>(ws.ws_row), static_cast<int>(ws.ws_col)};
  return {24, 80};
}

Dashboard::Clip Dashboard::clip_(std::string_view s, std::size_t max_cols) const {
  if (!max_cols) return {};

  if (!utf8_) {
    if (s.size() <= max_cols) return {std::string(s), s.size()};
    if (max_cols <= 3) return {std::string(s.substr(0, max_cols)), max_cols};
    return {std::string(s.substr(0, max_cols - 3)) + "...", max_cols};
  }

  auto take_cols = [&](std::size_t cols_want) -> std::pair<std::size_t, std::size_t> {
    std::size_t cols = 0, out_bytes = 0;
    for (std::size_t i = 0; i < s.size() && cols < cols_want;) {
      const std::size_t next = u8_advance(s, i);
      out_bytes = next;
      i = next;
      ++cols;
    }
    return {out_bytes, cols};
  };

  const auto [bytes_max, cols_max] = take_cols(max_cols);
  if (bytes_max >= s.size()) return {std::string(s), cols_max};

  if (max_cols == 1) return {"…", 1};

  const auto [bytes_keep, cols_keep] = take_cols(max_cols - 1);
  std::string out(s.substr(0, bytes_keep));
  out += "…";
  return {std::move(out), cols_keep + 1};
}

std::string Dashboard::render_(const Line &l, std::size_t cols) const {
  std::string out;
  std::size_t used = 0;

  for (const auto &seg : l) {
    if (used >= cols) break;
    const auto c = clip_(seg.text, cols - used);
    const bool styled = color_ && (seg.color || seg.bold);
    if (styled) {
      if (seg.bold) out += kBold;
      if (seg.color) out += seg.color;
    }
    out += c.s;
    if (styled) out += kReset;
    used += c.w;
  }

  if (used < cols) out.append(cols - used, ' ');
  return out;
}

std::string Dashboard::rule_(std::size_t cols) const {
  std::string s;
  for (std::size_t i = 0; i < cols; ++i) s += utf8_ ? "─" : "-";
  return color_ ? std::string(kBlue) + s + kReset : s;
}

Dashboard::Line Dashboard::header_(const monitor::Session &s) const {
  Line l;
  l.push_back({kCyan, "USB Devices ", true});
  l.push_back({kGray, fmt::format("({})", s.devices().size())});

  if (const auto dfu = s.bootloader_count()) {
    l.push_back({nullptr, "  "});
    l.push_back({kMagenta, fmt::format(" {} DFU ", dfu), true});
  }

  l.push_back({nullptr, "  "});
  l.push_back({kGray, "uptime " + monitor::format_uptime(s.stats().uptime())});
  return l;
}

Dashboard::Line Dashboard::footer_(const monitor::Session &s) const {
  const bool even = s.stats().refresh_count % 2 == 0;
  const char *blink = utf8_ ? (even ? "●" : "○") : (even ? "*" : "o");

  Line l;
  l.push_back({kGreen, blink});
  l.push_back({nullptr, " "});
  l.push_back({kCyan, utf8_ ? "↑/↓" : "Up/Down"});
  l.push_back({kGray, " navigate  "});
  l.push_back({kCyan, "r"});
  l.push_back({kGray, " refresh  "});
  l.push_back({kCyan, "q"});
  l.push_back({kGray, " quit"});
  return l;
}

std::vector<Dashboard::Line> Dashboard::device_list_(const monitor::Session &s, std::size_t rows) const {
  std::vector<Line> out;
  const auto &devs = s.devices();

  if (devs.empty()) {
    out.push_back({{kGray, "No USB devices found"}});
    return out;
  }
  if (!rows) return out;

  const std::size_t sel = s.selected_index().value_or(0);

  std::size_t first = 0;
  if (devs.size() > rows) {
    const auto half = rows / 2;
    first = (sel > half) ? (sel - half) : 0;
    if (first + rows > devs.size()) first = devs.size() - rows;
  }
  const std::size_t last = std::min(devs.size(), first + rows);

  for (std::size_t i = first; i < last; ++i) {
    const auto &d = devs[i];
    const bool selected = s.selected_index() && *s.selected_index() == i;

    Line l;
    l.push_back({kCyan, selected ? (utf8_ ? "▶ " : "> ") : "  ", true});
    l.push_back({d.is_bootloader_mode ? kYellow : nullptr, d.display_name, d.is_bootloader_mode || selected});
    l.push_back({nullptr, " "});
    l.push_back({d.terminal_path ? kGreen : kGray, d.display_path(), selected});
    out.push_back(std::move(l));
  }
  return out;
}

std::vector<Dashboard::Line> Dashboard::details_(const monitor::Session &s) const {
  std::vector<Line> out;
  const auto *d = s.selected_device();
  if (!d) {
    out.push_back({{kGray, "No device selected"}});
    return out;
  }

  auto field = [](std::string_view label, std::string value, const char *color = nullptr, bool bold = false) {
    return Line{{kGray, fmt::format("{:<9}", label)}, {color, std::move(value), bold}};
  };

  out.push_back(field("Name", d->display_name, nullptr, true));
  out.push_back({});
  out.push_back(field("ID", d->model().str(), kCyan));
  out.push_back(field("Bus", d->bus));
  out.push_back(field("Device", d->address));
  out.push_back(field("Vendor", d->vendor_id));
  out.push_back(field("Product", d->product_id));
  out.push_back({});
  out.push_back(field("Path", d->raw_device_path, kGreen));
  if (d->terminal_path) out.push_back(field("TTY", *d->terminal_path, kGreen, true));

  if (d->is_bootloader_mode) {
    out.push_back({});
    out.push_back({{kYellow, utf8_ ? "⚡ DFU Mode" : "DFU Mode", true}});
  }
  return out;
}

std::vector<Dashboard::Line> Dashboard::stats_(const monitor::Session &s) const {
  const auto &st = s.stats();
  const double ms = std::chrono::duration<double, std::milli>(st.last_latency).count();
  const char *lat_color = ms < 10.0 ? kGreen : (ms < 50.0 ? kYellow : kRed);

  auto label = [](std::string_view l) { return Seg{kGray, fmt::format("{:<13}", l)}; };

  std::vector<Line> out;
  out.push_back({{kGray, utf8_ ? "─── Stats ───" : "--- Stats ---"}});
  out.push_back({label("Refreshes"), {kGreen, fmt::format("{}", st.refresh_count)},
                 {kGray, fmt::format(" ({:.1f}/s)", st.refresh_rate())}});
  out.push_back({label("Latency"), {lat_color, fmt::format("{:.2f}ms", ms)}});
  out.push_back({label("Peak"), {nullptr, fmt::format("{} devices", st.peak_devices)}});
  out.push_back({label("Ever seen"), {nullptr, fmt::format("{} unique", st.ever_seen.size())}});
  if (st.bootloader_ever_seen.empty())
    out.push_back({label("DFU seen"), {kGray, "none"}});
  else
    out.push_back({label("DFU seen"), {kMagenta, fmt::format("{}", st.bootloader_ever_seen.size()), true}});
  out.push_back({label("Connects"), {kGreen, fmt::format("+{}", st.connects)}, {nullptr, " / "},
                 {kRed, fmt::format("-{}", st.disconnects)}});
  return out;
}

void Dashboard::draw_tty_(const monitor::Session &s) {
  const auto ts = term_size_();
  const auto rows = static_cast<std::size_t>(std::max(10, ts.rows));
  const auto cols = static_cast<std::size_t>(std::max(40, ts.cols));

  // header, rule, body..., rule, footer
  const std::size_t body = rows - 4;

  std::ostringstream out;
  out << "\x1b[H\x1b[J";

  out << render_(header_(s), cols) << "\n";
  out << rule_(cols) << "\n";

  auto right = details_(s);
  right.push_back({});
  for (auto &l : stats_(s)) right.push_back(std::move(l));

  if (cols >= 80) {
    const std::size_t left_w = cols * 55 / 100;
    const std::size_t right_w = cols - left_w - 3;
    const auto left = device_list_(s, body);
    const std::string sep = color_ ? std::string(kBlue) + (utf8_ ? " │ " : " | ") + kReset : (utf8_ ? " │ " : " | ");

    for (std::size_t r = 0; r < body; ++r) {
      out << render_(r < left.size() ? left[r] : Line{}, left_w) << sep
          << render_(r < right.size() ? right[r] : Line{}, right_w) << "\n";
    }
  } else {
    // Narrow terminal: list on top, details below.
    const std::size_t list_rows = std::max<std::size_t>(1, body / 2);
    const auto left = device_list_(s, list_rows);
    std::vector<Line> lines(left.begin(), left.end());
    lines.resize(list_rows);
    lines.push_back({{kBlue, std::string(cols, '-')}});
    for (auto &l : right) lines.push_back(std::move(l));
    lines.resize(body);
    for (const auto &l : lines) out << render_(l, cols) << "\n";
  }

  out << rule_(cols) << "\n";
  out << render_(footer_(s), cols);
  std::cout << out.str() << std::flush;
}

void Dashboard::draw_plain_(const monitor::Session &s) {
  const auto &st = s.stats();
  if (st.refresh_count == plain_refresh_) return;
  const bool first = plain_refresh_ == 0;
  plain_refresh_ = st.refresh_count;

  std::vector<monitor::TransientKey> keys;
  keys.reserve(s.devices().size());
  for (const auto &d : s.devices()) keys.push_back(d.key());
  if (!first && keys == plain_keys_) return;
  plain_keys_ = std::move(keys);

  spdlog::info("Devices={} DFU={} Connects=+{}/-{} Latency={:.2f}ms Uptime={}", s.devices().size(),
               s.bootloader_count(), st.connects, st.disconnects,
               std::chrono::duration<double, std::milli>(st.last_latency).count(),
               monitor::format_uptime(st.uptime()));
  for (const auto &d : s.devices())
    spdlog::info("  {} {} [{}]{}", d.display_path(), d.display_name, d.model().str(),
                 d.is_bootloader_mode ? " (DFU)" : "");
}

} // namespace usbwatch::app
