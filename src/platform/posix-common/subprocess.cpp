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

#include "platform/posix-common/subprocess.hpp"
#include "platform/posix-common/filehandle.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

#include <sys/wait.h>
#include <unistd.h>

namespace usbwatch::posix_common {

namespace {

int wait_child(pid_t pid) noexcept {
  int status = 0;
  for (;;) {
    const pid_t r = ::waitpid(pid, &status, 0);
    if (r == pid) break;
    if (r < 0 && errno == EINTR) continue;
    return -1;
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
}

} // namespace

core::Result<CaptureOutput> run_capture(const std::vector<std::string>& argv, std::size_t max_bytes) noexcept {
  using R = core::Result<CaptureOutput>;
  if (argv.empty() || argv.front().empty()) return R::Fail("run_capture: empty command");

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  FileHandle out_r, out_w;
  if (!FileHandle::pipe(out_r, out_w)) return R::Failf("{}: cannot create stdout pipe", argv.front());

  // Reports exec failure: the write end is close-on-exec, so EOF without
  // data means the exec succeeded.
  FileHandle err_r, err_w;
  if (!FileHandle::pipe(err_r, err_w)) return R::Failf("{}: cannot create status pipe", argv.front());

  FileHandle devnull = do_open("/dev/null", O_RDWR);
  if (!devnull.valid()) return R::Fail("cannot open /dev/null");

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int e = errno;
    return R::Failf("{}: fork failed: {}", argv.front(), std::strerror(e));
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    ::dup2(devnull.fd, STDIN_FILENO);
    ::dup2(out_w.fd, STDOUT_FILENO);
    ::dup2(devnull.fd, STDERR_FILENO);

    ::execvp(cargv[0], cargv.data());

    const int e = errno;
    (void)::write(err_w.fd, &e, sizeof(e));
    ::_exit(127);
  }

  out_w.close();
  err_w.close();
  devnull.close();

  int exec_errno = 0;
  const ssize_t n = err_r.read(&exec_errno, sizeof(exec_errno));
  err_r.close();
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    (void)wait_child(pid);
    return R::Failf("{}: cannot execute: {}", argv.front(), std::strerror(exec_errno));
  }

  CaptureOutput res;
  std::array<char, 4096> buf{};
  for (;;) {
    const ssize_t got = out_r.read(buf.data(), buf.size());
    if (got <= 0) break;
    // Keep draining past the cap so the child never blocks on a full pipe.
    const std::size_t room = max_bytes > res.out.size() ? max_bytes - res.out.size() : 0;
    const std::size_t keep = std::min(room, static_cast<std::size_t>(got));
    if (keep < static_cast<std::size_t>(got)) res.truncated = true;
    res.out.append(buf.data(), keep);
  }
  out_r.close();

  if (res.truncated) spdlog::debug("{}: output truncated at {} bytes", argv.front(), max_bytes);

  res.exit_code = wait_child(pid);
  if (res.exit_code != 0) spdlog::debug("{} exited with status {}", argv.front(), res.exit_code);

  return R::Ok(std::move(res));
}

} // namespace usbwatch::posix_common
