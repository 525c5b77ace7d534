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

#include <cerrno>
#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace usbwatch {

struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  void close() noexcept {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  int release() noexcept { return std::exchange(fd, -1); }

  bool valid() const noexcept { return fd >= 0; }

  // Retries on EINTR. Returns bytes read, 0 on EOF, -1 on error.
  ssize_t read(void* buf, size_t count) const noexcept {
    for (;;) {
      const ssize_t rc = ::read(fd, buf, count);
      if (rc >= 0) return rc;
      if (errno == EINTR) continue;
      const int e = errno;
      spdlog::debug("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
      return rc;
    }
  }

  // True if readable within timeout_ms; false on timeout or error.
  bool wait_readable(int timeout_ms) const noexcept {
    pollfd p{};
    p.fd = fd;
    p.events = POLLIN;
    const int rc = ::poll(&p, 1, timeout_ms);
    if (rc < 0 && errno != EINTR) {
      const int e = errno;
      spdlog::debug("poll(fd={}): {}", fd, std::strerror(e));
      errno = e;
    }
    return rc > 0 && (p.revents & (POLLIN | POLLHUP)) != 0;
  }

  static FileHandle open(const char* path, int flags, const char* flags_desc) noexcept {
    const int rc = ::open(path, flags | O_CLOEXEC);
    if (rc < 0) {
      const int e = errno;
      spdlog::debug("open({}, {}): {}", path, flags_desc, std::strerror(e));
      errno = e;
    }
    return FileHandle{rc};
  }

  // Both ends close-on-exec; returns false and leaves both invalid on error.
  static bool pipe(FileHandle& read_end, FileHandle& write_end) noexcept {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      const int e = errno;
      spdlog::debug("pipe2(): {}", std::strerror(e));
      errno = e;
      return false;
    }
    read_end = FileHandle{fds[0]};
    write_end = FileHandle{fds[1]};
    return true;
  }
};

} // namespace usbwatch

#define do_open(path, flags) (FileHandle::open(path, flags, #flags))
