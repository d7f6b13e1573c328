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

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace packetio {

struct FileHandle {
  int fd = -1;
  bool owned = true;

  FileHandle() = default;
  explicit FileHandle(int fd_, bool owned_ = true) : fd(fd_), owned(owned_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd), owned(o.owned) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    owned = o.owned;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  // Borrowed descriptors (stdin) are only forgotten, never closed.
  void close() noexcept {
    if (fd >= 0) {
      if (owned) ::close(fd);
      fd = -1;
    }
  }

  bool valid() const noexcept { return fd >= 0; }

  int fcntl(int cmd, int arg, const char* cmd_name) const noexcept {
    const int rc = ::fcntl(fd, cmd, arg);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("fcntl(fd={}, cmd={}): {}", fd, cmd_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int ioctl(unsigned long request, void* arg, const char* req_name) const noexcept {
    const int rc = ::ioctl(fd, request, arg);
    if (rc < 0) { // ioctl signals error with -1; some ioctls return positive values
      const int e = errno;
      spdlog::error("ioctl(fd={}, req={}): {}", fd, req_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  // EAGAIN/EINTR are part of normal non-blocking operation and not logged.
  ssize_t read(void* buf, size_t count) const noexcept {
    const ssize_t rc = ::read(fd, buf, count);
    if (rc < 0) {
      const int e = errno;
      if (e != EAGAIN && e != EWOULDBLOCK && e != EINTR)
        spdlog::error("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int poll(short events, int timeout_ms) const noexcept {
    pollfd p{};
    p.fd = fd;
    p.events = events;
    const int rc = ::poll(&p, 1, timeout_ms);
    if (rc < 0) {
      const int e = errno;
      if (e != EINTR) spdlog::error("poll(fd={}, timeout={}ms): {}", fd, timeout_ms, std::strerror(e));
      errno = e;
    }
    return rc;
  }
};

} // namespace packetio

#define do_fcntl(fd, cmd, arg) ((fd).valid() ? (fd).fcntl(cmd, arg, #cmd) : -1)
#define do_ioctl(fd, request, arg) ((fd).valid() ? (fd).ioctl(request, arg, #request) : -1)
#define do_read(fd, buf, count) ((fd).valid() ? (fd).read(buf, count) : -1)
#define do_poll(fd, events, timeout_ms) ((fd).valid() ? (fd).poll(events, timeout_ms) : -1)
