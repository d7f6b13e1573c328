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

#include "platform/posix-common/fd_source.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace packetio::posix_common {

FdSource::FdSource(int fd, bool owned, std::string name, int saved_flags)
  : fd_(fd, owned)
  , name_(std::move(name))
  , saved_flags_(saved_flags)
{}

FdSource::~FdSource() { close(); }

packetio::core::Result<std::ptrdiff_t> FdSource::read(std::span<std::byte> out) {
  if (!fd_.valid()) return packetio::core::Result<std::ptrdiff_t>::Failf("{}: read after close", name_);
  if (out.empty()) return packetio::core::Result<std::ptrdiff_t>::Ok(0);

  for (;;) {
    const ssize_t n = do_read(fd_, out.data(), out.size());
    if (n > 0) return packetio::core::Result<std::ptrdiff_t>::Ok(static_cast<std::ptrdiff_t>(n));
    if (n == 0) return packetio::core::Result<std::ptrdiff_t>::Ok(packetio::io::kEndOfStream);

    const int e = errno;
    if (e == EINTR) continue;
    if (e == EAGAIN || e == EWOULDBLOCK) return packetio::core::Result<std::ptrdiff_t>::Ok(0);
    return packetio::core::Result<std::ptrdiff_t>::Failf("{}: read: {}", name_, std::strerror(e));
  }
}

std::size_t FdSource::available() const noexcept {
  int n = 0;
  if (do_ioctl(fd_, FIONREAD, &n) < 0 || n < 0) return 0;
  return static_cast<std::size_t>(n);
}

bool FdSource::wait_readable(int timeout_ms) noexcept {
  return do_poll(fd_, POLLIN, timeout_ms) > 0;
}

void FdSource::close() noexcept {
  if (!fd_.valid()) return;
  if (saved_flags_ >= 0) (void)do_fcntl(fd_, F_SETFL, saved_flags_);
  spdlog::debug("FdSource: close {}", name_);
  fd_.close();
}

packetio::core::Result<std::unique_ptr<packetio::io::ByteSource>> open_fd_source(int fd, std::string name,
                                                                                   bool take_ownership) noexcept {
  using R = packetio::core::Result<std::unique_ptr<packetio::io::ByteSource>>;

  packetio::FileHandle probe(fd, false);
  const int flags = do_fcntl(probe, F_GETFL, 0);
  if (flags < 0) return R::Failf("open_fd_source: bad descriptor {}: {}", fd, name);

  if (!(flags & O_NONBLOCK) && do_fcntl(probe, F_SETFL, flags | O_NONBLOCK) < 0) {
    return R::Failf("open_fd_source: cannot set O_NONBLOCK on {}", name);
  }

  return R::Ok(std::make_unique<FdSource>(fd, take_ownership, std::move(name), flags));
}

packetio::core::Result<std::unique_ptr<packetio::io::ByteSource>> open_stdin() noexcept {
  return open_fd_source(STDIN_FILENO, "<stdin>", false);
}

} // namespace packetio::posix_common
