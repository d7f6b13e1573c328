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
#include "filehandle.hpp"
#include "io/source.hpp"

#include <memory>
#include <span>
#include <string>

namespace packetio::posix_common {

// Non-blocking descriptor source: EAGAIN reads as "nothing available", a
// zero-length read(2) as end of stream.
class FdSource final : public packetio::io::ByteSource {
public:
  FdSource(int fd, bool owned, std::string name, int saved_flags);
  ~FdSource() override;

  FdSource(const FdSource&) = delete;
  FdSource& operator=(const FdSource&) = delete;

  std::string display_name() const override { return name_; }
  packetio::core::Result<std::ptrdiff_t> read(std::span<std::byte> out) override;
  std::size_t available() const noexcept override;
  bool wait_readable(int timeout_ms) noexcept override;
  void close() noexcept override;

private:
  packetio::FileHandle fd_;
  std::string name_;
  int saved_flags_ = -1;
};

packetio::core::Result<std::unique_ptr<packetio::io::ByteSource>> open_fd_source(int fd, std::string name,
                                                                                   bool take_ownership = true) noexcept;

packetio::core::Result<std::unique_ptr<packetio::io::ByteSource>> open_stdin() noexcept;

} // namespace packetio::posix_common
