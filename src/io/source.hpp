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
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace packetio::io {

// Returned by ByteSource::read once the stream is exhausted.
inline constexpr std::ptrdiff_t kEndOfStream = -1;

class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual std::string display_name() const = 0;

  // Number of bytes read, 0 if nothing is available right now, or kEndOfStream.
  // I/O failures are reported through the Result.
  virtual packetio::core::Result<std::ptrdiff_t> read(std::span<std::byte> out) = 0;

  // Bytes that can be read right now without blocking. 0 when unknown.
  virtual std::size_t available() const noexcept { return 0; }

  // Waits up to timeout_ms for data (or EOF) to become readable.
  virtual bool wait_readable(int /*timeout_ms*/) noexcept { return true; }

  virtual void close() noexcept {}
};

struct MemorySourceOptions {
  std::size_t chunk = 0;     // max bytes per read, 0 = unlimited
  unsigned idle_turns = 0;   // "nothing available" reads after each chunk
};

class MemorySource final : public ByteSource {
 public:
  using Options = MemorySourceOptions;

  explicit MemorySource(std::vector<std::byte> data, Options opt = {}, std::string name = "memory");

  std::string display_name() const override { return name_; }
  packetio::core::Result<std::ptrdiff_t> read(std::span<std::byte> out) override;
  std::size_t available() const noexcept override;
  void close() noexcept override { closed_ = true; }

  std::size_t remaining() const noexcept { return data_.size() - off_; }
  std::size_t reads() const noexcept { return reads_; }
  bool closed() const noexcept { return closed_; }

 private:
  std::vector<std::byte> data_;
  Options opt_;
  std::string name_;

  std::size_t off_ = 0;
  unsigned idle_left_ = 0;
  std::size_t reads_ = 0;
  bool closed_ = false;
};

packetio::core::Result<std::unique_ptr<ByteSource>> open_raw_file(const std::filesystem::path& path) noexcept;

} // namespace packetio::io
