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

#include "io/source.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace packetio::io {

MemorySource::MemorySource(std::vector<std::byte> data, Options opt, std::string name)
  : data_(std::move(data)), opt_(opt), name_(std::move(name))
{}

packetio::core::Result<std::ptrdiff_t> MemorySource::read(std::span<std::byte> out) {
  if (closed_) return packetio::core::Result<std::ptrdiff_t>::Failf("{}: read after close", name_);
  ++reads_;

  if (out.empty()) return packetio::core::Result<std::ptrdiff_t>::Ok(0);
  if (idle_left_) {
    --idle_left_;
    return packetio::core::Result<std::ptrdiff_t>::Ok(0);
  }
  if (off_ >= data_.size()) return packetio::core::Result<std::ptrdiff_t>::Ok(kEndOfStream);

  std::size_t n = std::min(out.size(), data_.size() - off_);
  if (opt_.chunk) n = std::min(n, opt_.chunk);

  std::memcpy(out.data(), data_.data() + off_, n);
  off_ += n;
  idle_left_ = opt_.idle_turns;
  return packetio::core::Result<std::ptrdiff_t>::Ok(static_cast<std::ptrdiff_t>(n));
}

std::size_t MemorySource::available() const noexcept {
  if (closed_ || idle_left_) return 0;
  const std::size_t rem = remaining();
  return opt_.chunk ? std::min(rem, opt_.chunk) : rem;
}

class RawFileSource final : public ByteSource {
public:
  explicit RawFileSource(std::filesystem::path p, std::uint64_t size)
    : path_(std::move(p)), in_(path_, std::ios::binary), size_(size)
  {}

  bool opened() const noexcept { return in_.is_open(); }

  std::string display_name() const override { return path_.string(); }

  packetio::core::Result<std::ptrdiff_t> read(std::span<std::byte> out) override {
    if (!in_.is_open()) return packetio::core::Result<std::ptrdiff_t>::Failf("{}: read after close", path_.string());
    if (out.empty()) return packetio::core::Result<std::ptrdiff_t>::Ok(0);

    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (in_.bad()) return packetio::core::Result<std::ptrdiff_t>::Failf("{}: read failed", path_.string());

    const auto n = in_.gcount();
    if (n > 0) {
      consumed_ += static_cast<std::uint64_t>(n);
      return packetio::core::Result<std::ptrdiff_t>::Ok(static_cast<std::ptrdiff_t>(n));
    }
    return packetio::core::Result<std::ptrdiff_t>::Ok(kEndOfStream);
  }

  // Regular files never block, so everything up to the stat size counts.
  std::size_t available() const noexcept override {
    if (!in_.is_open() || consumed_ >= size_) return 0;
    return static_cast<std::size_t>(size_ - consumed_);
  }

  void close() noexcept override {
    if (in_.is_open()) {
      spdlog::debug("RawFileSource: close {}", path_.string());
      in_.close();
    }
  }

private:
  std::filesystem::path path_;
  std::ifstream in_;
  std::uint64_t size_ = 0;
  std::uint64_t consumed_ = 0;
};

packetio::core::Result<std::unique_ptr<ByteSource>> open_raw_file(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  const auto sz = std::filesystem::file_size(path, ec);
  if (ec) return packetio::core::Result<std::unique_ptr<ByteSource>>::Failf("open_raw_file: stat failed: {}", path.string());

  auto ptr = std::make_unique<RawFileSource>(path, static_cast<std::uint64_t>(sz));
  if (!ptr->opened()) {
    return packetio::core::Result<std::unique_ptr<ByteSource>>::Failf("open_raw_file: cannot open: {}", path.string());
  }

  return packetio::core::Result<std::unique_ptr<ByteSource>>::Ok(std::move(ptr));
}

} // namespace packetio::io
