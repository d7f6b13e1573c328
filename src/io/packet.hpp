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
#include "io/source.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace packetio::io {

inline constexpr std::size_t kDefaultPacketSize = 1024;

/**
 * Immutable byte buffer produced by one assembly step.
 * A zero-length packet means "no data right now"; EOF is std::nullopt.
 */
class Packet {
 public:
  explicit Packet(std::vector<std::byte> data)
      : buf_(std::make_shared<const std::vector<std::byte>>(std::move(data))) {}

  // The shared zero-length packet.
  static const Packet& empty_packet() noexcept;

  std::span<const std::byte> bytes() const noexcept { return {buf_->data(), buf_->size()}; }
  const std::byte* data() const noexcept { return buf_->data(); }
  std::size_t size() const noexcept { return buf_->size(); }
  bool empty() const noexcept { return buf_->empty(); }

  bool shares_buffer_with(const Packet& o) const noexcept { return buf_ == o.buf_; }

 private:
  Packet() : buf_(std::make_shared<const std::vector<std::byte>>()) {}

  std::shared_ptr<const std::vector<std::byte>> buf_;
};

using PacketResult = packetio::core::Result<std::optional<Packet>>;

/**
 * Makes exactly one read attempt on src, sized to packet.size().
 *
 * A completely filled buffer is adopted as-is. A short read is copied into a
 * new buffer of exactly the bytes read, so the caller never sees a partly
 * filled buffer. Zero bytes yields the shared empty packet, end of stream
 * yields std::nullopt, and source failures come back unchanged.
 */
PacketResult read_packet(ByteSource& src, std::vector<std::byte> packet);

} // namespace packetio::io
