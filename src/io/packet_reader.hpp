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
#include "io/packet.hpp"
#include "io/source.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace packetio::io {

enum class ReadMode { Blocking, NoDelay };

struct PacketReaderConfig {
  std::size_t packet_size = kDefaultPacketSize;
  bool no_delay = false;
  int idle_wait_ms = 50;  // wait_readable() timeout between empty reads
};

/**
 * Packet based access to a ByteSource.
 *
 * Blocking reads gather bytes until a packet of packet_size() is full or the
 * source ends; NoDelay reads return whatever a single read attempt produced,
 * which may be nothing. Bytes left over from byte-level reads are always served
 * before the source is touched again.
 *
 * Not thread safe: one consumer per reader.
 */
class PacketReader {
 public:
  using Config = PacketReaderConfig;

  static packetio::core::Result<PacketReader> create(std::unique_ptr<ByteSource> src, Config cfg = {}) noexcept;

  PacketReader(const PacketReader&) = delete;
  PacketReader& operator=(const PacketReader&) = delete;

  PacketReader(PacketReader&&) noexcept = default;
  PacketReader& operator=(PacketReader&&) noexcept = default;

  ~PacketReader() = default;

  std::size_t packet_size() const noexcept { return cfg_.packet_size; }
  bool no_delay() const noexcept { return cfg_.no_delay; }
  std::string display_name() const { return src_ ? src_->display_name() : std::string{}; }

  PacketResult read_packet() { return read_packet(cfg_.no_delay); }
  PacketResult read_packet(bool read_partial);
  PacketResult read_packet(ReadMode mode) { return read_packet(mode == ReadMode::NoDelay); }

  // Full packets the default read mode can deliver from retained bytes and what
  // the source reports as available. Never reads.
  std::size_t packets_available() const noexcept;

  // Waits up to timeout_ms until a NoDelay read could return data or EOF.
  bool wait_readable(int timeout_ms) noexcept;

  // Byte-stream view over the same packets.
  packetio::core::Result<std::optional<std::byte>> read();
  packetio::core::Result<std::ptrdiff_t> read(std::span<std::byte> out);
  packetio::core::Result<std::size_t> skip(std::size_t n);
  std::size_t available() const noexcept;

  void close() noexcept;
  bool closed() const noexcept { return closed_; }
  bool eof() const noexcept { return closed_ || (src_eof_ && pending_left_() == 0); }

 private:
  PacketReader(std::unique_ptr<ByteSource> src, Config cfg) noexcept : src_(std::move(src)), cfg_(cfg) {}

  std::size_t pending_left_() const noexcept { return pending_.size() - pending_off_; }
  std::size_t take_pending_(std::span<std::byte> out) noexcept;
  void retain_(std::vector<std::byte> bytes) noexcept;
  packetio::core::Status fill_pending_();
  void mark_eof_() noexcept;

 private:
  std::unique_ptr<ByteSource> src_;
  Config cfg_{};

  std::vector<std::byte> pending_;
  std::size_t pending_off_ = 0;

  bool src_eof_ = false;
  bool closed_ = false;
};

} // namespace packetio::io
