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

#include "io/packet_reader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

namespace packetio::io {

packetio::core::Result<PacketReader> PacketReader::create(std::unique_ptr<ByteSource> src, Config cfg) noexcept {
  if (!src) return packetio::core::Result<PacketReader>::Fail("PacketReader: null source");
  if (cfg.packet_size == 0) {
    return packetio::core::Result<PacketReader>::Failf("PacketReader: packet size must be positive: {}",
                                                       src->display_name());
  }
  if (cfg.idle_wait_ms < 0) cfg.idle_wait_ms = 0;
  return packetio::core::Result<PacketReader>::Ok(PacketReader(std::move(src), cfg));
}

std::size_t PacketReader::take_pending_(std::span<std::byte> out) noexcept {
  const std::size_t n = std::min(out.size(), pending_left_());
  if (n) std::memcpy(out.data(), pending_.data() + pending_off_, n);
  pending_off_ += n;
  if (pending_off_ >= pending_.size()) {
    pending_.clear();
    pending_off_ = 0;
  }
  return n;
}

void PacketReader::retain_(std::vector<std::byte> bytes) noexcept {
  if (bytes.empty()) return;
  if (pending_left_()) {
    bytes.insert(bytes.end(), pending_.begin() + static_cast<std::ptrdiff_t>(pending_off_), pending_.end());
  }
  pending_ = std::move(bytes);
  pending_off_ = 0;
}

void PacketReader::mark_eof_() noexcept {
  if (!src_eof_) spdlog::debug("PacketReader: EOF from {}", src_->display_name());
  src_eof_ = true;
}

PacketResult PacketReader::read_packet(bool read_partial) {
  if (eof()) return PacketResult::Ok(std::nullopt);
  if (!src_) return PacketResult::Fail("PacketReader: no source");

  const std::size_t size = cfg_.packet_size;
  std::vector<std::byte> acc;

  if (pending_left_()) {
    acc.resize(std::min(size, pending_left_()));
    take_pending_(acc);
    if (acc.size() == size || read_partial || src_eof_) return PacketResult::Ok(Packet(std::move(acc)));
  }

  for (;;) {
    auto pr = io::read_packet(*src_, std::vector<std::byte>(size - acc.size()));
    if (!pr) {
      // Keep what was gathered so a retry sees it first.
      retain_(std::move(acc));
      return pr;
    }

    if (!pr.value) {
      mark_eof_();
      if (acc.empty()) return PacketResult::Ok(std::nullopt);
      spdlog::debug("PacketReader: short packet of {} bytes at EOF from {}", acc.size(), src_->display_name());
      return PacketResult::Ok(Packet(std::move(acc)));
    }

    const Packet& p = *pr.value;
    if (read_partial || (acc.empty() && p.size() == size)) return pr;

    acc.insert(acc.end(), p.bytes().begin(), p.bytes().end());
    if (acc.size() == size) return PacketResult::Ok(Packet(std::move(acc)));

    if (p.empty()) (void)src_->wait_readable(cfg_.idle_wait_ms);
  }
}

std::size_t PacketReader::packets_available() const noexcept {
  if (closed_) return 0;
  const std::size_t size = cfg_.packet_size;
  const std::size_t src_avail = (src_ && !src_eof_) ? src_->available() : 0;
  if (!cfg_.no_delay) return (pending_left_() + src_avail) / size;

  // NoDelay serves retained bytes on their own, so a partial remainder is never
  // topped up from the source.
  return (pending_left_() == size ? 1 : 0) + src_avail / size;
}

bool PacketReader::wait_readable(int timeout_ms) noexcept {
  if (closed_ || src_eof_ || pending_left_() || !src_) return true;
  return src_->wait_readable(timeout_ms);
}

std::size_t PacketReader::available() const noexcept {
  if (closed_) return 0;
  std::size_t n = pending_left_();
  if (src_ && !src_eof_) n += src_->available();
  return n;
}

packetio::core::Status PacketReader::fill_pending_() {
  while (!pending_left_() && !eof()) {
    PIO_TRYV(p, read_packet());
    if (!p) break;
    if (p->empty()) {
      (void)src_->wait_readable(cfg_.idle_wait_ms);
      continue;
    }
    pending_.assign(p->bytes().begin(), p->bytes().end());
    pending_off_ = 0;
  }
  return packetio::core::Status::Ok();
}

packetio::core::Result<std::optional<std::byte>> PacketReader::read() {
  PIO_TRY(fill_pending_());

  std::byte b{};
  if (!take_pending_(std::span<std::byte>(&b, 1))) return packetio::core::Result<std::optional<std::byte>>::Ok(std::nullopt);
  return packetio::core::Result<std::optional<std::byte>>::Ok(b);
}

packetio::core::Result<std::ptrdiff_t> PacketReader::read(std::span<std::byte> out) {
  if (out.empty()) return packetio::core::Result<std::ptrdiff_t>::Ok(0);
  PIO_TRY(fill_pending_());

  const std::size_t n = take_pending_(out);
  if (!n) return packetio::core::Result<std::ptrdiff_t>::Ok(kEndOfStream);
  return packetio::core::Result<std::ptrdiff_t>::Ok(static_cast<std::ptrdiff_t>(n));
}

packetio::core::Result<std::size_t> PacketReader::skip(std::size_t n) {
  std::size_t skipped = 0;
  while (skipped < n) {
    PIO_TRY(fill_pending_());
    if (!pending_left_()) break;

    const std::size_t step = std::min(n - skipped, pending_left_());
    pending_off_ += step;
    if (pending_off_ >= pending_.size()) {
      pending_.clear();
      pending_off_ = 0;
    }
    skipped += step;
  }
  return packetio::core::Result<std::size_t>::Ok(skipped);
}

void PacketReader::close() noexcept {
  pending_.clear();
  pending_off_ = 0;
  if (closed_) return;
  spdlog::debug("PacketReader: close {}", display_name());
  closed_ = true;
  if (src_) src_->close();
}

} // namespace packetio::io
