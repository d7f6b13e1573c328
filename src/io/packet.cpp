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

#include "io/packet.hpp"

#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

namespace packetio::io {

const Packet& Packet::empty_packet() noexcept {
  static const Packet p;
  return p;
}

PacketResult read_packet(ByteSource& src, std::vector<std::byte> packet) {
  if (packet.empty()) return PacketResult::Ok(Packet::empty_packet());

  auto rr = src.read(packet);
  if (!rr) {
    spdlog::debug("read_packet: {}: {}", src.display_name(), rr.st.msg);
    return PacketResult::Fail(std::move(rr.st.msg));
  }

  const std::ptrdiff_t n = rr.value;
  if (n < 0) return PacketResult::Ok(std::nullopt);
  if (n == 0) return PacketResult::Ok(Packet::empty_packet());

  const auto len = static_cast<std::size_t>(n);
  if (len > packet.size()) {
    return PacketResult::Failf("read_packet: {}: source reported {} bytes for a {} byte buffer",
                               src.display_name(), len, packet.size());
  }
  if (len == packet.size()) return PacketResult::Ok(Packet(std::move(packet)));

  // shrink buffer for output
  std::vector<std::byte> shrunk(len);
  std::memcpy(shrunk.data(), packet.data(), len);
  return PacketResult::Ok(Packet(std::move(shrunk)));
}

} // namespace packetio::io
