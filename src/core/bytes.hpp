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
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace packetio::core {

inline std::span<const std::byte> bytes(const std::byte* p, std::size_t n) { return {p, n}; }
inline std::span<std::byte> bytes(std::byte* p, std::size_t n) { return {p, n}; }

inline std::span<const std::byte> bytes(std::string_view s) {
  return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

inline std::span<const char> chars(std::span<const std::byte> s) {
  return {reinterpret_cast<const char*>(s.data()), s.size()};
}

inline std::vector<std::byte> to_vector(std::string_view s) {
  const auto b = bytes(s);
  return {b.begin(), b.end()};
}

inline std::string to_string(std::span<const std::byte> s) {
  const auto c = chars(s);
  return {c.begin(), c.end()};
}

inline std::string to_hex(std::span<const std::byte> s) {
  static constexpr char lut[] = "0123456789abcdef";
  std::string out(s.size() * 2, '\0');
  for (std::size_t i = 0; i < s.size(); ++i) {
    const auto b = static_cast<unsigned char>(s[i]);
    out[2 * i + 0] = lut[(b >> 4) & 0x0F];
    out[2 * i + 1] = lut[b & 0x0F];
  }
  return out;
}

} // namespace packetio::core
