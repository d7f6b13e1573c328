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

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace packetio::app {

struct Options {
    bool help = false;
    bool version = false;

    std::size_t packet_size = packetio::io::kDefaultPacketSize;
    bool no_delay = false;

    std::size_t chunk = 0; // > 0: load input into memory and serve it in chunks of this size
    std::optional<std::size_t> max_packets;

    bool stats = false;
    bool hex = false;

    std::optional<std::filesystem::path> input; // unset or "-" = stdin
};

packetio::core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace packetio::app
