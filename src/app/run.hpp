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

#include "app/cli.hpp"
#include "core/status.hpp"
#include "io/packet_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace packetio::app {

enum class RunResult : int {
  Success = 0,
  ReadError = 1,
  WriteError = 2,
  InputError = 3,
};

struct PumpStats {
  std::size_t packets = 0; // non-empty packets written
  std::size_t full = 0;
  std::size_t short_ = 0;
  std::size_t empty = 0;
  std::uint64_t bytes = 0;
};

struct PumpOptions {
  bool hex = false;
  std::optional<std::size_t> max_packets;
};

// Copies packets from reader to out until EOF (or max_packets). Stats are
// updated as packets go by, so they are meaningful on failure too.
packetio::core::Status pump(packetio::io::PacketReader& reader, std::ostream& out,
                            const PumpOptions& po, PumpStats& stats);

RunResult run(const Options& opt);

// Process exit status: 0 on success, 1 for every kind of failure.
int exit_code(RunResult r) noexcept;

} // namespace packetio::app
