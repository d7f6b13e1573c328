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

#include "app/run.hpp"

#include "core/bytes.hpp"
#include "io/source.hpp"
#include "platform/posix-common/fd_source.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <signal.h>

#include <spdlog/spdlog.h>

namespace packetio::app {

using SourceResult = packetio::core::Result<std::unique_ptr<packetio::io::ByteSource>>;

static constexpr int kIdleWaitMs = 50;

static bool is_stdin(const Options& opt) {
  return !opt.input || opt.input->string() == "-";
}

struct File {
  using ByteArray = std::vector<std::byte>;
  static constexpr std::uint64_t kMax = 256ull * 1024ull * 1024ull;

  static packetio::core::Result<ByteArray> read_all(const std::filesystem::path& p) noexcept {
    std::error_code ec;
    const auto sz = std::filesystem::file_size(p, ec);
    if (ec) return packetio::core::Result<ByteArray>::Failf("Cannot stat file: {}", p.string());
    if (static_cast<std::uint64_t>(sz) > kMax) return packetio::core::Result<ByteArray>::Failf("File too large: {}", p.string());

    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return packetio::core::Result<ByteArray>::Failf("Cannot open file: {}", p.string());

    ByteArray buf(static_cast<std::size_t>(sz));
    if (!buf.empty()) {
      in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
      if (!in.good()) return packetio::core::Result<ByteArray>::Failf("Read failed: {}", p.string());
    }
    return packetio::core::Result<ByteArray>::Ok(std::move(buf));
  }

  static packetio::core::Result<ByteArray> read_stdin() noexcept {
    const std::string s{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    if (std::cin.bad()) return packetio::core::Result<ByteArray>::Fail("Read failed: <stdin>");
    if (s.size() > kMax) return packetio::core::Result<ByteArray>::Fail("Input too large: <stdin>");
    return packetio::core::Result<ByteArray>::Ok(packetio::core::to_vector(s));
  }
};

static SourceResult open_input(const Options& opt) {
  if (opt.chunk) {
    auto data = is_stdin(opt) ? File::read_stdin() : File::read_all(*opt.input);
    if (!data) return SourceResult::Fail(std::move(data.st.msg));

    const std::string name = is_stdin(opt) ? std::string("<stdin>") : opt.input->string();
    spdlog::debug("Loaded {} bytes from {}, serving in chunks of {}", data.value.size(), name, opt.chunk);
    return SourceResult::Ok(std::make_unique<packetio::io::MemorySource>(
        std::move(data.value), packetio::io::MemorySource::Options{.chunk = opt.chunk}, name));
  }

  if (is_stdin(opt)) return packetio::posix_common::open_stdin();
  return packetio::io::open_raw_file(*opt.input);
}

packetio::core::Status pump(packetio::io::PacketReader& reader, std::ostream& out,
                            const PumpOptions& po, PumpStats& stats) {
  while (!po.max_packets || stats.packets < *po.max_packets) {
    auto pr = reader.read_packet();
    if (!pr) return packetio::core::Status::Fail(std::move(pr.st.msg));
    if (!pr.value) break;

    const packetio::io::Packet& p = *pr.value;
    if (p.empty()) {
      ++stats.empty;
      (void)reader.wait_readable(kIdleWaitMs);
      continue;
    }

    ++stats.packets;
    if (p.size() == reader.packet_size()) ++stats.full;
    else ++stats.short_;
    stats.bytes += p.size();

    if (po.hex) {
      out << packetio::core::to_hex(p.bytes()) << '\n';
    } else {
      const auto c = packetio::core::chars(p.bytes());
      out.write(c.data(), static_cast<std::streamsize>(c.size()));
    }
    if (!out.good()) return packetio::core::Status::Fail("Write failed: output stream");
  }

  out.flush();
  if (!out.good()) return packetio::core::Status::Fail("Write failed: output stream");
  return packetio::core::Status::Ok();
}

RunResult run(const Options& opt) {
  ::signal(SIGPIPE, SIG_IGN);

  auto src = open_input(opt);
  if (!src) {
    spdlog::error("{}", src.st.msg);
    return RunResult::InputError;
  }

  packetio::io::PacketReader::Config cfg;
  cfg.packet_size = opt.packet_size;
  cfg.no_delay = opt.no_delay;
  cfg.idle_wait_ms = kIdleWaitMs;

  auto rr = packetio::io::PacketReader::create(std::move(src.value), cfg);
  if (!rr) {
    spdlog::error("{}", rr.st.msg);
    return RunResult::InputError;
  }
  auto& reader = rr.value;

  spdlog::debug("Reading {} (packet size {}, {})", reader.display_name(), reader.packet_size(),
                reader.no_delay() ? "no-delay" : "blocking");

  PumpStats stats;
  const PumpOptions po{.hex = opt.hex, .max_packets = opt.max_packets};
  const auto st = pump(reader, std::cout, po, stats);
  reader.close();

  if (opt.stats) {
    spdlog::info("packets={} full={} short={} empty={} bytes={}",
                 stats.packets, stats.full, stats.short_, stats.empty, stats.bytes);
  }

  if (!st) {
    spdlog::error("{}", st.msg);
    return std::cout.good() ? RunResult::ReadError : RunResult::WriteError;
  }
  return RunResult::Success;
}

int exit_code(RunResult r) noexcept {
  return r == RunResult::Success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace packetio::app
