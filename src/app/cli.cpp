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

#include "app/cli.hpp"
#include "app/version.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <string_view>

namespace packetio::app {

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static packetio::core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                                  std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return packetio::core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return packetio::core::Result<std::string_view>::Fail(std::string(opt) + " requires value");
  return packetio::core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static packetio::core::Result<std::size_t> read_size_value(int& i, int argc, char** argv,
                                                          std::string_view a, std::string_view opt) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return packetio::core::Result<std::size_t>::Fail(std::move(vr.st.msg));

  const std::string_view s = vr.value;
  std::size_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
    return packetio::core::Result<std::size_t>::Failf("{} expects a number, got '{}'", opt, s);
  }
  if (v == 0) return packetio::core::Result<std::size_t>::Failf("{} must be positive", opt);
  return packetio::core::Result<std::size_t>::Ok(v);
}

std::string usage_text() {
  std::string out;
  out.reserve(1024);

  out += "packetio-cat v";
  out += packetio::app::version_string();
  out += "\n\n";

  out += R"(Usage:
  packetio-cat [options] [<file> | -]

Reads the input in packets and copies them to stdout. Reads stdin when no file
(or "-") is given.

Options:
  --help, -h
  --version
  --packet-size, -p <n>        target packet size in bytes (default 1024)
  --no-delay, -n               return partial packets as soon as data arrives
  --chunk <n>                  load the input into memory and serve it in reads of at most <n> bytes
  --max-packets <n>            stop after <n> non-empty packets
  --stats                      log packet counters on exit
  --hex                        print each packet as a hex line instead of raw bytes
  --verbose, -v                enable verbose logging
  --quiet, -q                  disable logging
)";
  return out;
}

packetio::core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }

    if (a == "--no-delay" || a == "-n") { o.no_delay = true; continue; }
    if (a == "--stats") { o.stats = true; continue; }
    if (a == "--hex") { o.hex = true; continue; }

    if (a == "--verbose" || a == "-v") { spdlog::set_level(spdlog::level::debug); continue; }
    if (a == "--quiet" || a == "-q") { spdlog::set_level(spdlog::level::off); continue; }

    if (a == "-p" || is_opt(a, "--packet-size")) {
      auto vr = read_size_value(i, argc, argv, a, a == "-p" ? "-p" : "--packet-size");
      if (!vr) return packetio::core::Result<Options>::Fail(std::move(vr.st.msg));
      o.packet_size = vr.value;
      continue;
    }

    if (is_opt(a, "--chunk")) {
      auto vr = read_size_value(i, argc, argv, a, "--chunk");
      if (!vr) return packetio::core::Result<Options>::Fail(std::move(vr.st.msg));
      o.chunk = vr.value;
      continue;
    }

    if (is_opt(a, "--max-packets")) {
      auto vr = read_size_value(i, argc, argv, a, "--max-packets");
      if (!vr) return packetio::core::Result<Options>::Fail(std::move(vr.st.msg));
      o.max_packets = vr.value;
      continue;
    }

    if (a.size() > 1 && a.starts_with("-")) {
      return packetio::core::Result<Options>::Fail("Unknown option: " + std::string(a));
    }

    if (o.input) return packetio::core::Result<Options>::Fail("Only one input is supported: " + std::string(a));
    o.input = std::filesystem::path(std::string(a));
  }

  return packetio::core::Result<Options>::Ok(std::move(o));
}

} // namespace packetio::app
