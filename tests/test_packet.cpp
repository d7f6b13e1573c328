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

#include "core/bytes.hpp"
#include "io/packet.hpp"
#include "scripted_source.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

using packetio::core::to_string;
using packetio::io::Packet;
using packetio::io::read_packet;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

// ----- full read: the destination buffer is handed back -----

static void test_full_read_adopts_buffer() {
  ScriptedSource src({ScriptedSource::data("0123456789")});
  std::vector<std::byte> buf(10);
  const std::byte* before = buf.data();

  auto r = read_packet(src, std::move(buf));
  check("full_read_ok", static_cast<bool>(r));
  check("full_read_has_packet", r.value.has_value());
  check("full_read_same_buffer", r.value->data() == before);
  check("full_read_size", r.value->size() == 10);
  check("full_read_content", to_string(r.value->bytes()) == "0123456789");
  check("full_read_one_attempt", src.reads() == 1);
}

// ----- short read: right-sized copy -----

static void test_short_read_shrinks() {
  ScriptedSource src({ScriptedSource::data("abcd"), ScriptedSource::data("efgh")});
  auto r = read_packet(src, std::vector<std::byte>(10));
  check("short_read_ok", static_cast<bool>(r));
  check("short_read_has_packet", r.value.has_value());
  check("short_read_size", r.value->size() == 4);
  check("short_read_content", to_string(r.value->bytes()) == "abcd");
  check("short_read_not_empty_packet", !r.value->shares_buffer_with(Packet::empty_packet()));
  // One attempt only, even though more data was ready.
  check("short_read_one_attempt", src.reads() == 1);
}

static void test_short_reads_are_distinct() {
  ScriptedSource src({ScriptedSource::data("ab"), ScriptedSource::data("cd")});
  auto a = read_packet(src, std::vector<std::byte>(8));
  auto b = read_packet(src, std::vector<std::byte>(8));
  check("distinct_ok", a && b && a.value && b.value);
  check("distinct_buffers", !a.value->shares_buffer_with(*b.value));
  check("distinct_content", to_string(a.value->bytes()) == "ab" && to_string(b.value->bytes()) == "cd");
}

// ----- zero bytes: canonical empty packet -----

static void test_zero_read_is_canonical_empty() {
  ScriptedSource src({ScriptedSource::idle(), ScriptedSource::idle()});
  auto a = read_packet(src, std::vector<std::byte>(10));
  auto b = read_packet(src, std::vector<std::byte>(3));
  check("zero_read_ok", a && b);
  check("zero_read_not_eof", a.value.has_value() && b.value.has_value());
  check("zero_read_len0", a.value->empty() && a.value->size() == 0);
  check("zero_read_shared", a.value->shares_buffer_with(Packet::empty_packet()));
  check("zero_read_shared_across_calls", a.value->shares_buffer_with(*b.value));
}

// ----- EOF and failures -----

static void test_eof_is_no_packet() {
  ScriptedSource src({ScriptedSource::eof()});
  auto r = read_packet(src, std::vector<std::byte>(10));
  check("eof_ok", static_cast<bool>(r));
  check("eof_no_packet", !r.value.has_value());
}

static void test_error_propagates_unchanged() {
  ScriptedSource src({ScriptedSource::error("device unplugged")});
  auto r = read_packet(src, std::vector<std::byte>(10));
  check("error_failed", !r);
  check("error_message", r.st.msg == "device unplugged");
}

// The primitive only traces failures; callers decide how loudly to report them.
static void test_error_logged_at_debug_only() {
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
  auto capture = std::make_shared<spdlog::logger>("capture", sink);
  const auto prev = spdlog::default_logger();
  spdlog::set_default_logger(capture);

  capture->set_level(spdlog::level::info);
  ScriptedSource quiet({ScriptedSource::error("device unplugged")});
  auto a = read_packet(quiet, std::vector<std::byte>(4));
  const bool silent = sink->last_formatted().empty();

  capture->set_level(spdlog::level::debug);
  ScriptedSource traced({ScriptedSource::error("device unplugged")});
  auto b = read_packet(traced, std::vector<std::byte>(4));
  const auto lines = sink->last_formatted();

  spdlog::set_default_logger(prev);

  check("error_log_failed", !a && !b);
  check("error_log_silent_at_info", silent);
  check("error_log_traced_at_debug",
        lines.size() == 1 && lines[0].find("device unplugged") != std::string::npos);
}

static void test_empty_destination_skips_source() {
  ScriptedSource src({ScriptedSource::data("abc")});
  auto r = read_packet(src, {});
  check("empty_dest_ok", r && r.value.has_value());
  check("empty_dest_len0", r.value->empty());
  check("empty_dest_no_read", src.reads() == 0);
}

static void test_exact_fill_then_eof() {
  ScriptedSource src({ScriptedSource::data("xyz")});
  auto a = read_packet(src, std::vector<std::byte>(3));
  auto b = read_packet(src, std::vector<std::byte>(3));
  check("exact_fill_full", a && a.value && a.value->size() == 3);
  check("exact_fill_then_eof", b && !b.value);
}

int main() {
  test_full_read_adopts_buffer();
  test_short_read_shrinks();
  test_short_reads_are_distinct();
  test_zero_read_is_canonical_empty();
  test_eof_is_no_packet();
  test_error_propagates_unchanged();
  test_error_logged_at_debug_only();
  test_empty_destination_skips_source();
  test_exact_fill_then_eof();

  std::fprintf(stdout, "packet: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
