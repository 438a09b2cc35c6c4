#include "simb/bridge/response_writer.h"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace simb::bridge;
using json = nlohmann::json;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

TEST_CASE("encode_frame writes one compact line", "[writer]") {
  const std::string line = encode_frame(json{{"text", "two\nlines"}, {"n", 1}});
  CHECK(line.back() == '\n');
  CHECK(line.find('\n') == line.size() - 1);
  CHECK(json::parse(line)["text"] == "two\nlines");
}

TEST_CASE("encode_frame escapes non-ASCII and survives invalid UTF-8", "[writer]") {
  const std::string accented = encode_frame(json("caf\xc3\xa9"));
  CHECK(accented == "\"caf\\u00e9\"\n");

  const std::string invalid = encode_frame(json(std::string("bad\xff")));
  CHECK(invalid.back() == '\n');
  CHECK_NOTHROW(json::parse(invalid));
}

TEST_CASE("ResponseWriter writes results, errors and notifications", "[writer]") {
  std::ostringstream out;
  ResponseWriter writer(out);

  CHECK(writer.write_result(1, json{{"success", true}}));
  CHECK(writer.write_error(nullptr, -32700, "Parse error: x"));
  CHECK(writer.write_notification("network_status_changed", json{{"tor_status", "connected"}}));

  const auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 3);
  CHECK(json::parse(lines[0])["result"]["success"] == true);
  CHECK(json::parse(lines[1])["error"]["code"] == -32700);
  const json note = json::parse(lines[2]);
  CHECK(note["method"] == "network_status_changed");
  CHECK_FALSE(note.contains("id"));
}

TEST_CASE("ResponseWriter reports a failed stream", "[writer]") {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  ResponseWriter writer(out);
  CHECK_FALSE(writer.write_result(1, json::object()));
}

TEST_CASE("ResponseWriter never interleaves concurrent writes", "[writer][concurrency]") {
  std::ostringstream out;
  ResponseWriter writer(out);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 200;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&writer, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const json params{{"thread", t}, {"i", i}, {"pad", std::string(64, 'x')}};
        (void)writer.write_notification("tick", params);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto lines = lines_of(out.str());
  REQUIRE(lines.size() == kThreads * kPerThread);
  for (const auto& line : lines) {
    const json parsed = json::parse(line);
    CHECK(parsed["method"] == "tick");
  }
}
