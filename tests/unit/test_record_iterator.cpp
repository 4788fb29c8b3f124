#include "limit_reader/limit_reader.hpp"
#include "limit_reader/memory_source.hpp"
#include "scripted_source.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

static int failures = 0;

static void check(bool cond, const char* what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::string str(const lr::Record& r) { return std::string(r.bytes.begin(), r.bytes.end()); }

static lr::Split split_of(std::string data, std::uint8_t delim, std::size_t max, std::size_t chunk = 0) {
  lr::MemorySource::Config cfg;
  cfg.chunk_bytes = chunk;
  lr::LimitReader r(std::make_unique<lr::MemorySource>(std::move(data), cfg));
  return std::move(r).split(delim, max);
}

static void second_record_over_bound() {
  std::string data(10, '\x01');
  data[3] = ';';
  data[8] = ';';
  auto it = split_of(data, ';', 4);
  lr::Record rec;

  check(it.next(rec) && rec.ok(), "bound: first record ok");
  check(rec.bytes == std::vector<std::uint8_t>{1, 1, 1}, "bound: delimiter trimmed");

  check(it.next(rec) && !rec.ok(), "bound: second record is an error");
  check(rec.error == lr::ScanErrc::size_exceeded, "bound: size_exceeded");
  check(rec.bytes.empty(), "bound: error item carries no bytes");

  check(!it.next(rec), "bound: sequence ends after the error");
  check(it.exhausted(), "bound: exhausted");
  check(!it.next(rec), "bound: stays ended");
}

static void records_and_trailing_piece() {
  auto it = split_of("a;b;;c", ';', 16, 2);
  std::vector<std::string> got;
  lr::Record rec;
  while (it.next(rec)) {
    check(rec.ok(), "records: all ok");
    got.push_back(str(rec));
  }
  check(got == std::vector<std::string>{"a", "b", "", "c"}, "records: empty and unterminated records kept");
}

static void no_empty_record_after_final_delimiter() {
  auto it = split_of("a;b;", ';', 16);
  std::size_t n = it.for_each([&](const lr::Record& r) { return r.ok(); });
  check(n == 2, "final delimiter: two records");
}

static void empty_source_ends_at_once() {
  auto it = split_of("", ';', 16);
  lr::Record rec;
  check(!it.next(rec), "empty: no items");
}

static void source_failure_is_terminal() {
  lr::LimitReader r(std::make_unique<ScriptedSource>(std::vector<ScriptedSource::Step>{
      ScriptedSource::chunk("a;b"),
      ScriptedSource::fail(std::errc::io_error),
      ScriptedSource::chunk("c;")}));
  auto it = std::move(r).split(';', 16);
  lr::Record rec;
  check(it.next(rec) && str(rec) == "a", "failure: record before the failure");
  check(it.next(rec) && rec.error == std::errc::io_error, "failure: one error item");
  check(!it.next(rec), "failure: nothing after the error");
}

static void stop_early_and_release() {
  auto it = split_of("x;y;z;", ';', 16);
  std::size_t n = it.for_each([&](const lr::Record& r) { return str(r) != "x"; });
  check(n == 1, "early stop: callback saw one record");

  auto src = it.release();
  auto* mem = static_cast<lr::MemorySource*>(src.get());
  check(mem && mem->position() == 2, "release: cursor after last completed step");
  lr::Record rec;
  check(!it.next(rec), "release: sequence over");

  lr::LimitReader back(std::move(src));
  std::vector<std::uint8_t> out;
  std::error_code ec;
  check(back.read_until(';', out, 16, ec) == 2 && !ec, "release: reader resumes at y");
}

static void split_consumes_reader() {
  lr::LimitReader r(std::make_unique<lr::MemorySource>(std::string("a;")));
  auto it = std::move(r).split(';', 4);
  std::vector<std::uint8_t> out;
  std::error_code ec;
  check(r.source() == nullptr, "consumed reader: no source left");
  check(r.read_until(';', out, 4, ec) == 0 && ec == lr::ScanErrc::no_source, "consumed reader: no_source");
  lr::Record rec;
  check(it.next(rec) && str(rec) == "a", "consumed reader: sequence owns the source");
}

int main() {
  second_record_over_bound();
  records_and_trailing_piece();
  no_empty_record_after_final_delimiter();
  empty_source_ends_at_once();
  source_failure_is_terminal();
  stop_early_and_release();
  split_consumes_reader();

  if (failures) { std::cerr << "[FAIL] record_iterator: " << failures << " check(s)\n"; return 1; }
  std::cout << "[PASS] record_iterator\n";
  return 0;
}
