#include "internal/notify/wire.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using eventlog::notify::FormatPayload;
using eventlog::notify::ParsePayload;

void TestParsesStreamAndPosition() {
  auto raw = ParsePayload("run-abc_42");
  assert(raw.has_value());
  assert(raw->stream_id == "run-abc");
  assert(raw->position == 42);
}

void TestSplitsOnLastDelimiter() {
  auto raw = ParsePayload("my_run_id_7");
  assert(raw.has_value());
  assert(raw->stream_id == "my_run_id");
  assert(raw->position == 7);
}

void TestPositionZeroIsValid() {
  auto raw = ParsePayload("r_0");
  assert(raw.has_value());
  assert(raw->position == 0);
}

void TestRejectsMalformedPayloads() {
  assert(!ParsePayload("").has_value());
  assert(!ParsePayload("no-delimiter").has_value());
  assert(!ParsePayload("_5").has_value());
  assert(!ParsePayload("run_").has_value());
  assert(!ParsePayload("bad_payload_xyz").has_value());
  assert(!ParsePayload("run_-3").has_value());
  assert(!ParsePayload("run_+3").has_value());
  assert(!ParsePayload("run_ 3").has_value());
  assert(!ParsePayload("run_3 ").has_value());
  assert(!ParsePayload("run_0x10").has_value());
  assert(!ParsePayload("run_1.5").has_value());
}

void TestRejectsPositionOverflow() {
  assert(ParsePayload("run_18446744073709551615").has_value());
  assert(!ParsePayload("run_18446744073709551616").has_value());
}

void TestFormatMatchesParser() {
  assert(FormatPayload("run_with_underscores", 1234) == "run_with_underscores_1234");

  auto raw = ParsePayload(FormatPayload("run_with_underscores", 1234));
  assert(raw.has_value());
  assert(raw->stream_id == "run_with_underscores");
  assert(raw->position == 1234);
}

} // namespace

int main() {
  TestParsesStreamAndPosition();
  TestSplitsOnLastDelimiter();
  TestPositionZeroIsValid();
  TestRejectsMalformedPayloads();
  TestRejectsPositionOverflow();
  TestFormatMatchesParser();

  std::cout << "eventlog_unit_notification_wire: pass\n";
  return 0;
}
