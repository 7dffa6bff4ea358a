#pragma once

#include <cstdint>
#include <string>

namespace eventlog::db::model {

/*
  One row of the event log.

  position is assigned by the store on append and is unique across all runs;
  within a run it is strictly increasing.
*/
struct EventRecord {
  uint64_t    position = 0;
  std::string run_id;
  std::string event_type;
  int64_t     timestamp_ms = 0;
  std::string body; // JSON document
};

}
