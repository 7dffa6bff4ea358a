#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/watch/watcher.hpp"

using eventlog::db::model::EventRecord;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  eventlogctl [--config <config.yaml>] tail <run_id> [cursor]\n"
            << "  eventlogctl [--config <config.yaml>] append <run_id> <event_type> <json>\n"
            << "  eventlogctl [--config <config.yaml>] history <run_id> [cursor]\n";
}

static std::optional<uint64_t> ParseCursor(const std::string& value) {
  uint64_t cursor = 0;
  auto [ptr, ec]  = std::from_chars(value.data(), value.data() + value.size(), cursor);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return cursor;
}

static void PrintEvent(const EventRecord& record) {
  std::cout << record.position << "\t" << record.run_id << "\t" << record.event_type << "\t" << record.timestamp_ms << "\t"
            << record.body << std::endl;
}

static int Tail(eventlog::storage::EventLogStorage& storage, const std::string& run_id, uint64_t cursor) {
  auto callback = eventlog::watch::MakeCallback(PrintEvent);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  storage.Watch(run_id, cursor, callback);
  EVENTLOG_LOG_INFO("tailing run", {eventlog::observability::StringField("run_id", run_id),
                                    eventlog::observability::IntField("cursor", static_cast<int64_t>(cursor))});

  while (g_running && storage.EventWatcher().LoopAlive()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  const bool loop_alive = storage.EventWatcher().LoopAlive();
  storage.EndWatch(run_id, callback);
  storage.Dispose();

  if (!loop_alive) {
    std::cerr << "notification channel lost" << std::endl;
    return 3;
  }
  return 0;
}

static int History(eventlog::storage::EventLogStorage& storage, const std::string& run_id, uint64_t cursor) {
  for (const auto& record : storage.GetEvents(run_id, cursor)) {
    PrintEvent(record);
  }
  return 0;
}

static int Append(eventlog::storage::EventLogStorage& storage, const std::string& run_id, const std::string& event_type,
                  const std::string& body) {
  EventRecord record;
  record.run_id     = run_id;
  record.event_type = event_type;
  record.body       = body;

  std::cout << storage.StoreEvent(std::move(record)) << std::endl;
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.size() < 2) {
    Usage();
    return 1;
  }

  const std::string& cmd    = args[0];
  const std::string& run_id = args[1];

  uint64_t cursor = 0;
  if ((cmd == "tail" || cmd == "history") && args.size() == 3) {
    auto parsed = ParseCursor(args[2]);
    if (!parsed) {
      std::cerr << "invalid cursor: '" << args[2] << "'" << std::endl;
      return 1;
    }
    cursor = *parsed;
  }

  int rc = 0;
  try {
    auto config = config_path.empty() ? eventlog::config::ConfigLoader::Defaults() : eventlog::config::ConfigLoader::LoadFromYaml(config_path);

    eventlog::observability::InitializeMetrics(config);
    eventlog::observability::InitializeLogging(config);

    auto runtime = eventlog::factory::Build(config);

    if (cmd == "tail" && args.size() <= 3) {
      rc = Tail(*runtime.storage, run_id, cursor);
    } else if (cmd == "history" && args.size() <= 3) {
      rc = History(*runtime.storage, run_id, cursor);
    } else if (cmd == "append" && args.size() == 4) {
      rc = Append(*runtime.storage, run_id, args[2], args[3]);
    } else {
      Usage();
      rc = 1;
    }
  } catch (const std::exception& e) {
    EVENTLOG_LOG_ERROR("Fatal error", {eventlog::observability::StringField("error", e.what())});
    rc = 2;
  }

  eventlog::observability::ShutdownLogging();
  eventlog::observability::ShutdownMetrics();
  return rc;
}
