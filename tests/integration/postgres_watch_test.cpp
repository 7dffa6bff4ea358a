#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/model/event_record.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/notify/pg_notification_source.hpp"
#include "internal/storage/event_log_storage.hpp"
#include "internal/util/errors.hpp"

namespace {

using eventlog::db::model::EventRecord;
using eventlog::storage::EventLogStorage;
using eventlog::watch::MakeCallback;
using namespace std::chrono_literals;

class Recorder {
 public:
  void Add(uint64_t position) {
    std::lock_guard lock(mutex_);
    positions_.push_back(position);
  }

  std::vector<uint64_t> Positions() const {
    std::lock_guard lock(mutex_);
    return positions_;
  }

 private:
  mutable std::mutex    mutex_;
  std::vector<uint64_t> positions_;
};

template <typename Predicate>
bool WaitUntil(Predicate predicate, std::chrono::milliseconds timeout = 10s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

EventRecord MakeEvent(const std::string& run_id, const std::string& type) {
  EventRecord record;
  record.run_id     = run_id;
  record.event_type = type;
  record.body       = R"({"source":"postgres_watch_test"})";
  return record;
}

std::unique_ptr<EventLogStorage> MakeStorage(const std::string& uri, eventlog::watch::WatchLoopOptions options = {}) {
  auto pool = std::make_shared<eventlog::db::postgres::PgPool>(uri);
  pool->Bootstrap();
  auto repository = std::make_shared<eventlog::db::postgres::PgRepository>(std::move(pool));
  auto source     = std::make_shared<eventlog::notify::PgNotificationSource>(uri, 50ms);
  return std::make_unique<EventLogStorage>(std::move(repository), std::move(source), std::move(options));
}

void VerifyNotifyDeliversCommittedEvents(const std::string& uri) {
  const auto run_id = "pg-watch-" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count());

  auto consumer = MakeStorage(uri);
  auto producer = MakeStorage(uri);

  Recorder from_start;
  Recorder from_third;
  consumer->Watch(run_id, 0, MakeCallback([&](const EventRecord& r) { from_start.Add(r.position); }));

  // stored right after Watch() returns: LISTEN is already in place
  const auto p1 = producer->StoreEvent(MakeEvent(run_id, "STEP_START"));
  const auto p2 = producer->StoreEvent(MakeEvent(run_id, "STEP_OUTPUT"));
  consumer->Watch(run_id, p2 + 1, MakeCallback([&](const EventRecord& r) { from_third.Add(r.position); }));
  const auto p3 = producer->StoreEvent(MakeEvent(run_id, "STEP_SUCCESS"));

  assert(WaitUntil([&] { return from_start.Positions() == std::vector<uint64_t>{p1, p2, p3}; }));
  assert(WaitUntil([&] { return from_third.Positions() == std::vector<uint64_t>{p3}; }));

  const auto started = std::chrono::steady_clock::now();
  consumer->Dispose();
  assert(std::chrono::steady_clock::now() - started < 2s);

  producer->DeleteRun(run_id);
}

void VerifyConnectTimeoutIsAdded() {
  using eventlog::notify::WithConnectTimeout;

  assert(WithConnectTimeout("postgresql://events@db/events", 5s) == "postgresql://events@db/events?connect_timeout=5");
  assert(WithConnectTimeout("postgres://db/events?sslmode=disable", 3s) == "postgres://db/events?sslmode=disable&connect_timeout=3");
  assert(WithConnectTimeout("host=db dbname=events", 5s) == "host=db dbname=events connect_timeout=5");
  assert(WithConnectTimeout("", 2s) == "connect_timeout=2");
  assert(WithConnectTimeout("postgresql://db/events?connect_timeout=1", 5s) == "postgresql://db/events?connect_timeout=1");
}

void VerifyUnreachableServerIsTransportFailure() {
  eventlog::notify::PgNotificationSource source("postgresql://127.0.0.1:1/none?connect_timeout=1", 50ms);
  auto                                   stop  = std::make_shared<eventlog::notify::StopSignal>();
  bool                                   threw = false;
  try {
    (void)source.Subscribe("run_events", stop);
  } catch (const eventlog::util::TransportFailure&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  VerifyConnectTimeoutIsAdded();

  const char* uri = std::getenv("EVENTLOG_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    std::cout << "skipping postgres watch test: EVENTLOG_TEST_POSTGRES_URI is not set\n";
    return 0;
  }

  VerifyNotifyDeliversCommittedEvents(uri);
  VerifyUnreachableServerIsTransportFailure();

  std::cout << "eventlog_integration_postgres_watch: pass\n";
  return 0;
}
