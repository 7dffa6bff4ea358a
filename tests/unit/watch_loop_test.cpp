#include "internal/watch/watch_loop.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/notify/local_hub.hpp"
#include "internal/notify/stop_signal.hpp"
#include "watch_test_support.hpp"

namespace {

using eventlog::db::model::EventRecord;
using eventlog::notify::LocalNotificationHub;
using eventlog::notify::StopSignal;
using eventlog::testing::FakeRecordFetcher;
using eventlog::testing::Recorder;
using eventlog::testing::WaitForListener;
using eventlog::testing::WaitUntil;
using eventlog::watch::DispatchOutcome;
using eventlog::watch::MakeCallback;
using eventlog::watch::SubscriberRegistry;
using eventlog::watch::WatchLoop;
using eventlog::watch::WatchLoopOptions;
using namespace std::chrono_literals;

struct Fixture {
  std::shared_ptr<LocalNotificationHub> hub      = std::make_shared<LocalNotificationHub>(20ms);
  std::shared_ptr<SubscriberRegistry>   registry = std::make_shared<SubscriberRegistry>();
  std::shared_ptr<FakeRecordFetcher>    fetcher  = std::make_shared<FakeRecordFetcher>();
  std::shared_ptr<StopSignal>           stop     = std::make_shared<StopSignal>();

  WatchLoop MakeLoop(WatchLoopOptions options = {}) {
    return WatchLoop(hub, registry, fetcher, std::move(options), stop);
  }
};

void TestMalformedPayloadIsDiscarded() {
  Fixture  f;
  Recorder seen;
  f.registry->Add("bad_payload", 0, MakeCallback([&](const EventRecord& r) { seen.Add(r.position); }));

  auto loop = f.MakeLoop();
  assert(loop.HandlePayload("bad_payload_xyz") == DispatchOutcome::kMalformed);
  assert(loop.HandlePayload("nodelimiter") == DispatchOutcome::kMalformed);
  assert(f.fetcher->Fetches() == 0);
  assert(seen.Size() == 0);
}

void TestUnwatchedStreamIsNotFetched() {
  Fixture f;
  f.fetcher->Put("r2", 4);

  auto loop = f.MakeLoop();
  assert(loop.HandlePayload("r2_4") == DispatchOutcome::kUnwatched);
  assert(f.fetcher->Fetches() == 0);
}

void TestOneFetchPerNotificationRegardlessOfFanOut() {
  Fixture  f;
  Recorder a, b, c;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { a.Add(r.position); }));
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { b.Add(r.position); }));
  f.registry->Add("r1", 3, MakeCallback([&](const EventRecord& r) { c.Add(r.position); }));
  f.fetcher->Put("r1", 3);

  auto loop = f.MakeLoop();
  assert(loop.HandlePayload("r1_3") == DispatchOutcome::kDispatched);
  assert(f.fetcher->Fetches() == 1);
  assert(a.Positions() == std::vector<uint64_t>{3});
  assert(b.Positions() == std::vector<uint64_t>{3});
  assert(c.Positions() == std::vector<uint64_t>{3});
}

void TestCursorFiltersPerSubscription() {
  Fixture  f;
  Recorder from_zero, from_ten;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { from_zero.Add(r.position); }));
  f.registry->Add("r1", 10, MakeCallback([&](const EventRecord& r) { from_ten.Add(r.position); }));
  f.fetcher->Put("r1", 10);
  f.fetcher->Put("r1", 9);

  auto loop = f.MakeLoop();
  loop.HandlePayload("r1_10");
  loop.HandlePayload("r1_9");

  assert((from_zero.Positions() == std::vector<uint64_t>{10, 9}));
  assert(from_ten.Positions() == std::vector<uint64_t>{10});
}

void TestDeliveryFollowsRegistrationOrder() {
  Fixture          f;
  std::vector<int> order;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord&) { order.push_back(1); }));
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord&) { order.push_back(2); }));
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord&) { order.push_back(3); }));
  f.fetcher->Put("r1", 1);

  auto loop = f.MakeLoop();
  loop.HandlePayload("r1_1");
  assert((order == std::vector<int>{1, 2, 3}));
}

void TestMissingRecordIsANoOp() {
  Fixture  f;
  Recorder seen;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { seen.Add(r.position); }));

  auto loop = f.MakeLoop();
  assert(loop.HandlePayload("r1_77") == DispatchOutcome::kNotFound);
  assert(f.fetcher->Fetches() == 1);
  assert(seen.Size() == 0);
}

void TestFetchErrorSkipsOnlyThatNotification() {
  Fixture  f;
  Recorder seen;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { seen.Add(r.position); }));
  f.fetcher->Put("r1", 1);
  f.fetcher->Put("r1", 2);

  auto loop = f.MakeLoop();
  f.fetcher->FailFetches(true);
  assert(loop.HandlePayload("r1_1") == DispatchOutcome::kFetchError);
  f.fetcher->FailFetches(false);
  assert(loop.HandlePayload("r1_2") == DispatchOutcome::kDispatched);
  assert(seen.Positions() == std::vector<uint64_t>{2});
}

void TestThrowingCallbackDoesNotStarveOthers() {
  Fixture  f;
  Recorder after;
  f.registry->Add("r1", 0, MakeCallback([](const EventRecord&) { throw std::runtime_error("subscriber bug"); }));
  f.registry->Add("r1", 0, MakeCallback([](const EventRecord&) { throw 42; }));
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { after.Add(r.position); }));
  f.fetcher->Put("r1", 5);
  f.fetcher->Put("r1", 6);

  auto loop = f.MakeLoop();
  assert(loop.HandlePayload("r1_5") == DispatchOutcome::kDispatched);
  assert(loop.HandlePayload("r1_6") == DispatchOutcome::kDispatched);
  assert((after.Positions() == std::vector<uint64_t>{5, 6}));
}

void TestRunDeliversAndStopsWithinPollInterval() {
  Fixture  f;
  Recorder seen;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { seen.Add(r.position); }));
  f.fetcher->Put("r1", 1);
  f.fetcher->Put("r1", 2);

  auto loop   = f.MakeLoop();
  auto stream = loop.Listen();
  assert(stream && f.hub->ListenerCount("run_events") == 1);
  std::thread worker([&loop, &stream] { loop.Run(std::move(stream)); });

  f.hub->Publish("run_events", "r1_1");
  f.hub->Publish("run_events", "garbage");
  f.hub->Publish("other_channel", "r1_2");
  f.hub->Publish("run_events", "r1_2");
  assert(WaitUntil([&] { return seen.Size() == 2; }));

  const auto started = std::chrono::steady_clock::now();
  f.stop->Set();
  worker.join();
  assert(std::chrono::steady_clock::now() - started < 1s);
  assert((seen.Positions() == std::vector<uint64_t>{1, 2}));
}

void TestSubscribeFailureWithoutReconnectEndsRun() {
  Fixture f;
  f.hub->SetAvailable(false);

  auto loop = f.MakeLoop();
  loop.Run();
  assert(!f.stop->IsSet());
}

void TestFailedFirstListenIsRetriedWhenReconnecting() {
  Fixture  f;
  Recorder seen;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { seen.Add(r.position); }));
  f.fetcher->Put("r1", 1);

  WatchLoopOptions options;
  options.reconnect.enabled         = true;
  options.reconnect.initial_backoff = 5ms;
  options.reconnect.max_backoff     = 5ms;

  auto loop = f.MakeLoop(options);
  f.hub->SetAvailable(false);
  auto stream = loop.Listen();
  assert(stream == nullptr);
  f.hub->SetAvailable(true);

  std::thread worker([&loop, &stream] { loop.Run(std::move(stream)); });
  assert(WaitForListener(*f.hub, "run_events"));
  f.hub->Publish("run_events", "r1_1");
  assert(WaitUntil([&] { return seen.Size() == 1; }));

  f.stop->Set();
  worker.join();
}

void TestStreamEndWithoutReconnectEndsRun() {
  Fixture     f;
  auto        loop   = f.MakeLoop();
  auto        stream = loop.Listen();
  std::thread worker([&loop, &stream] { loop.Run(std::move(stream)); });

  f.hub->Disconnect();
  worker.join();
  assert(!f.stop->IsSet());
}

void TestReconnectResumesDelivery() {
  Fixture  f;
  Recorder seen;
  f.registry->Add("r1", 0, MakeCallback([&](const EventRecord& r) { seen.Add(r.position); }));
  f.fetcher->Put("r1", 1);
  f.fetcher->Put("r1", 2);

  WatchLoopOptions options;
  options.reconnect.enabled         = true;
  options.reconnect.initial_backoff = 5ms;
  options.reconnect.max_backoff     = 20ms;

  auto        loop   = f.MakeLoop(options);
  auto        stream = loop.Listen();
  std::thread worker([&loop, &stream] { loop.Run(std::move(stream)); });

  f.hub->Publish("run_events", "r1_1");
  assert(WaitUntil([&] { return seen.Size() == 1; }));

  // the loop re-subscribes on its own thread after the backoff
  f.hub->Disconnect();
  assert(WaitForListener(*f.hub, "run_events"));
  f.hub->Publish("run_events", "r1_2");
  assert(WaitUntil([&] { return seen.Size() == 2; }));

  f.stop->Set();
  worker.join();
  assert((seen.Positions() == std::vector<uint64_t>{1, 2}));
}

void TestReconnectGivesUpAfterMaxAttempts() {
  Fixture f;
  f.hub->SetAvailable(false);

  WatchLoopOptions options;
  options.reconnect.enabled         = true;
  options.reconnect.max_attempts    = 3;
  options.reconnect.initial_backoff = 1ms;
  options.reconnect.max_backoff     = 4ms;

  auto loop = f.MakeLoop(options);
  loop.Run();
  assert(!f.stop->IsSet());
}

void TestStopInterruptsBackoff() {
  Fixture f;
  f.hub->SetAvailable(false);

  WatchLoopOptions options;
  options.reconnect.enabled         = true;
  options.reconnect.initial_backoff = 10s;
  options.reconnect.max_backoff     = 10s;

  auto        loop = f.MakeLoop(options);
  std::thread worker([&loop] { loop.Run(); });

  std::this_thread::sleep_for(30ms);
  const auto started = std::chrono::steady_clock::now();
  f.stop->Set();
  worker.join();
  assert(std::chrono::steady_clock::now() - started < 1s);
}

} // namespace

int main() {
  TestMalformedPayloadIsDiscarded();
  TestUnwatchedStreamIsNotFetched();
  TestOneFetchPerNotificationRegardlessOfFanOut();
  TestCursorFiltersPerSubscription();
  TestDeliveryFollowsRegistrationOrder();
  TestMissingRecordIsANoOp();
  TestFetchErrorSkipsOnlyThatNotification();
  TestThrowingCallbackDoesNotStarveOthers();
  TestRunDeliversAndStopsWithinPollInterval();
  TestSubscribeFailureWithoutReconnectEndsRun();
  TestFailedFirstListenIsRetriedWhenReconnecting();
  TestStreamEndWithoutReconnectEndsRun();
  TestReconnectResumesDelivery();
  TestReconnectGivesUpAfterMaxAttempts();
  TestStopInterruptsBackoff();

  std::cout << "eventlog_unit_watch_loop: pass\n";
  return 0;
}
