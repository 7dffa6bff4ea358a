#include "internal/notify/local_hub.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using eventlog::notify::LocalNotificationHub;
using eventlog::notify::StopSignal;
using namespace std::chrono_literals;

void TestPublishReachesSubscribersOfChannel() {
  LocalNotificationHub hub(20ms);
  auto                 stop = std::make_shared<StopSignal>();

  auto events = hub.Subscribe("run_events", stop);
  auto other  = hub.Subscribe("other", stop);
  assert(hub.ListenerCount("run_events") == 1);

  hub.Publish("run_events", "a_1");
  hub.Publish("run_events", "a_2");

  auto first = events->Next();
  assert(first && !first->IsTimeout() && first->payload == "a_1");
  auto second = events->Next();
  assert(second && !second->IsTimeout() && second->payload == "a_2");

  auto quiet = other->Next();
  assert(quiet && quiet->IsTimeout());
}

void TestLateSubscriberSeesNothingEarlier() {
  LocalNotificationHub hub(20ms);
  auto                 stop = std::make_shared<StopSignal>();

  hub.Publish("run_events", "a_1");
  auto stream = hub.Subscribe("run_events", stop);

  auto item = stream->Next();
  assert(item && item->IsTimeout());
}

void TestStopEndsStream() {
  LocalNotificationHub hub(20ms);
  auto                 stop   = std::make_shared<StopSignal>();
  auto                 stream = hub.Subscribe("run_events", stop);

  stop->Set();
  assert(!stream->Next().has_value());
}

void TestDisconnectEndsOpenStreams() {
  LocalNotificationHub hub(1s);
  auto                 stop   = std::make_shared<StopSignal>();
  auto                 stream = hub.Subscribe("run_events", stop);

  std::thread disconnector([&hub] {
    std::this_thread::sleep_for(30ms);
    hub.Disconnect();
  });

  const auto started = std::chrono::steady_clock::now();
  assert(!stream->Next().has_value());
  assert(std::chrono::steady_clock::now() - started < 900ms);
  disconnector.join();

  assert(hub.ListenerCount("run_events") == 0);

  // a fresh subscription works again
  auto again = hub.Subscribe("run_events", stop);
  hub.Publish("run_events", "a_3");
  auto item = again->Next();
  assert(item && item->payload == "a_3");
}

void TestUnavailableHubRefusesSubscribe() {
  LocalNotificationHub hub(20ms);
  auto                 stop = std::make_shared<StopSignal>();

  hub.SetAvailable(false);
  bool threw = false;
  try {
    (void)hub.Subscribe("run_events", stop);
  } catch (const eventlog::util::TransportFailure&) {
    threw = true;
  }
  assert(threw);

  hub.SetAvailable(true);
  assert(hub.Subscribe("run_events", stop) != nullptr);
}

void TestDroppedStreamStopsListening() {
  LocalNotificationHub hub(20ms);
  auto                 stop = std::make_shared<StopSignal>();

  {
    auto stream = hub.Subscribe("run_events", stop);
    assert(hub.ListenerCount("run_events") == 1);
  }
  assert(hub.ListenerCount("run_events") == 0);
  hub.Publish("run_events", "a_1");
}

} // namespace

int main() {
  TestPublishReachesSubscribersOfChannel();
  TestLateSubscriberSeesNothingEarlier();
  TestStopEndsStream();
  TestDisconnectEndsOpenStreams();
  TestUnavailableHubRefusesSubscribe();
  TestDroppedStreamStopsListening();

  std::cout << "eventlog_unit_local_hub: pass\n";
  return 0;
}
