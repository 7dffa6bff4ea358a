#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace eventlog::notify {

/*
  Cooperative cancellation flag shared by the watcher facade and its loop.

  Set() is sticky. WaitFor() lets backoff sleeps end early once the signal
  is raised.
*/
class StopSignal {
 public:
  void Set() {
    {
      std::lock_guard lock(mutex_);
      set_ = true;
    }
    cv_.notify_all();
  }

  bool IsSet() const {
    std::lock_guard lock(mutex_);
    return set_;
  }

  // Returns true if the signal was raised before the timeout elapsed.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return set_; });
  }

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            set_ = false;
};

} // namespace eventlog::notify
