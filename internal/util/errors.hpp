#pragma once

#include <stdexcept>
#include <string>

namespace eventlog::util {

/*
  Central error types.

  Thrown by the storage facade and the watcher; the repository layer
  reports failures through db::Result instead.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Notification transport cannot continue (connection lost, LISTEN failed).
class TransportFailure : public std::runtime_error {
 public:
  explicit TransportFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace eventlog::util
