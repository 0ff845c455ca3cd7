#pragma once

#include <stdexcept>
#include <string>

namespace fleet::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No routable worker right now; callers may retry.
class NoReadyWorker : public std::runtime_error {
 public:
  explicit NoReadyWorker(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store lock contention with another replica; safe to retry the call.
class StoreContention : public std::runtime_error {
 public:
  explicit StoreContention(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fleet::util
