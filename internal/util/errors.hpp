#pragma once

#include <stdexcept>
#include <string>

namespace launchpad::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Anything else escaping the core is an I/O or backend failure.
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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Requested state change is illegal from the current state.
class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Membership index and workflow payload disagree, or a referenced record is
// missing. Never patched over.
class ConsistencyViolation : public std::runtime_error {
 public:
  explicit ConsistencyViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AllocatorExhausted : public std::runtime_error {
 public:
  explicit AllocatorExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A checkout kept losing the race for its candidates.
class ConcurrentClaimLost : public std::runtime_error {
 public:
  explicit ConcurrentClaimLost(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic commit failed because another transaction committed first.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace launchpad::util
