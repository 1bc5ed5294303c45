#pragma once

#include <stdexcept>
#include <string>

namespace issueflow::util {

/*
  Central error types.

  These get translated later to flow result tags and process exit codes.
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

// Rejected input: illegal status value, empty title or label, unknown type.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Rejected by a domain rule (illegal transition, closing a closed issue).
class PolicyViolation : public std::runtime_error {
 public:
  explicit PolicyViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Candidate edge would close a cycle in a cycle-constrained subgraph.
class CycleDetected : public std::runtime_error {
 public:
  explicit CycleDetected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A compare-and-set or optimistic commit lost against a concurrent writer.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store timed out or could not be reached; the outcome is unknown.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace issueflow::util
