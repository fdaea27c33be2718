#pragma once

#include <stdexcept>
#include <string>

namespace rnaflow::util {

/*
  Central error types.

  The CLI translates these to exit codes. Per-member execution failures are
  normally recorded as failure markers on the member rather than thrown.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Invalid flag combination or config value. Raised before any stage starts.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UpstreamStageFailure : public std::runtime_error {
 public:
  explicit UpstreamStageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MemberExecutionFailure : public std::runtime_error {
 public:
  explicit MemberExecutionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ClusteringInputError : public std::runtime_error {
 public:
  explicit ClusteringInputError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Checkpoint could not be durably written or read back.
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Interrupted : public std::runtime_error {
 public:
  explicit Interrupted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace rnaflow::util
