#pragma once

#include <stdexcept>
#include <string>

namespace wfrun::util {

/*
  Central error types surfaced by the run engine.

  LockConflict is expected and recoverable: callers retry with backoff.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockConflict : public std::runtime_error {
 public:
  explicit LockConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace wfrun::util
