#pragma once

#include <stdexcept>
#include <string>

namespace flowsched::util {

/*
  Central error types.

  The storage layer reports db::Result codes; the scheduler layer converts
  them into these and lets them propagate to the caller unchanged.
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

// Missing adapter or unusable backend selection; not a data problem.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace flowsched::util
