#pragma once

#include <stdexcept>
#include <string>

namespace alo::util {

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

// Segment filter or value lookup names a dimension the catalog does not register.
class UnknownDimension : public std::runtime_error {
 public:
  explicit UnknownDimension(const std::string& dimension_id)
      : std::runtime_error("unknown segment dimension: " + dimension_id), dimension_id_(dimension_id) {
  }

  const std::string& dimension_id() const {
    return dimension_id_;
  }

 private:
  std::string dimension_id_;
};

// A conditional write lost against a concurrent writer.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The delivery engine cannot execute a campaign at all (invalid payload or filters).
class ExecutionFailure : public std::runtime_error {
 public:
  explicit ExecutionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace alo::util
