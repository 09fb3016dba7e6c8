#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace availability::util {

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

// Malformed input: misaligned, inverted or unparsable windows and dates.
class ValidationFailure : public std::runtime_error {
 public:
  explicit ValidationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Two windows on the same date intersect at slot level.
class OverlapConflict : public std::runtime_error {
 public:
  OverlapConflict(std::string date, std::string first, std::string second)
      : std::runtime_error("overlapping windows on " + date + ": " + first + " and " + second),
        date_(std::move(date)),
        first_(std::move(first)),
        second_(std::move(second)) {
  }

  const std::string& Date() const {
    return date_;
  }
  const std::string& First() const {
    return first_;
  }
  const std::string& Second() const {
    return second_;
  }

 private:
  std::string date_;
  std::string first_;
  std::string second_;
};

// Stale concurrency token; the caller must refetch the week and retry.
class VersionConflict : public std::runtime_error {
 public:
  VersionConflict(const std::string& msg, std::string expected, std::string current)
      : std::runtime_error(msg), expected_(std::move(expected)), current_(std::move(current)) {
  }

  const std::string& Expected() const {
    return expected_;
  }
  const std::string& Current() const {
    return current_;
  }

 private:
  std::string expected_;
  std::string current_;
};

} // namespace availability::util
