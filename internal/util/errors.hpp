#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace prefixid::util {

/*
  Central error types.

  Configuration problems surface at setup time, never during allocation.
  Everything raised by SegmentedCounterAllocator::Allocate is one of
  InvalidSegmentKey, StorageFailure or ContentionExhausted.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidSegmentKey : public std::runtime_error {
 public:
  explicit InvalidSegmentKey(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg, db::ErrorCode code = db::ErrorCode::InternalError)
      : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode Code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

class ContentionExhausted : public std::runtime_error {
 public:
  explicit ContentionExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace prefixid::util
