#pragma once

#include <stdexcept>
#include <string>

namespace usagestat::util {

/*
  Central error types.

  Recording never surfaces these to the caller; schema setup, metadata
  writes and queries do.
*/

// Schema initialization or metadata write failed. Not retried.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A read query failed.
class QueryError : public std::runtime_error {
 public:
  explicit QueryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace usagestat::util
