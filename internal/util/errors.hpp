#pragma once

#include <stdexcept>
#include <string>

namespace datagraph::util {

/*
  Central error types.

  Services translate these into OperationStatus codes (service/status.hpp).
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

// Concurrent write detected at commit, or the backend was busy.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Runtime failed to initialize; nothing can be served.
class NotReady : public std::runtime_error {
 public:
  explicit NotReady(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Extraction model returned nothing usable.
class ExtractionError : public std::runtime_error {
 public:
  explicit ExtractionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Embedding or generation endpoint failed.
class UpstreamError : public std::runtime_error {
 public:
  explicit UpstreamError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace datagraph::util
