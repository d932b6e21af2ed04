#pragma once
#include "ugate/core/types.hpp"
#include <stdexcept>
#include <string>

namespace ugate {

class SecurityError : public std::runtime_error {
public:
  explicit SecurityError(const std::string& msg, Details details = {})
    : std::runtime_error(msg), details_(std::move(details)) {}

  const Details& details() const noexcept { return details_; }

private:
  Details details_;
};

// Raised by validateExtractionPath and extraction; never part of a scan result.
class PathTraversalError : public SecurityError {
public:
  using SecurityError::SecurityError;
};

// A hard ceiling was hit. retryable() separates "try again later"
// (concurrency slots, time) from "reject outright" (memory, disk, sizes).
class ResourceLimitExceeded : public SecurityError {
public:
  ResourceLimitExceeded(std::string resource, double current, double limit);

  const std::string& resource() const noexcept { return resource_; }
  double current() const noexcept { return current_; }
  double limit() const noexcept { return limit_; }
  bool retryable() const noexcept;

private:
  std::string resource_;
  double current_;
  double limit_;
};

} // namespace ugate
