// src/core/errors.cpp
#include "ugate/core/errors.hpp"

namespace ugate {

ResourceLimitExceeded::ResourceLimitExceeded(std::string resource, double current, double limit)
  : SecurityError("Resource limit exceeded for " + resource + ": " +
                  formatDecimal(current) + " > " + formatDecimal(limit),
                  {{"resource", resource},
                   {"current", formatDecimal(current)},
                   {"limit", formatDecimal(limit)}}),
    resource_(std::move(resource)), current_(current), limit_(limit) {}

bool ResourceLimitExceeded::retryable() const noexcept {
  return resource_ == "concurrent_uploads" ||
         resource_ == "concurrent_extractions" ||
         resource_ == "time" ||
         resource_ == "processing_time";
}

} // namespace ugate
