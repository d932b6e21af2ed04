#pragma once
#include "ugate/core/types.hpp"
#include <string>

namespace ugate {

std::string jsonEscape(const std::string& s);

// "2026-01-31T12:00:00Z"
std::string isoTimestamp(Clock::time_point t);

// Single-line JSON object: is_safe, file_path, counters, threats[].
std::string toJson(const SecurityScanResult& r);

} // namespace ugate
