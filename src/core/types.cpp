// src/core/types.cpp
#include "ugate/core/types.hpp"

#include <algorithm>
#include <cstdio>
#include <random>

namespace ugate {

const char* toString(Severity s) {
  switch (s) { case Severity::Low: return "low";
               case Severity::Medium: return "medium";
               case Severity::High: return "high";
               case Severity::Critical: return "critical"; }
  return "low";
}

const char* toString(ThreatType t) {
  switch (t) {
    case ThreatType::ZipBomb:           return "zip_bomb";
    case ThreatType::PathTraversal:     return "path_traversal";
    case ThreatType::ExcessiveFiles:    return "excessive_files";
    case ThreatType::ExcessiveSize:     return "excessive_size";
    case ThreatType::NestedArchive:     return "nested_archive";
    case ThreatType::SuspiciousContent: return "suspicious_content";
    case ThreatType::InvalidArchive:    return "invalid_archive";
    case ThreatType::ResourceLimit:     return "resource_limit";
  }
  return "invalid_archive";
}

void SecurityScanResult::addThreat(ThreatType type, Severity severity,
                                   std::string message, Details details) {
  threats_.push_back(SecurityThreat{type, severity, std::move(message),
                                    std::move(details), Clock::now()});
  if (severity >= Severity::High) safe_ = false;
}

bool SecurityScanResult::hasCriticalThreats() const {
  return countOf(Severity::Critical) > 0;
}

bool SecurityScanResult::hasHighThreats() const {
  return countOf(Severity::High) > 0;
}

size_t SecurityScanResult::countOf(ThreatType type) const {
  return (size_t)std::count_if(threats_.begin(), threats_.end(),
                               [&](const SecurityThreat& t){ return t.type == type; });
}

size_t SecurityScanResult::countOf(Severity severity) const {
  return (size_t)std::count_if(threats_.begin(), threats_.end(),
                               [&](const SecurityThreat& t){ return t.severity == severity; });
}

std::string formatDecimal(double v, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
  return buf;
}

std::string randomSuffix(size_t hexChars) {
  static const char kHex[] = "0123456789abcdef";
  std::random_device rd;
  std::string out;
  out.reserve(hexChars);
  while (out.size() < hexChars) {
    uint32_t v = rd();
    for (int i = 0; i < 8 && out.size() < hexChars; ++i, v >>= 4) out.push_back(kHex[v & 0xf]);
  }
  return out;
}

} // namespace ugate
