#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ugate {

enum class Severity { Low=0, Medium=1, High=2, Critical=3 };

enum class ThreatType {
  ZipBomb,
  PathTraversal,
  ExcessiveFiles,
  ExcessiveSize,
  NestedArchive,
  SuspiciousContent,
  InvalidArchive,
  ResourceLimit
};

using Details = std::map<std::string, std::string>;
using Clock   = std::chrono::system_clock;

const char* toString(Severity s);
const char* toString(ThreatType t);

struct SecurityThreat {
  ThreatType type;
  Severity severity;
  std::string message;
  Details details;
  Clock::time_point timestamp;
};

// Verdict of one top-level scan. isSafe() is false as soon as a HIGH or
// CRITICAL threat has been added and never returns to true.
class SecurityScanResult {
public:
  SecurityScanResult() : scannedAt(Clock::now()) {}

  void addThreat(ThreatType type, Severity severity,
                 std::string message, Details details = {});

  bool isSafe() const { return safe_; }
  const std::vector<SecurityThreat>& threats() const { return threats_; }

  bool hasCriticalThreats() const;
  bool hasHighThreats() const;
  size_t countOf(ThreatType type) const;
  size_t countOf(Severity severity) const;

  Clock::time_point scannedAt;
  std::optional<std::filesystem::path> filePath;
  uint64_t totalFilesScanned = 0;
  uint64_t totalSizeScanned = 0;

private:
  bool safe_ = true;
  std::vector<SecurityThreat> threats_;
};

struct SecurityConfig {
  // zip bomb
  double   maxCompressionRatio = 100.0;
  uint64_t maxUncompressedFileSize = 1ull<<30;    // 1 GiB
  uint64_t maxTotalUncompressedSize = 10ull<<30;  // 10 GiB

  // recursion
  uint64_t maxFilesPerArchive = 100000;
  uint32_t maxNestedArchiveDepth = 3;
  bool     scanNestedArchives = false;

  // fs safety
  bool allowAbsolutePaths = false;
  std::vector<std::string> blockedPathPatterns = {
    "../", "..\\", "/etc/", "/proc/", "/sys/", "/root/",
    "C:\\Windows", "C:\\Program Files"
  };

  std::vector<std::string> allowedExtensions = {
    ".jar", ".zip", ".mcaddon", ".mcpack"
  };

  std::vector<std::string> suspiciousPatterns = {
    "<script", "javascript:", "data:text/html",
    "<?php", "<%", "#!/bin/", "#!/usr/bin/"
  };
};

// "1.50" style rendering used for ratios and MB values in details maps.
std::string formatDecimal(double v, int precision = 2);

// Lower-case hex from the OS entropy source, for scratch file names.
std::string randomSuffix(size_t hexChars = 8);

} // namespace ugate
