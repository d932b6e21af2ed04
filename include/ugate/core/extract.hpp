#pragma once
#include "ugate/core/file_scanner.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ugate {

struct ExtractOptions {
  uint64_t maxFileBytes = 1ull<<30;     // actual decompressed bytes per member
  uint64_t maxTotalBytes = 10ull<<30;   // across the archive
  const Deadline* deadline = nullptr;

  // Ceilings taken from the scanner's config.
  static ExtractOptions fromConfig(const SecurityConfig& cfg);
};

struct ExtractionReport {
  uint64_t filesWritten = 0;
  uint64_t directoriesCreated = 0;
  uint64_t bytesWritten = 0;
  std::vector<std::string> skipped;   // link and encrypted members
};

// Writes every member below targetDir. Each destination comes from
// scanner.validateExtractionPath; link members are never materialized.
// Throws PathTraversalError, ResourceLimitExceeded("extracted_file_size" |
// "extracted_total_size") or SecurityError for unreadable containers. On
// throw, files already written stay where they are for the caller's cleanup.
ExtractionReport extractArchive(const std::filesystem::path& archive,
                                const std::filesystem::path& targetDir,
                                const FileSecurityScanner& scanner,
                                const ExtractOptions& options);

} // namespace ugate
