#pragma once
#include "ugate/core/errors.hpp"
#include "ugate/core/types.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace ugate {

class Deadline;
class IArchiveReader;
struct EntryInfo;

struct ScanOptions {
  bool scanContent = true;
  // checked before each member; expiry throws ResourceLimitExceeded("time")
  const Deadline* deadline = nullptr;
};

// Decides whether an archive is safe to extract. Stateless apart from the
// config it was built with, so one instance may be shared between threads.
class FileSecurityScanner {
public:
  explicit FileSecurityScanner(SecurityConfig config = SecurityConfig{});

  const SecurityConfig& config() const { return cfg_; }

  // Never throws for a bad archive: problems come back as findings.
  SecurityScanResult scan(const std::filesystem::path& path, bool scanContent = true) const;
  SecurityScanResult scan(const std::filesystem::path& path, const ScanOptions& opts) const;

  // Same pipeline over a seekable stream. The stream is buffered to a
  // throwaway file first and its read position is restored afterwards.
  // `filename` drives the extension check and is reported as filePath.
  SecurityScanResult scanUpload(std::istream& in, const std::string& filename,
                                bool scanContent = true) const;
  SecurityScanResult scanUpload(std::istream& in, const std::string& filename,
                                const ScanOptions& opts) const;

  // The one gate every extraction write goes through. Returns the resolved
  // destination, always strictly below targetDir. Throws PathTraversalError.
  std::filesystem::path validateExtractionPath(const std::filesystem::path& targetDir,
                                               const std::string& memberPath) const;

  // Absolute (unless allowed), drive-qualified, or any ".." segment.
  bool isPathTraversal(const std::string& memberPath) const;

private:
  void scanFile(const std::filesystem::path& path, const std::string& nameForExt,
                const ScanOptions& opts, uint32_t depth, bool checkExtension,
                SecurityScanResult& result) const;
  void scanContainer(IArchiveReader& reader, const std::filesystem::path& archive,
                     const ScanOptions& opts, uint32_t depth,
                     SecurityScanResult& result) const;
  void scanNested(IArchiveReader& reader, const EntryInfo& e,
                  const ScanOptions& opts, uint32_t depth,
                  SecurityScanResult& result) const;
  void scanMemberContent(IArchiveReader& reader, const EntryInfo& e,
                         SecurityScanResult& result) const;

  SecurityConfig cfg_;
};

// uncompressed / compressed > maxRatio; false when either side is zero.
bool compressionRatioExceeds(uint64_t uncompressed, uint64_t compressed, double maxRatio);

// One-shot scan with a throwaway scanner.
SecurityScanResult scanArchive(const std::filesystem::path& path,
                               std::optional<SecurityConfig> config = std::nullopt);

// Content scan applies to these, up to kContentScanLimit bytes.
bool isTextExtension(const std::string& extLower);
constexpr uint64_t kContentScanLimit = 1ull<<20;

} // namespace ugate
