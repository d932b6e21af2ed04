// src/core/extract.cpp
#include "ugate/core/extract.hpp"
#include "ugate/limits/resource_limiter.hpp"
#include "ugate/log.h"
#include "ugate/readers/IArchiveReader.hpp"
#include "ugate/routing/router.hpp"

#include <algorithm>
#include <limits>

namespace fs = std::filesystem;

namespace ugate {

ExtractOptions ExtractOptions::fromConfig(const SecurityConfig& cfg) {
  ExtractOptions o;
  o.maxFileBytes = cfg.maxUncompressedFileSize;
  o.maxTotalBytes = cfg.maxTotalUncompressedSize;
  return o;
}

ExtractionReport extractArchive(const fs::path& archive, const fs::path& targetDir,
                                const FileSecurityScanner& scanner,
                                const ExtractOptions& options) {
  RoutingDecision rd = routeToHandler(archive);
  // tar headers and padding ride on top of the member bytes
  const uint64_t slack = 64ull<<20;
  const uint64_t budget = options.maxTotalBytes > std::numeric_limits<uint64_t>::max() - slack
                            ? std::numeric_limits<uint64_t>::max() : options.maxTotalBytes + slack;
  auto reader = makeReader(rd, budget);
  if (!reader) throw SecurityError("Unsupported container: " + archive.string());

  std::string err;
  if (!reader->open(archive, err)) {
    throw SecurityError("Cannot open archive " + archive.string() + ": " + err,
                        {{"container", rd.handler}});
  }

  std::error_code ec;
  fs::create_directories(targetDir, ec);
  if (ec) throw SecurityError("Cannot create " + targetDir.string() + ": " + ec.message());

  ExtractionReport report;
  for (;;) {
    if (options.deadline) options.deadline->check();

    EntryInfo e;
    if (!reader->nextEntry(e, err)) {
      if (!err.empty()) {
        if (reader->budgetExceeded())
          throw ResourceLimitExceeded("extracted_total_size", (double)budget, (double)options.maxTotalBytes);
        throw SecurityError("Error reading archive member: " + err);
      }
      break;
    }

    if (e.isDir) {
      const std::string norm = fs::path(e.name).lexically_normal().generic_string();
      if (norm == "." || norm == "./") continue;   // "./" entry of tar archives made with `tar -C dir .`
    }

    const fs::path dst = scanner.validateExtractionPath(targetDir, e.name);

    if (e.isSymlink || e.isEncrypted) {
      logEvent(archive.filename().string(), "extract_skip",
               {{"member", e.name}, {"reason", e.isSymlink ? "link" : "encrypted"}});
      report.skipped.push_back(e.name);
      continue;
    }

    if (e.isDir) {
      fs::create_directories(dst, ec);
      if (ec) throw SecurityError("Cannot create " + dst.string() + ": " + ec.message());
      ++report.directoriesCreated;
      continue;
    }

    // declared sizes first, then the bytes that actually come out
    if (e.size > options.maxFileBytes)
      throw ResourceLimitExceeded("extracted_file_size", (double)e.size, (double)options.maxFileBytes);
    const uint64_t totalLeft = options.maxTotalBytes - std::min(report.bytesWritten, options.maxTotalBytes);
    if (e.size > totalLeft)
      throw ResourceLimitExceeded("extracted_total_size", (double)(report.bytesWritten + e.size),
                                  (double)options.maxTotalBytes);

    const uint64_t cap = std::min(options.maxFileBytes, totalLeft);
    uint64_t written = 0;
    const bool ok = reader->extractEntry(e, dst, cap, written, err);
    report.bytesWritten += written;
    if (!ok) {
      if (err.rfind(kEntryTooLarge, 0) == 0) {
        if (cap < options.maxFileBytes)
          throw ResourceLimitExceeded("extracted_total_size", (double)(report.bytesWritten + 1),
                                      (double)options.maxTotalBytes);
        throw ResourceLimitExceeded("extracted_file_size", (double)(written + 1),
                                    (double)options.maxFileBytes);
      }
      if (reader->budgetExceeded())
        throw ResourceLimitExceeded("extracted_total_size", (double)(report.bytesWritten + 1),
                                    (double)options.maxTotalBytes);
      throw SecurityError("Cannot extract " + e.name + ": " + err, {{"member", e.name}});
    }
    ++report.filesWritten;
  }

  logEvent(archive.filename().string(), "extracted",
           {{"files", std::to_string(report.filesWritten)},
            {"dirs", std::to_string(report.directoriesCreated)},
            {"bytes", std::to_string(report.bytesWritten)},
            {"skipped", std::to_string(report.skipped.size())},
            {"target", targetDir.string()}});
  return report;
}

} // namespace ugate
