// src/core/file_scanner.cpp
#include "ugate/core/file_scanner.hpp"
#include "ugate/core/scratch_file.hpp"
#include "ugate/limits/resource_limiter.hpp"   // Deadline
#include "ugate/log.h"
#include "ugate/readers/IArchiveReader.hpp"
#include "ugate/routing/router.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <limits>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace ugate {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

uint64_t saturatingAdd(uint64_t a, uint64_t b) {
  return (a > std::numeric_limits<uint64_t>::max() - b) ? std::numeric_limits<uint64_t>::max() : a + b;
}

// Valid UTF-8 sequences are kept, anything else is dropped byte by byte.
std::string dropInvalidUtf8(const char* p, size_t n) {
  std::string out;
  out.reserve(n);
  size_t i = 0;
  while (i < n) {
    unsigned char c = (unsigned char)p[i];
    size_t len = 0;
    if (c < 0x80) len = 1;
    else if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c >= 0xE0 && c <= 0xEF) len = 3;
    else if (c >= 0xF0 && c <= 0xF4) len = 4;
    if (len == 0 || i + len > n) { ++i; continue; }
    bool ok = true;
    for (size_t k = 1; k < len; ++k) {
      if (((unsigned char)p[i + k] & 0xC0) != 0x80) { ok = false; break; }
    }
    if (ok && len == 3) {
      unsigned char c1 = (unsigned char)p[i + 1];
      if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 > 0x9F)) ok = false;   // overlong, surrogate
    }
    if (ok && len == 4) {
      unsigned char c1 = (unsigned char)p[i + 1];
      if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) ok = false;
    }
    if (!ok) { ++i; continue; }
    out.append(p + i, len);
    i += len;
  }
  return out;
}

// tar streams pay for headers and padding on top of member data
uint64_t streamBudget(const SecurityConfig& cfg) {
  uint64_t overhead = saturatingAdd(1ull<<20, saturatingAdd(cfg.maxFilesPerArchive, 1) * 1024);
  return saturatingAdd(cfg.maxTotalUncompressedSize, overhead);
}

void logScan(const std::string& scope, const SecurityScanResult& r) {
  for (const auto& t : r.threats()) {
    std::map<std::string, std::string> kv = t.details;
    kv["type"] = toString(t.type);
    kv["severity"] = toString(t.severity);
    logEvent(scope, "threat", kv, t.severity >= Severity::High ? LogLevel::Warn : LogLevel::Info);
  }
  logEvent(scope, "scan_done",
           {{"safe", r.isSafe() ? "true" : "false"},
            {"threats", std::to_string(r.threats().size())},
            {"files", std::to_string(r.totalFilesScanned)},
            {"bytes", std::to_string(r.totalSizeScanned)}});
}

} // namespace

bool isTextExtension(const std::string& extLower) {
  static const std::array<const char*, 8> kText = {
    ".txt", ".json", ".xml", ".properties", ".cfg", ".config", ".yml", ".yaml"
  };
  return std::find(kText.begin(), kText.end(), extLower) != kText.end();
}

bool compressionRatioExceeds(uint64_t uncompressed, uint64_t compressed, double maxRatio) {
  if (uncompressed == 0 || compressed == 0) return false;
  long double ratio = (long double)uncompressed / (long double)compressed;
  return ratio > (long double)maxRatio;
}

FileSecurityScanner::FileSecurityScanner(SecurityConfig config) : cfg_(std::move(config)) {}

SecurityScanResult FileSecurityScanner::scan(const fs::path& path, bool scanContent) const {
  ScanOptions opts;
  opts.scanContent = scanContent;
  return scan(path, opts);
}

SecurityScanResult FileSecurityScanner::scan(const fs::path& path, const ScanOptions& opts) const {
  SecurityScanResult result;
  result.filePath = path;
  scanFile(path, path.filename().string(), opts, 0, true, result);
  logScan(path.string(), result);
  return result;
}

SecurityScanResult FileSecurityScanner::scanUpload(std::istream& in, const std::string& filename,
                                                   bool scanContent) const {
  ScanOptions opts;
  opts.scanContent = scanContent;
  return scanUpload(in, filename, opts);
}

SecurityScanResult FileSecurityScanner::scanUpload(std::istream& in, const std::string& filename,
                                                   const ScanOptions& opts) const {
  SecurityScanResult result;
  result.filePath = fs::path(filename);

  const std::streampos original = in.tellg();
  struct PositionRestore {
    std::istream& s;
    std::streampos pos;
    ~PositionRestore() {
      s.clear();
      if (pos != std::streampos(-1)) s.seekg(pos);
    }
  } restore{in, original};

  std::optional<ScratchFile> staged;
  try {
    staged.emplace("upload");
  } catch (const fs::filesystem_error& ex) {
    result.addThreat(ThreatType::InvalidArchive, Severity::High,
                     "Could not stage upload for scanning: " + filename,
                     {{"error", ex.what()}});
    logScan(filename, result);
    return result;
  }
  {
    in.clear();
    in.seekg(0, std::ios::beg);
    std::ofstream out(staged->path(), std::ios::binary | std::ios::trunc);
    if (!out) {
      result.addThreat(ThreatType::InvalidArchive, Severity::High,
                       "Could not stage upload for scanning: " + filename);
      logScan(filename, result);
      return result;
    }
    std::vector<char> buf(1<<16);
    while (in) {
      in.read(buf.data(), (std::streamsize)buf.size());
      std::streamsize got = in.gcount();
      if (got > 0) out.write(buf.data(), got);
    }
    out.flush();
    if (!out || in.bad()) {
      result.addThreat(ThreatType::InvalidArchive, Severity::High,
                       "Could not stage upload for scanning: " + filename);
      logScan(filename, result);
      return result;
    }
  }

  scanFile(staged->path(), filename, opts, 0, true, result);
  logScan(filename, result);
  return result;
}

void FileSecurityScanner::scanFile(const fs::path& path, const std::string& nameForExt,
                                   const ScanOptions& opts, uint32_t depth, bool checkExtension,
                                   SecurityScanResult& result) const {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    result.addThreat(ThreatType::InvalidArchive, Severity::High,
                     "File does not exist: " + path.string());
    return;
  }

  const std::string ext = extensionLower(fs::path(nameForExt));
  if (checkExtension && !ext.empty()) {
    bool allowed = std::any_of(cfg_.allowedExtensions.begin(), cfg_.allowedExtensions.end(),
                               [&](const std::string& a){ return lower(a) == ext; });
    if (!allowed) {
      result.addThreat(ThreatType::SuspiciousContent, Severity::Medium,
                       "File extension '" + ext + "' is not in allowed list",
                       {{"extension", ext}});
      return;
    }
  }

  std::array<unsigned char, 4> head{0,0,0,0};
  size_t got = 0;
  {
    std::ifstream f(path, std::ios::binary);
    if (f) {
      f.read(reinterpret_cast<char*>(head.data()), head.size());
      got = (size_t)f.gcount();
    } else {
      LOGD("scanner: cannot open " + path.string());
    }
  }
  RoutingDecision rd = routeByMagic(head.data(), got, ext);
  if (rd.type == ContainerType::Unknown) {
    result.addThreat(ThreatType::SuspiciousContent, Severity::Low,
                     "Unknown file type, limited scanning available");
    return;
  }

  auto reader = makeReader(rd, streamBudget(cfg_));
  std::string err;
  if (!reader || !reader->open(path, err)) {
    result.addThreat(ThreatType::InvalidArchive, Severity::High,
                     "Invalid or corrupted " + rd.handler + " archive: " + err,
                     {{"container", rd.handler}});
    return;
  }
  scanContainer(*reader, path, opts, depth, result);
  reader->close();
}

void FileSecurityScanner::scanContainer(IArchiveReader& reader, const fs::path& archive,
                                        const ScanOptions& opts, uint32_t depth,
                                        SecurityScanResult& result) const {
  std::string err;
  uint64_t count = 0;
  if (!reader.countEntries(cfg_.maxFilesPerArchive, count, err)) {
    if (reader.budgetExceeded()) {
      result.addThreat(ThreatType::ExcessiveSize, Severity::High,
                       "Decompressed stream exceeds size budget",
                       {{"limit", std::to_string(cfg_.maxTotalUncompressedSize)}});
    } else {
      result.addThreat(ThreatType::InvalidArchive, Severity::High,
                       "Invalid or corrupted archive: " + err);
    }
    return;
  }
  result.totalFilesScanned = count;

  if (count > cfg_.maxFilesPerArchive) {
    result.addThreat(ThreatType::ExcessiveFiles, Severity::High,
                     "Archive contains too many files: " + std::to_string(count) +
                     " > " + std::to_string(cfg_.maxFilesPerArchive),
                     {{"file_count", std::to_string(count)},
                      {"limit", std::to_string(cfg_.maxFilesPerArchive)}});
    return;
  }

  uint64_t totalUncompressed = 0;
  uint64_t totalCompressed = 0;

  for (;;) {
    if (opts.deadline) opts.deadline->check();

    EntryInfo e;
    if (!reader.nextEntry(e, err)) {
      if (!err.empty()) {
        if (reader.budgetExceeded()) {
          result.addThreat(ThreatType::ExcessiveSize, Severity::High,
                           "Decompressed stream exceeds size budget",
                           {{"limit", std::to_string(cfg_.maxTotalUncompressedSize)}});
        } else {
          result.addThreat(ThreatType::InvalidArchive, Severity::High,
                           "Error reading archive member: " + err);
        }
      }
      break;
    }

    if (isPathTraversal(e.name)) {
      result.addThreat(ThreatType::PathTraversal, Severity::Critical,
                       "Path traversal detected in archive member: " + e.name,
                       {{"filename", e.name}});
    }
    const std::string nameLower = lower(e.name);
    for (const auto& pattern : cfg_.blockedPathPatterns) {
      if (!pattern.empty() && nameLower.find(lower(pattern)) != std::string::npos) {
        result.addThreat(ThreatType::PathTraversal, Severity::High,
                         "Blocked path pattern detected: " + pattern,
                         {{"filename", e.name}, {"pattern", pattern}});
      }
    }

    totalUncompressed = saturatingAdd(totalUncompressed, e.size);
    totalCompressed = saturatingAdd(totalCompressed, e.compressedSize);

    if (e.size > cfg_.maxUncompressedFileSize) {
      result.addThreat(ThreatType::ExcessiveSize, Severity::High,
                       "File exceeds size limit: " + e.name,
                       {{"filename", e.name},
                        {"size", std::to_string(e.size)},
                        {"limit", std::to_string(cfg_.maxUncompressedFileSize)}});
    }

    if (compressionRatioExceeds(e.size, e.compressedSize, cfg_.maxCompressionRatio)) {
      double ratio = (double)e.size / (double)e.compressedSize;
      result.addThreat(ThreatType::ZipBomb, Severity::Critical,
                       "Potential ZIP bomb: extreme compression ratio " + formatDecimal(ratio) + "x",
                       {{"filename", e.name},
                        {"ratio", formatDecimal(ratio)},
                        {"compressed_size", std::to_string(e.compressedSize)},
                        {"uncompressed_size", std::to_string(e.size)}});
    }

    if (!e.isDir && isArchiveExtension(e.name)) {
      if (depth >= cfg_.maxNestedArchiveDepth) {
        result.addThreat(ThreatType::NestedArchive, Severity::High,
                         "Nested archive depth exceeded: " + e.name,
                         {{"filename", e.name},
                          {"depth", std::to_string(depth)},
                          {"max_depth", std::to_string(cfg_.maxNestedArchiveDepth)}});
      } else if (cfg_.scanNestedArchives && !e.isSymlink && !e.isEncrypted &&
                 e.size <= cfg_.maxUncompressedFileSize) {
        scanNested(reader, e, opts, depth, result);
      }
    }

    if (e.isEncrypted) {
      result.addThreat(ThreatType::SuspiciousContent, Severity::Low,
                       "Encrypted member cannot be inspected: " + e.name,
                       {{"filename", e.name}});
    } else if (opts.scanContent && !e.isDir && !e.isSymlink) {
      scanMemberContent(reader, e, result);
    }
  }

  result.totalSizeScanned = totalUncompressed;

  if (totalUncompressed > cfg_.maxTotalUncompressedSize) {
    result.addThreat(ThreatType::ExcessiveSize, Severity::High,
                     "Total uncompressed size exceeds limit",
                     {{"total_size", std::to_string(totalUncompressed)},
                      {"limit", std::to_string(cfg_.maxTotalUncompressedSize)}});
  }

  // without per-member sizes the container's own size is the compressed total
  if (!reader.perEntryCompression()) {
    std::error_code ec;
    auto onDisk = fs::file_size(archive, ec);
    totalCompressed = ec ? 0 : (uint64_t)onDisk;
  }
  if (compressionRatioExceeds(totalUncompressed, totalCompressed, cfg_.maxCompressionRatio)) {
    double ratio = (double)totalUncompressed / (double)totalCompressed;
    result.addThreat(ThreatType::ZipBomb, Severity::Critical,
                     "Archive has suspicious overall compression ratio: " + formatDecimal(ratio) + "x",
                     {{"ratio", formatDecimal(ratio)}});
  }
}

void FileSecurityScanner::scanNested(IArchiveReader& reader, const EntryInfo& e,
                                     const ScanOptions& opts, uint32_t depth,
                                     SecurityScanResult& result) const {
  std::optional<ScratchFile> staged;
  try {
    staged.emplace("nested");
  } catch (const fs::filesystem_error& ex) {
    result.addThreat(ThreatType::NestedArchive, Severity::High,
                     "Nested archive could not be staged: " + e.name,
                     {{"filename", e.name}, {"error", ex.what()}});
    return;
  }
  std::string err;
  uint64_t written = 0;
  if (!reader.extractEntry(e, staged->path(), cfg_.maxUncompressedFileSize, written, err)) {
    result.addThreat(ThreatType::NestedArchive, Severity::High,
                     "Nested archive could not be staged: " + e.name,
                     {{"filename", e.name}, {"error", err}});
    return;
  }

  SecurityScanResult nested;
  scanFile(staged->path(), e.name, opts, depth + 1, false, nested);
  for (const auto& t : nested.threats()) {
    Details d = t.details;
    auto it = d.find("nested_in");
    d["nested_in"] = (it == d.end()) ? e.name : e.name + ">" + it->second;
    result.addThreat(t.type, t.severity, t.message, std::move(d));
  }
}

void FileSecurityScanner::scanMemberContent(IArchiveReader& reader, const EntryInfo& e,
                                            SecurityScanResult& result) const {
  if (!isTextExtension(extensionLower(fs::path(e.name)))) return;
  if (e.size > kContentScanLimit) return;

  std::vector<char> data;
  std::string err;
  if (!reader.readEntry(e, kContentScanLimit, data, err)) {
    LOGD("content scan skipped for " + e.name + ": " + err);
    return;
  }
  const std::string text = lower(dropInvalidUtf8(data.data(), data.size()));
  for (const auto& pattern : cfg_.suspiciousPatterns) {
    if (pattern.empty()) continue;
    if (text.find(lower(pattern)) != std::string::npos) {
      result.addThreat(ThreatType::SuspiciousContent, Severity::Medium,
                       "Suspicious content pattern found in " + e.name,
                       {{"filename", e.name}, {"pattern", pattern}});
    }
  }
}

bool FileSecurityScanner::isPathTraversal(const std::string& memberPath) const {
  if (memberPath.empty()) return false;

  const char c0 = memberPath[0];
  bool absolute = (c0 == '/' || c0 == '\\') ||
                  (memberPath.size() >= 2 && std::isalpha((unsigned char)c0) && memberPath[1] == ':');
  if (absolute && !cfg_.allowAbsolutePaths) return true;

  size_t start = 0;
  while (start <= memberPath.size()) {
    size_t end = memberPath.find_first_of("/\\", start);
    if (end == std::string::npos) end = memberPath.size();
    if (memberPath.compare(start, end - start, "..") == 0) return true;
    start = end + 1;
  }
  return false;
}

fs::path FileSecurityScanner::validateExtractionPath(const fs::path& targetDir,
                                                     const std::string& memberPath) const {
  const fs::path target = fs::weakly_canonical(fs::absolute(targetDir));

  if (isPathTraversal(memberPath)) {
    throw PathTraversalError("Path traversal detected in archive member: " + memberPath,
                             {{"member_path", memberPath}});
  }

  const fs::path full = fs::weakly_canonical(target / fs::path(memberPath));
  const fs::path rel = full.lexically_relative(target);
  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    throw PathTraversalError("Resolved path escapes target directory: " + memberPath,
                             {{"member_path", memberPath}, {"target_dir", target.string()}});
  }
  return full;
}

SecurityScanResult scanArchive(const fs::path& path, std::optional<SecurityConfig> config) {
  FileSecurityScanner scanner(config ? std::move(*config) : SecurityConfig{});
  return scanner.scan(path);
}

} // namespace ugate
