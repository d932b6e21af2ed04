// src/core/config.cpp
#include "ugate/core/config.hpp"
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>

namespace ugate {

static std::vector<std::string> stringList(const YAML::Node& n, const std::vector<std::string>& def) {
  if (!n) return def;
  if (!n.IsSequence()) throw YAML::Exception(n.Mark(), "expected a list of strings");
  std::vector<std::string> out;
  for (const auto& item : n) out.push_back(item.as<std::string>());
  return out;
}

bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    if (auto sec = root["security"]) {
      SecurityConfig& s = outCfg.security;
      if (auto zb = sec["zip_bomb"]) {
        s.maxCompressionRatio = zb["max_compression_ratio"].as<double>(s.maxCompressionRatio);
      }
      if (auto sz = sec["size"]) {
        s.maxUncompressedFileSize = sz["max_uncompressed_file_bytes"].as<uint64_t>(s.maxUncompressedFileSize);
        s.maxTotalUncompressedSize = sz["max_total_uncompressed_bytes"].as<uint64_t>(s.maxTotalUncompressedSize);
      }
      if (auto r = sec["recursion"]) {
        s.maxFilesPerArchive = r["max_files_per_archive"].as<uint64_t>(s.maxFilesPerArchive);
        s.maxNestedArchiveDepth = r["max_nested_depth"].as<uint32_t>(s.maxNestedArchiveDepth);
        s.scanNestedArchives = r["scan_nested"].as<bool>(s.scanNestedArchives);
      }
      if (auto fs = sec["fs_safety"]) {
        s.allowAbsolutePaths = fs["allow_absolute_paths"].as<bool>(s.allowAbsolutePaths);
      }
      s.allowedExtensions = stringList(sec["allowed_extensions"], s.allowedExtensions);
      s.blockedPathPatterns = stringList(sec["blocked_path_patterns"], s.blockedPathPatterns);
      s.suspiciousPatterns = stringList(sec["suspicious_patterns"], s.suspiciousPatterns);
    }

    if (auto lim = root["limits"]) {
      ResourceLimits& l = outCfg.limits;
      l.maxMemoryMb = lim["max_memory_mb"].as<uint64_t>(l.maxMemoryMb);
      l.maxDiskUsageMb = lim["max_disk_usage_mb"].as<uint64_t>(l.maxDiskUsageMb);
      l.maxProcessingTimeSeconds = lim["max_processing_time_seconds"].as<uint32_t>(l.maxProcessingTimeSeconds);
      l.maxConcurrentUploads = lim["max_concurrent_uploads"].as<uint32_t>(l.maxConcurrentUploads);
      l.maxConcurrentExtractions = lim["max_concurrent_extractions"].as<uint32_t>(l.maxConcurrentExtractions);
      l.maxOpenFiles = lim["max_open_files"].as<uint32_t>(l.maxOpenFiles);
      l.maxCpuTimeSeconds = lim["max_cpu_time_seconds"].as<uint32_t>(l.maxCpuTimeSeconds);
    }

    if (auto t = root["temp"]) {
      TempFileConfig& tc = outCfg.temp;
      if (auto b = t["base_dir"]) {
        std::string dir = b.as<std::string>("");
        if (!dir.empty()) tc.baseDir = dir;
      }
      tc.directoryPrefix = t["directory_prefix"].as<std::string>(tc.directoryPrefix);
      tc.maxFileAgeHours = t["max_file_age_hours"].as<uint32_t>(tc.maxFileAgeHours);
      tc.cleanupIntervalMinutes = t["cleanup_interval_minutes"].as<uint32_t>(tc.cleanupIntervalMinutes);
      tc.maxTotalSizeMb = t["max_total_size_mb"].as<uint64_t>(tc.maxTotalSizeMb);
      tc.cleanupOnExit = t["cleanup_on_exit"].as<bool>(tc.cleanupOnExit);
      tc.trackFiles = t["track_files"].as<bool>(tc.trackFiles);
    }

    if (auto lg = root["logging"]) {
      if (auto lv = lg["level"]) {
        std::string s = lv.as<std::string>();
        if (!parseLogLevel(s, outCfg.logging.level)) {
          err = "logging.level: unknown level '" + s + "'";
          return false;
        }
      }
    }
    return true;
  } catch (const std::exception& ex) {
    err = ex.what();
    return false;
  }
}

static bool envUnsigned(const char* name, uint64_t& out) {
  const char* v = std::getenv(name);
  if (!v || !*v) return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long n = std::strtoull(v, &end, 10);
  if (errno != 0 || *end != '\0' || v[0] == '-') {
    LOGW(std::string("ignoring ") + name + "='" + v + "': not an unsigned integer");
    return false;
  }
  out = (uint64_t)n;
  return true;
}

void applyEnvOverrides(AppConfig& cfg) {
  if (const char* v = std::getenv("UGATE_TEMP_DIR"); v && *v) cfg.temp.baseDir = std::string(v);

  if (const char* v = std::getenv("UGATE_LOG_LEVEL"); v && *v) {
    if (!parseLogLevel(v, cfg.logging.level))
      LOGW(std::string("ignoring UGATE_LOG_LEVEL='") + v + "'");
  }

  if (const char* v = std::getenv("UGATE_MAX_COMPRESSION_RATIO"); v && *v) {
    errno = 0;
    char* end = nullptr;
    double r = std::strtod(v, &end);
    if (errno != 0 || *end != '\0') LOGW(std::string("ignoring UGATE_MAX_COMPRESSION_RATIO='") + v + "'");
    else cfg.security.maxCompressionRatio = r;
  }

  uint64_t n = 0;
  if (envUnsigned("UGATE_MAX_FILES_PER_ARCHIVE", n)) cfg.security.maxFilesPerArchive = n;
  if (envUnsigned("UGATE_MAX_CONCURRENT_UPLOADS", n)) cfg.limits.maxConcurrentUploads = (uint32_t)n;
  if (envUnsigned("UGATE_MAX_CONCURRENT_EXTRACTIONS", n)) cfg.limits.maxConcurrentExtractions = (uint32_t)n;
}

std::vector<std::string> validateConfig(const AppConfig& cfg) {
  std::vector<std::string> errors;
  const SecurityConfig& s = cfg.security;
  if (!(s.maxCompressionRatio > 0.0)) errors.push_back("security.zip_bomb.max_compression_ratio must be > 0");
  if (s.maxUncompressedFileSize == 0) errors.push_back("security.size.max_uncompressed_file_bytes must be > 0");
  if (s.maxTotalUncompressedSize == 0) errors.push_back("security.size.max_total_uncompressed_bytes must be > 0");
  if (s.maxFilesPerArchive == 0) errors.push_back("security.recursion.max_files_per_archive must be > 0");
  for (const auto& e : s.allowedExtensions) {
    if (e.size() < 2 || e[0] != '.') errors.push_back("security.allowed_extensions: '" + e + "' must start with '.'");
  }

  const ResourceLimits& l = cfg.limits;
  if (l.maxMemoryMb == 0) errors.push_back("limits.max_memory_mb must be > 0");
  if (l.maxDiskUsageMb == 0) errors.push_back("limits.max_disk_usage_mb must be > 0");
  if (l.maxProcessingTimeSeconds == 0) errors.push_back("limits.max_processing_time_seconds must be > 0");
  if (l.maxConcurrentUploads == 0) errors.push_back("limits.max_concurrent_uploads must be > 0");
  if (l.maxConcurrentExtractions == 0) errors.push_back("limits.max_concurrent_extractions must be > 0");
  if (l.maxOpenFiles == 0) errors.push_back("limits.max_open_files must be > 0");
  if (l.maxCpuTimeSeconds == 0) errors.push_back("limits.max_cpu_time_seconds must be > 0");

  const TempFileConfig& t = cfg.temp;
  if (t.directoryPrefix.empty()) errors.push_back("temp.directory_prefix must not be empty");
  if (t.directoryPrefix.find_first_of("/\\") != std::string::npos)
    errors.push_back("temp.directory_prefix must not contain a path separator");
  if (t.maxFileAgeHours == 0) errors.push_back("temp.max_file_age_hours must be > 0");
  if (t.cleanupIntervalMinutes == 0) errors.push_back("temp.cleanup_interval_minutes must be > 0");
  if (t.maxTotalSizeMb == 0) errors.push_back("temp.max_total_size_mb must be > 0");
  return errors;
}

} // namespace ugate
