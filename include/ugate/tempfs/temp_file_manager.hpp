#pragma once
#include "ugate/core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ugate {

struct TempFileConfig {
  std::optional<std::filesystem::path> baseDir;   // default: <system tmp>/ugate_conversions
  std::string directoryPrefix = "ugate_";
  uint32_t maxFileAgeHours = 24;
  uint32_t cleanupIntervalMinutes = 30;
  uint64_t maxTotalSizeMb = 1024;
  bool cleanupOnExit = true;
  bool trackFiles = true;
};

struct TempFileInfo {
  std::filesystem::path path;
  Clock::time_point createdAt;
  std::optional<std::string> jobId;
  uint64_t sizeBytes = 0;
  bool isDirectory = false;
};

struct TempFileStats {
  std::filesystem::path baseDirectory;
  uint64_t trackedFiles = 0;
  uint64_t trackedDirectories = 0;
  uint64_t totalSizeBytes = 0;
  uint64_t orphanedEntries = 0;
  uint64_t maxSizeMb = 0;
  bool overQuota = false;
};

class SecureTempFileManager;

// Directory that is reclaimed when the owner goes out of scope. Holds a plain
// pointer back to the manager, so it must be destroyed before the manager
// that created it; a manager that dies first logs an error.
class TempDirectory {
public:
  TempDirectory(TempDirectory&& other) noexcept;
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;
  TempDirectory& operator=(TempDirectory&&) = delete;
  ~TempDirectory();

  const std::filesystem::path& path() const { return path_; }

private:
  friend class SecureTempFileManager;
  TempDirectory(SecureTempFileManager* mgr, std::filesystem::path p)
    : mgr_(mgr), path_(std::move(p)) {}

  SecureTempFileManager* mgr_;
  std::filesystem::path path_;
};

// Same lifetime rule as TempDirectory.
class TempFile {
public:
  TempFile(TempFile&& other) noexcept;
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile& operator=(TempFile&&) = delete;
  ~TempFile();

  const std::filesystem::path& path() const { return path_; }

private:
  friend class SecureTempFileManager;
  TempFile(SecureTempFileManager* mgr, std::filesystem::path p)
    : mgr_(mgr), path_(std::move(p)) {}

  SecureTempFileManager* mgr_;
  std::filesystem::path path_;
};

// Owns one base directory and every scratch entry handed out below it.
// Directories are 0700, files 0600, names <prefix><job>_<8 hex>. Tracking is
// in memory only; cleanupOldFiles() also sweeps untracked leftovers by mtime.
// The destructor stops the sweep and, with cleanupOnExit, runs cleanupAll().
class SecureTempFileManager {
public:
  explicit SecureTempFileManager(TempFileConfig cfg = TempFileConfig{});
  ~SecureTempFileManager();

  SecureTempFileManager(const SecureTempFileManager&) = delete;
  SecureTempFileManager& operator=(const SecureTempFileManager&) = delete;

  const std::filesystem::path& baseDirectory() const { return base_; }
  const TempFileConfig& config() const { return cfg_; }

  // Throws std::filesystem::filesystem_error when the entry cannot be made,
  // SecurityError for a job id or prefix that is not a plain name.
  std::filesystem::path createTempDirectory(std::optional<std::string> jobId = std::nullopt,
                                            std::optional<std::string> prefix = std::nullopt);

  // Without `directory` a fresh job directory is created to hold the file.
  std::filesystem::path createTempFile(std::optional<std::string> suffix = std::nullopt,
                                       std::optional<std::string> prefix = std::nullopt,
                                       std::optional<std::string> jobId = std::nullopt,
                                       std::optional<std::filesystem::path> directory = std::nullopt);

  TempDirectory tempDirectory(std::optional<std::string> jobId = std::nullopt,
                              std::optional<std::string> prefix = std::nullopt);
  TempFile tempFile(std::optional<std::string> suffix = std::nullopt,
                    std::optional<std::string> prefix = std::nullopt,
                    std::optional<std::string> jobId = std::nullopt);

  // Idempotent; false when the filesystem refused or the path is not strictly
  // below the base directory (nothing is touched then).
  bool cleanupFile(const std::filesystem::path& path);
  bool cleanupDirectory(const std::filesystem::path& path);

  size_t cleanupJobFiles(const std::string& jobId);
  size_t cleanupOldFiles(std::optional<double> maxAgeHours = std::nullopt);
  size_t cleanupAll();

  std::vector<std::filesystem::path> findOrphanedFiles() const;

  void startBackgroundCleanup(std::optional<std::chrono::milliseconds> interval = std::nullopt);
  void stopBackgroundCleanup();
  bool backgroundCleanupRunning() const { return sweep_.joinable(); }

  // Snapshot of the tracking table with sizes read from disk.
  std::vector<TempFileInfo> trackedEntries() const;
  size_t trackedCount() const;
  size_t trackedCount(const std::string& jobId) const;

  uint64_t totalSize() const;
  TempFileStats stats() const;

  // TempDirectory / TempFile handles not yet destroyed.
  size_t liveScopedEntries() const { return liveScoped_; }

private:
  friend class TempDirectory;
  friend class TempFile;

  bool removable(const std::filesystem::path& p) const;
  std::string key(const std::filesystem::path& p) const;
  void track(const std::filesystem::path& p, const std::optional<std::string>& jobId, bool isDir);
  void untrack(const std::filesystem::path& p);
  void untrackTree(const std::filesystem::path& dir);
  bool isTracked(const std::filesystem::path& p) const;
  size_t cleanupEntries(const std::vector<TempFileInfo>& entries);
  size_t cleanupOrphans(std::filesystem::file_time_type cutoff);
  void sweepLoop(std::chrono::milliseconds interval);

  TempFileConfig cfg_;
  std::filesystem::path base_;

  mutable std::mutex mu_;
  std::map<std::string, TempFileInfo> tracked_;

  std::thread sweep_;
  std::mutex sweepMu_;
  std::condition_variable sweepCv_;
  std::atomic<bool> stop_{false};
  std::atomic<size_t> liveScoped_{0};
};

} // namespace ugate
