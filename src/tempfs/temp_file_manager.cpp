// src/tempfs/temp_file_manager.cpp
#include "ugate/tempfs/temp_file_manager.hpp"
#include "ugate/core/errors.hpp"
#include "ugate/limits/resource_limiter.hpp"   // directorySizeBytes
#include "ugate/log.h"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <set>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ugate {

namespace {

fs::path normalize(const fs::path& p) {
  fs::path n = fs::absolute(p).lexically_normal();
  if (!n.has_filename() && n.has_relative_path()) n = n.parent_path();   // drop trailing '/'
  return n;
}

// A name component we are willing to glue into a path.
void requirePlainName(const char* what, const std::string& s, bool allowEmpty) {
  bool bad = (!allowEmpty && s.empty()) || s == "." || s == ".." ||
             s.find_first_of(std::string("/\\\0", 3)) != std::string::npos;
  if (bad) throw SecurityError(std::string("invalid temp ") + what + ": '" + s + "'", {{what, s}});
}

// p sits inside base; base itself only counts when allowBase is set
bool insideBase(const fs::path& p, const fs::path& base, bool allowBase) {
  fs::path rel = p.lexically_relative(base);
  if (rel.empty() || *rel.begin() == "..") return false;
  return allowBase || rel != ".";
}

std::filesystem::filesystem_error errnoError(const char* what, const fs::path& p) {
  return fs::filesystem_error(what, p, std::error_code(errno, std::generic_category()));
}

// A century keeps now() minus the age inside every clock's range.
constexpr double kMaxAgeHours = 24.0 * 365.0 * 100.0;

template <typename Dur>
Dur hoursToDuration(double hours) {
  if (!(hours > 0)) hours = 0;   // negative and NaN
  hours = std::min(hours, kMaxAgeHours);
  return std::chrono::duration_cast<Dur>(std::chrono::duration<double, std::ratio<3600>>(hours));
}

} // namespace

// ====== scoped entries ======
TempDirectory::TempDirectory(TempDirectory&& other) noexcept
  : mgr_(other.mgr_), path_(std::move(other.path_)) {
  other.mgr_ = nullptr;
}

TempDirectory::~TempDirectory() {
  if (!mgr_) return;
  if (!mgr_->cleanupDirectory(path_)) LOGW("scoped temp directory left behind: " + path_.string());
  --mgr_->liveScoped_;
}

TempFile::TempFile(TempFile&& other) noexcept
  : mgr_(other.mgr_), path_(std::move(other.path_)) {
  other.mgr_ = nullptr;
}

TempFile::~TempFile() {
  if (!mgr_) return;
  if (!mgr_->cleanupFile(path_)) LOGW("scoped temp file left behind: " + path_.string());
  --mgr_->liveScoped_;
}

// ====== manager ======
SecureTempFileManager::SecureTempFileManager(TempFileConfig cfg) : cfg_(std::move(cfg)) {
  base_ = normalize(cfg_.baseDir ? *cfg_.baseDir : fs::temp_directory_path() / "ugate_conversions");
  fs::create_directories(base_);

  // the base may have existed already: it must be a real directory we own
  struct stat st;
  if (::lstat(base_.c_str(), &st) != 0) throw errnoError("lstat", base_);
  if (S_ISLNK(st.st_mode) || !S_ISDIR(st.st_mode)) {
    throw SecurityError("temp base is not a plain directory: " + base_.string(),
                        {{"base_dir", base_.string()}});
  }
  if (st.st_uid != ::geteuid()) {
    throw SecurityError("temp base is owned by another user: " + base_.string(),
                        {{"base_dir", base_.string()}, {"owner_uid", std::to_string(st.st_uid)}});
  }
  if ((st.st_mode & 07777) != 0700 && ::chmod(base_.c_str(), 0700) != 0) {
    throw errnoError("chmod", base_);
  }
  LOGD("temp base directory: " + base_.string());
}

SecureTempFileManager::~SecureTempFileManager() {
  if (liveScoped_ != 0) {
    LOGE(std::to_string(liveScoped_.load()) + " scoped temp entries outlive their manager");
  }
  try {
    stopBackgroundCleanup();
    if (cfg_.cleanupOnExit) cleanupAll();
  } catch (const std::exception& e) {
    LOGE(std::string("temp manager shutdown: ") + e.what());
  }
}

std::string SecureTempFileManager::key(const fs::path& p) const {
  return normalize(p).string();
}

void SecureTempFileManager::track(const fs::path& p, const std::optional<std::string>& jobId, bool isDir) {
  if (!cfg_.trackFiles) return;
  TempFileInfo info;
  info.path = p;
  info.createdAt = Clock::now();
  info.jobId = jobId;
  info.isDirectory = isDir;
  std::lock_guard<std::mutex> lk(mu_);
  tracked_[key(p)] = std::move(info);
}

void SecureTempFileManager::untrack(const fs::path& p) {
  const std::string k = key(p);
  std::lock_guard<std::mutex> lk(mu_);
  tracked_.erase(k);
}

void SecureTempFileManager::untrackTree(const fs::path& dir) {
  const std::string k = key(dir);
  const std::string under = k + "/";
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = tracked_.begin(); it != tracked_.end();) {
    if (it->first == k || it->first.compare(0, under.size(), under) == 0) it = tracked_.erase(it);
    else ++it;
  }
}

bool SecureTempFileManager::isTracked(const fs::path& p) const {
  const std::string k = key(p);
  std::lock_guard<std::mutex> lk(mu_);
  return tracked_.count(k) != 0;
}

fs::path SecureTempFileManager::createTempDirectory(std::optional<std::string> jobId,
                                                    std::optional<std::string> prefix) {
  const std::string pfx = prefix ? *prefix : cfg_.directoryPrefix;
  requirePlainName("prefix", pfx, true);
  if (jobId) requirePlainName("job_id", *jobId, false);

  fs::path dir;
  bool created = false;
  for (int attempt = 0; attempt < 8 && !created; ++attempt) {
    dir = base_ / (pfx + (jobId ? *jobId + "_" : std::string()) + randomSuffix(8));
    if (::mkdir(dir.c_str(), 0700) == 0) created = true;
    else if (errno != EEXIST) throw errnoError("mkdir", dir);
  }
  if (!created) {
    throw fs::filesystem_error("mkdir", dir, std::make_error_code(std::errc::file_exists));
  }

  track(dir, jobId, true);
  LOGD("created temp directory: " + dir.string());
  return dir;
}

fs::path SecureTempFileManager::createTempFile(std::optional<std::string> suffix,
                                               std::optional<std::string> prefix,
                                               std::optional<std::string> jobId,
                                               std::optional<fs::path> directory) {
  const std::string pfx = prefix ? *prefix : std::string("temp_");
  const std::string sfx = suffix ? *suffix : std::string();
  requirePlainName("prefix", pfx, true);
  requirePlainName("suffix", sfx, true);
  if (jobId) requirePlainName("job_id", *jobId, false);

  fs::path dir;
  if (directory) {
    dir = normalize(*directory);
    if (!insideBase(dir, base_, true)) {
      throw SecurityError("temp file directory is outside " + base_.string() + ": " + dir.string(),
                          {{"directory", dir.string()}});
    }
  } else {
    dir = createTempDirectory(jobId);
  }

  fs::path file;
  for (int attempt = 0; attempt < 8; ++attempt) {
    file = dir / (pfx + randomSuffix(8) + sfx);
    int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd >= 0) {
      ::close(fd);
      track(file, jobId, false);
      LOGD("created temp file: " + file.string());
      return file;
    }
    if (errno != EEXIST) {
      throw errnoError("open", file);
    }
  }
  throw fs::filesystem_error("open", file, std::make_error_code(std::errc::file_exists));
}

TempDirectory SecureTempFileManager::tempDirectory(std::optional<std::string> jobId,
                                                   std::optional<std::string> prefix) {
  TempDirectory scoped(this, createTempDirectory(std::move(jobId), std::move(prefix)));
  ++liveScoped_;
  return scoped;
}

TempFile SecureTempFileManager::tempFile(std::optional<std::string> suffix,
                                         std::optional<std::string> prefix,
                                         std::optional<std::string> jobId) {
  TempFile scoped(this, createTempFile(std::move(suffix), std::move(prefix), std::move(jobId)));
  ++liveScoped_;
  return scoped;
}

bool SecureTempFileManager::removable(const fs::path& p) const {
  if (insideBase(p, base_, false)) return true;
  LOGW("refusing to clean up " + p.string() + ": not below " + base_.string());
  return false;
}

bool SecureTempFileManager::cleanupFile(const fs::path& path) {
  const fs::path p = normalize(path);
  if (!removable(p)) return false;
  try {
    fs::remove(p);   // missing is fine
  } catch (const fs::filesystem_error& e) {
    LOGE("error cleaning up " + path.string() + ": " + e.what());
    return false;
  }
  untrack(path);
  LOGD("cleaned up temp file: " + path.string());
  return true;
}

bool SecureTempFileManager::cleanupDirectory(const fs::path& path) {
  const fs::path p = normalize(path);
  if (!removable(p)) return false;
  try {
    fs::remove_all(p);
  } catch (const fs::filesystem_error& e) {
    LOGE("error cleaning up " + path.string() + ": " + e.what());
    return false;
  }
  untrackTree(path);
  LOGD("cleaned up temp directory: " + path.string());
  return true;
}

size_t SecureTempFileManager::cleanupEntries(const std::vector<TempFileInfo>& entries) {
  size_t cleaned = 0;
  for (const auto& info : entries) {
    if (!isTracked(info.path)) continue;   // went with a parent directory
    bool ok = info.isDirectory ? cleanupDirectory(info.path) : cleanupFile(info.path);
    if (ok) ++cleaned;
  }
  return cleaned;
}

size_t SecureTempFileManager::cleanupJobFiles(const std::string& jobId) {
  std::vector<TempFileInfo> mine;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [k, info] : tracked_) {
      if (info.jobId && *info.jobId == jobId) mine.push_back(info);
    }
  }
  size_t cleaned = cleanupEntries(mine);
  logEvent("tempfs", "cleanup_job", {{"job", jobId}, {"cleaned", std::to_string(cleaned)}});
  return cleaned;
}

size_t SecureTempFileManager::cleanupOldFiles(std::optional<double> maxAgeHours) {
  const double hours = maxAgeHours ? *maxAgeHours : (double)cfg_.maxFileAgeHours;
  const auto cutoff = Clock::now() - hoursToDuration<Clock::duration>(hours);

  std::vector<TempFileInfo> old;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [k, info] : tracked_) {
      if (info.createdAt < cutoff) old.push_back(info);
    }
  }
  size_t cleaned = cleanupEntries(old);
  cleaned += cleanupOrphans(fs::file_time_type::clock::now() -
                            hoursToDuration<fs::file_time_type::duration>(hours));

  logEvent("tempfs", "cleanup_old", {{"cleaned", std::to_string(cleaned)},
                                     {"max_age_h", formatDecimal(hours)}});
  return cleaned;
}

size_t SecureTempFileManager::cleanupOrphans(fs::file_time_type cutoff) {
  size_t cleaned = 0;
  for (const auto& p : findOrphanedFiles()) {
    std::error_code ec;
    auto st = fs::symlink_status(p, ec);
    if (ec) { LOGW("could not stat orphan " + p.string() + ": " + ec.message()); continue; }

    fs::file_time_type mtime;
    if (fs::is_symlink(st)) {
      mtime = fs::file_time_type::min();   // links are never ours to keep
    } else {
      mtime = fs::last_write_time(p, ec);
      if (ec) { LOGW("could not stat orphan " + p.string() + ": " + ec.message()); continue; }
    }
    if (mtime >= cutoff) continue;

    fs::remove_all(p, ec);
    if (ec) { LOGW("could not clean orphan " + p.string() + ": " + ec.message()); continue; }
    ++cleaned;
    LOGD("cleaned up orphan: " + p.string());
  }
  return cleaned;
}

size_t SecureTempFileManager::cleanupAll() {
  std::vector<TempFileInfo> all;
  {
    std::lock_guard<std::mutex> lk(mu_);
    all.reserve(tracked_.size());
    for (const auto& [k, info] : tracked_) all.push_back(info);
  }
  size_t cleaned = cleanupEntries(all);
  logEvent("tempfs", "cleanup_all", {{"cleaned", std::to_string(cleaned)}});
  return cleaned;
}

std::vector<fs::path> SecureTempFileManager::findOrphanedFiles() const {
  std::vector<fs::path> orphans;
  std::set<std::string> keys;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [k, info] : tracked_) keys.insert(k);
  }

  std::error_code ec;
  fs::directory_iterator it(base_, ec);
  if (ec) {
    LOGD("cannot list " + base_.string() + ": " + ec.message());
    return orphans;
  }
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    if (!keys.count(key(it->path()))) orphans.push_back(it->path());
  }
  return orphans;
}

void SecureTempFileManager::startBackgroundCleanup(std::optional<std::chrono::milliseconds> interval) {
  if (sweep_.joinable()) return;
  const auto every = interval ? *interval
                              : std::chrono::milliseconds(std::chrono::minutes(cfg_.cleanupIntervalMinutes));
  stop_ = false;
  sweep_ = std::thread(&SecureTempFileManager::sweepLoop, this, every);
  LOGI("started background temp cleanup every " + std::to_string(every.count()) + " ms");
}

void SecureTempFileManager::stopBackgroundCleanup() {
  {
    std::lock_guard<std::mutex> lk(sweepMu_);
    stop_ = true;
  }
  sweepCv_.notify_all();
  if (sweep_.joinable()) {
    sweep_.join();
    LOGI("stopped background temp cleanup");
  }
}

void SecureTempFileManager::sweepLoop(std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lk(sweepMu_);
  while (!stop_) {
    if (sweepCv_.wait_for(lk, interval, [&]{ return stop_.load(); })) break;
    lk.unlock();
    try {
      cleanupOldFiles();
    } catch (const std::exception& e) {
      LOGE(std::string("background temp cleanup: ") + e.what());
    }
    lk.lock();
  }
}

std::vector<TempFileInfo> SecureTempFileManager::trackedEntries() const {
  std::vector<TempFileInfo> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(tracked_.size());
    for (const auto& [k, info] : tracked_) out.push_back(info);
  }
  for (auto& info : out) {
    std::error_code ec;
    if (info.isDirectory) {
      info.sizeBytes = directorySizeBytes(info.path);
    } else {
      auto sz = fs::file_size(info.path, ec);
      info.sizeBytes = ec ? 0 : (uint64_t)sz;
    }
  }
  return out;
}

size_t SecureTempFileManager::trackedCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tracked_.size();
}

size_t SecureTempFileManager::trackedCount(const std::string& jobId) const {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (const auto& [k, info] : tracked_) {
    if (info.jobId && *info.jobId == jobId) ++n;
  }
  return n;
}

uint64_t SecureTempFileManager::totalSize() const {
  return directorySizeBytes(base_);
}

TempFileStats SecureTempFileManager::stats() const {
  TempFileStats st;
  st.baseDirectory = base_;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [k, info] : tracked_) {
      if (info.isDirectory) ++st.trackedDirectories;
      else ++st.trackedFiles;
    }
  }
  st.totalSizeBytes = totalSize();
  st.orphanedEntries = findOrphanedFiles().size();
  st.maxSizeMb = cfg_.maxTotalSizeMb;
  st.overQuota = st.totalSizeBytes > cfg_.maxTotalSizeMb * 1024ull * 1024ull;
  if (st.overQuota) {
    LOGW("temp storage over quota: " + std::to_string(st.totalSizeBytes) + " bytes > " +
         std::to_string(cfg_.maxTotalSizeMb) + " MB");
  }
  return st;
}

} // namespace ugate
