// src/limits/resource_limiter.cpp
#include "ugate/limits/resource_limiter.hpp"
#include "ugate/log.h"

#include <fstream>
#include <sys/resource.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ugate {

namespace {
constexpr double kMiB = 1024.0 * 1024.0;
}

const char* toString(OperationKind k) {
  return k == OperationKind::Upload ? "upload" : "extraction";
}

// ====== Deadline ======
double Deadline::elapsedSeconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

void Deadline::check() const {
  double elapsed = elapsedSeconds();
  if (elapsed > limit_) throw ResourceLimitExceeded("time", elapsed, limit_);
}

// ====== samplers ======
double sampleMemoryMb() {
  // resident set from statm (pages); fall back to peak RSS
  std::ifstream statm("/proc/self/statm");
  uint64_t sizePages = 0, residentPages = 0;
  if (statm && (statm >> sizePages >> residentPages)) {
    long page = sysconf(_SC_PAGESIZE);
    if (page > 0) return (double)residentPages * (double)page / kMiB;
  }
  struct rusage ru {};
  if (getrusage(RUSAGE_SELF, &ru) != 0) {
    LOGD("memory usage unavailable");
    return 0.0;
  }
  return (double)ru.ru_maxrss / 1024.0;   // KiB on Linux
}

uint64_t sampleOpenFiles() {
  std::error_code ec;
  fs::directory_iterator it("/proc/self/fd", ec);
  if (ec) {
    LOGD("open file count unavailable: " + ec.message());
    return 0;
  }
  uint64_t n = 0;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    ++n;
  }
  return n;
}

double sampleCpuSeconds() {
  struct rusage ru {};
  if (getrusage(RUSAGE_SELF, &ru) != 0) {
    LOGD("cpu time unavailable");
    return 0.0;
  }
  return (double)ru.ru_utime.tv_sec + (double)ru.ru_utime.tv_usec / 1e6 +
         (double)ru.ru_stime.tv_sec + (double)ru.ru_stime.tv_usec / 1e6;
}

uint64_t directorySizeBytes(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return 0;

  uint64_t total = 0;
  fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOGD("directory size unavailable for " + path.string() + ": " + ec.message());
    return 0;
  }
  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      LOGD("directory walk stopped at " + path.string() + ": " + ec.message());
      break;
    }
    std::error_code sec;
    if (!it->is_symlink(sec) && it->is_regular_file(sec)) {
      auto sz = it->file_size(sec);
      if (!sec) total += sz;
    }
  }
  return total;
}

double directorySizeMb(const fs::path& path) {
  return (double)directorySizeBytes(path) / kMiB;
}

// ====== OperationGuard ======
OperationGuard::OperationGuard(OperationGuard&& other) noexcept
  : limiter_(other.limiter_), kind_(other.kind_), active_(other.active_) {
  other.active_ = false;
}

OperationGuard::~OperationGuard() {
  if (!active_) return;
  try {
    release();
  } catch (const std::exception& e) {
    LOGE(std::string("operation release failed: ") + e.what());
  }
}

void OperationGuard::release() {
  if (!active_) return;
  active_ = false;
  limiter_->stopTracking();
  limiter_->releaseSlot(kind_);
}

void OperationGuard::finish() {
  if (!active_) return;
  struct Releaser {
    OperationGuard* g;
    ~Releaser() {
      try { g->release(); }
      catch (const std::exception& e) { LOGE(std::string("operation release failed: ") + e.what()); }
    }
  } releaser{this};
  limiter_->checkLimits();
}

// ====== ResourceLimiter ======
ResourceLimiter::ResourceLimiter(ResourceLimits limits) : limits_(limits) {}

void ResourceLimiter::startTracking(std::optional<fs::path> diskPath) {
  std::lock_guard<std::mutex> lk(trackMu_);
  start_ = std::chrono::steady_clock::now();
  diskPath_ = std::move(diskPath);
  cpuAtStart_ = sampleCpuSeconds();
  LOGD("started resource tracking");
}

ResourceUsage ResourceLimiter::stopTracking() {
  ResourceUsage usage = currentUsage();
  {
    std::lock_guard<std::mutex> lk(trackMu_);
    start_.reset();
    diskPath_.reset();
    cpuAtStart_ = 0.0;
  }
  logEvent("limiter", "usage",
           {{"memory_mb", formatDecimal(usage.memoryMb)},
            {"disk_mb", formatDecimal(usage.diskMb)},
            {"open_files", std::to_string(usage.openFiles)},
            {"cpu_s", formatDecimal(usage.cpuTimeSeconds)},
            {"elapsed_s", formatDecimal(usage.processingTimeSeconds)}},
           LogLevel::Debug);
  return usage;
}

bool ResourceLimiter::isTracking() const {
  std::lock_guard<std::mutex> lk(trackMu_);
  return start_.has_value();
}

ResourceUsage ResourceLimiter::currentUsage() const {
  std::optional<std::chrono::steady_clock::time_point> start;
  std::optional<fs::path> disk;
  {
    std::lock_guard<std::mutex> lk(trackMu_);
    start = start_;
    disk = diskPath_;
  }

  ResourceUsage usage;
  usage.memoryMb = sampleMemoryMb();
  if (disk) usage.diskMb = directorySizeMb(*disk);
  usage.openFiles = sampleOpenFiles();
  usage.cpuTimeSeconds = sampleCpuSeconds();
  if (start) {
    usage.processingTimeSeconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - *start).count();
  }
  usage.timestamp = Clock::now();
  return usage;
}

void ResourceLimiter::checkLimits() const {
  ResourceUsage usage = currentUsage();

  if (usage.memoryMb > (double)limits_.maxMemoryMb)
    throw ResourceLimitExceeded("memory", usage.memoryMb, (double)limits_.maxMemoryMb);
  if (usage.diskMb > (double)limits_.maxDiskUsageMb)
    throw ResourceLimitExceeded("disk", usage.diskMb, (double)limits_.maxDiskUsageMb);
  if (usage.processingTimeSeconds > (double)limits_.maxProcessingTimeSeconds)
    throw ResourceLimitExceeded("processing_time", usage.processingTimeSeconds,
                                (double)limits_.maxProcessingTimeSeconds);
  if (usage.openFiles > limits_.maxOpenFiles)
    throw ResourceLimitExceeded("open_files", (double)usage.openFiles, (double)limits_.maxOpenFiles);

  double cpuStart = 0.0;
  bool tracking = false;
  {
    std::lock_guard<std::mutex> lk(trackMu_);
    tracking = start_.has_value();
    cpuStart = cpuAtStart_;
  }
  if (tracking) {
    double spent = usage.cpuTimeSeconds - cpuStart;
    if (spent > (double)limits_.maxCpuTimeSeconds)
      throw ResourceLimitExceeded("cpu_time", spent, (double)limits_.maxCpuTimeSeconds);
  }
}

bool ResourceLimiter::hasCapacity(const fs::path& path, uint64_t requiredMb) const {
  std::error_code ec;
  fs::space_info si = fs::space(path, ec);
  if (ec) {
    LOGE("disk space check failed for " + path.string() + ": " + ec.message());
    return false;
  }
  return (double)si.available / kMiB >= (double)requiredMb;
}

OperationGuard ResourceLimiter::trackOperation(OperationKind kind, std::optional<fs::path> diskPath) {
  {
    std::lock_guard<std::mutex> lk(opsMu_);
    uint32_t& active = (kind == OperationKind::Upload) ? activeUploads_ : activeExtractions_;
    uint32_t limit = (kind == OperationKind::Upload) ? limits_.maxConcurrentUploads
                                                     : limits_.maxConcurrentExtractions;
    if (active >= limit) {
      logEvent("limiter", "rejected", {{"kind", toString(kind)},
                                       {"active", std::to_string(active)},
                                       {"limit", std::to_string(limit)}}, LogLevel::Warn);
      throw ResourceLimitExceeded(kind == OperationKind::Upload ? "concurrent_uploads"
                                                                : "concurrent_extractions",
                                  (double)active, (double)limit);
    }
    ++active;
  }
  OperationGuard guard(this, kind);
  startTracking(std::move(diskPath));
  return guard;
}

Deadline ResourceLimiter::timeLimit(std::optional<double> seconds) const {
  return Deadline(seconds ? *seconds : (double)limits_.maxProcessingTimeSeconds);
}

uint32_t ResourceLimiter::activeOperations(OperationKind kind) const {
  std::lock_guard<std::mutex> lk(opsMu_);
  return kind == OperationKind::Upload ? activeUploads_ : activeExtractions_;
}

void ResourceLimiter::releaseSlot(OperationKind kind) {
  std::lock_guard<std::mutex> lk(opsMu_);
  uint32_t& active = (kind == OperationKind::Upload) ? activeUploads_ : activeExtractions_;
  if (active > 0) --active;
}

// ====== DiskSpaceMonitor ======
DiskSpaceStatus DiskSpaceMonitor::check(const fs::path& path) const {
  DiskSpaceStatus st;
  std::error_code ec;
  fs::space_info si = fs::space(path, ec);
  if (ec || si.capacity == 0) {
    st.status = "error";
    st.error = ec ? ec.message() : "zero capacity";
    LOGE("disk space check failed for " + path.string() + ": " + st.error);
    return st;
  }
  st.totalMb = (double)si.capacity / kMiB;
  st.freeMb = (double)si.available / kMiB;
  st.usedMb = (double)(si.capacity - si.free) / kMiB;
  st.percentUsed = (double)(si.capacity - si.free) / (double)si.capacity * 100.0;

  if (st.freeMb < (double)criticalMb_) st.status = "critical";
  else if (st.freeMb < (double)warningMb_) st.status = "warning";
  else st.status = "ok";
  return st;
}

} // namespace ugate
