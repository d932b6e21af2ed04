#pragma once
#include "ugate/core/errors.hpp"
#include "ugate/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace ugate {

// Ceilings only; no state.
struct ResourceLimits {
  uint64_t maxMemoryMb = 512;
  uint64_t maxDiskUsageMb = 1024;          // per tracked job directory
  uint32_t maxProcessingTimeSeconds = 300;
  uint32_t maxConcurrentUploads = 10;
  uint32_t maxConcurrentExtractions = 5;
  uint32_t maxOpenFiles = 100;
  uint32_t maxCpuTimeSeconds = 60;         // CPU consumed inside one tracking interval
};

// Point-in-time sample; a metric that cannot be read stays 0.
struct ResourceUsage {
  double   memoryMb = 0.0;
  double   diskMb = 0.0;
  uint64_t openFiles = 0;
  double   cpuTimeSeconds = 0.0;
  double   processingTimeSeconds = 0.0;
  Clock::time_point timestamp = Clock::now();
};

enum class OperationKind { Upload, Extraction };

const char* toString(OperationKind k);

// Cooperative wall-clock deadline. Code under a time limit calls check() at
// its own checkpoints; nothing interrupts it in between.
class Deadline {
public:
  explicit Deadline(double seconds)
    : start_(std::chrono::steady_clock::now()), limit_(seconds) {}

  double elapsedSeconds() const;
  double limitSeconds() const { return limit_; }
  bool expired() const { return elapsedSeconds() > limit_; }

  // throws ResourceLimitExceeded("time", elapsed, limit)
  void check() const;

private:
  std::chrono::steady_clock::time_point start_;
  double limit_;
};

class ResourceLimiter;

// Holds one concurrency slot. finish() runs the post-work limit check;
// the destructor only gives the slot back.
class OperationGuard {
public:
  OperationGuard(OperationGuard&& other) noexcept;
  OperationGuard& operator=(OperationGuard&&) = delete;
  OperationGuard(const OperationGuard&) = delete;
  OperationGuard& operator=(const OperationGuard&) = delete;
  ~OperationGuard();

  void finish();
  OperationKind kind() const { return kind_; }

private:
  friend class ResourceLimiter;
  OperationGuard(ResourceLimiter* limiter, OperationKind kind)
    : limiter_(limiter), kind_(kind), active_(true) {}
  void release();

  ResourceLimiter* limiter_;
  OperationKind kind_;
  bool active_;
};

class ResourceLimiter {
public:
  explicit ResourceLimiter(ResourceLimits limits = ResourceLimits{});

  const ResourceLimits& limits() const { return limits_; }

  // Starting while already tracking replaces the previous interval.
  void startTracking(std::optional<std::filesystem::path> diskPath = std::nullopt);
  ResourceUsage stopTracking();
  bool isTracking() const;

  ResourceUsage currentUsage() const;

  // memory, disk, processing time, open files, then interval CPU.
  void checkLimits() const;

  bool hasCapacity(const std::filesystem::path& path, uint64_t requiredMb) const;

  // Throws ResourceLimitExceeded before any work when the kind is at its ceiling.
  OperationGuard trackOperation(OperationKind kind,
                                std::optional<std::filesystem::path> diskPath = std::nullopt);

  template <typename Fn>
  auto runOperation(OperationKind kind, Fn&& fn) -> decltype(fn());

  // As above, with the disk ceiling checked against diskPath on finish.
  template <typename Fn>
  auto runOperation(OperationKind kind, std::optional<std::filesystem::path> diskPath,
                    Fn&& fn) -> decltype(fn());

  Deadline timeLimit(std::optional<double> seconds = std::nullopt) const;

  // fn receives the deadline for its own checkpoints; the elapsed time is
  // checked once more after fn returns.
  template <typename Fn>
  auto runWithTimeLimit(std::optional<double> seconds, Fn&& fn)
      -> decltype(fn(std::declval<const Deadline&>()));

  uint32_t activeOperations(OperationKind kind) const;

private:
  friend class OperationGuard;
  void releaseSlot(OperationKind kind);

  ResourceLimits limits_;

  mutable std::mutex trackMu_;
  std::optional<std::chrono::steady_clock::time_point> start_;
  std::optional<std::filesystem::path> diskPath_;
  double cpuAtStart_ = 0.0;

  mutable std::mutex opsMu_;
  uint32_t activeUploads_ = 0;
  uint32_t activeExtractions_ = 0;
};

template <typename Fn>
auto ResourceLimiter::runOperation(OperationKind kind, Fn&& fn) -> decltype(fn()) {
  return runOperation(kind, std::nullopt, std::forward<Fn>(fn));
}

template <typename Fn>
auto ResourceLimiter::runOperation(OperationKind kind, std::optional<std::filesystem::path> diskPath,
                                   Fn&& fn) -> decltype(fn()) {
  OperationGuard guard = trackOperation(kind, std::move(diskPath));
  if constexpr (std::is_void_v<decltype(fn())>) {
    fn();
    guard.finish();
  } else {
    auto out = fn();
    guard.finish();
    return out;
  }
}

template <typename Fn>
auto ResourceLimiter::runWithTimeLimit(std::optional<double> seconds, Fn&& fn)
    -> decltype(fn(std::declval<const Deadline&>())) {
  const Deadline deadline = timeLimit(seconds);
  if constexpr (std::is_void_v<decltype(fn(deadline))>) {
    fn(deadline);
    deadline.check();
  } else {
    auto out = fn(deadline);
    deadline.check();
    return out;
  }
}

// Best-effort process samplers; each returns 0 when the OS will not say.
double sampleMemoryMb();
uint64_t sampleOpenFiles();
double sampleCpuSeconds();
uint64_t directorySizeBytes(const std::filesystem::path& path);   // regular files, links not followed
double directorySizeMb(const std::filesystem::path& path);

struct DiskSpaceStatus {
  std::string status;        // ok | warning | critical | error
  double totalMb = 0.0;
  double usedMb = 0.0;
  double freeMb = 0.0;
  double percentUsed = 0.0;
  std::string error;
};

class DiskSpaceMonitor {
public:
  DiskSpaceMonitor(uint64_t warningThresholdMb = 500, uint64_t criticalThresholdMb = 100)
    : warningMb_(warningThresholdMb), criticalMb_(criticalThresholdMb) {}

  DiskSpaceStatus check(const std::filesystem::path& path) const;

private:
  uint64_t warningMb_;
  uint64_t criticalMb_;
};

} // namespace ugate
