#ifndef INCLUDE_CODEBOX_METRICS_H_
#define INCLUDE_CODEBOX_METRICS_H_

#include <array>
#include <atomic>
#include <chrono>
#include <string>
#include <cstdint>

#include "outcome.h"

// Process-wide execution counters. All label sets are closed enums, so every
//  series is a preallocated atomic: recording never allocates, locks or throws.
class MetricsReporter {
 public:
  static constexpr std::array<double, 6> kDurationBuckets = {0.1, 0.5, 1.0, 2.0, 5.0, 10.0};
  static constexpr size_t kNumStatus = (size_t)Status::INTERNAL_ERROR + 1;
  static constexpr size_t kNumErrorKind = (size_t)ErrorKind::INTERNAL_ERROR + 1;
  static constexpr size_t kNumLimitKind = (size_t)LimitKind::CONCURRENCY + 1;

 private:
  std::array<std::atomic<uint64_t>, kNumStatus> executions_;
  std::array<std::atomic<uint64_t>, kNumErrorKind> errors_;
  std::array<std::atomic<uint64_t>, kNumLimitKind> limit_hits_;
  std::array<std::atomic<uint64_t>, kDurationBuckets.size()> duration_buckets_;
  std::atomic<uint64_t> duration_count_, duration_sum_us_;
  std::atomic<long> in_progress_, slots_in_use_;

  void RecordTerminal_(Status, std::chrono::duration<double>) noexcept;
 public:
  MetricsReporter();

  void Record(const ExecutionOutcome&, std::chrono::duration<double> duration) noexcept;
  void RecordInternalError(std::chrono::duration<double> duration) noexcept;
  void RecordInvalidRequest() noexcept;

  void ExecutionStarted() noexcept { ++in_progress_; }
  void ExecutionFinished() noexcept { --in_progress_; }
  void SetSlotsInUse(long n) noexcept { slots_in_use_ = n; }

  uint64_t Executions(Status status) const { return executions_[(size_t)status]; }
  uint64_t LimitHits(LimitKind kind) const { return limit_hits_[(size_t)kind]; }
  uint64_t Errors(ErrorKind kind) const { return errors_[(size_t)kind]; }

  // Prometheus text exposition format (version 0.0.4)
  std::string Render() const;
};

#endif  // INCLUDE_CODEBOX_METRICS_H_
