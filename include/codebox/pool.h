#ifndef INCLUDE_CODEBOX_POOL_H_
#define INCLUDE_CODEBOX_POOL_H_

#include <mutex>
#include <chrono>
#include <vector>
#include <unordered_set>
#include <condition_variable>

#include "worker.h"

class MetricsReporter;

struct PoolOptions {
  int capacity;
  size_t queue_depth; // 0 = reject as soon as all slots are busy
  std::chrono::milliseconds queue_wait;

  PoolOptions() : capacity(4), queue_depth(16), queue_wait(10'000) {}
};

constexpr int kUidBase = 50000, kMaxPoolCapacity = 100;

class ExecutionPool {
  PoolOptions options_;
  WorkerFactory factory_;
  MetricsReporter* metrics_;

  mutable std::mutex mtx_;
  std::condition_variable slot_cv_;
  std::vector<PoolSlot> free_slots_;
  size_t waiting_;
  bool stopping_;
  std::unordered_set<CancelToken*> running_;

  enum class Admission { ACQUIRED, REJECTED, CANCELLED, SHUTDOWN };
  Admission AcquireSlot_(PoolSlot& slot, CancelToken& cancel);
  void ReleaseSlot_(const PoolSlot& slot, CancelToken& cancel);
 public:
  // metrics may be null; throws std::invalid_argument on a capacity outside 1..kMaxPoolCapacity
  ExecutionPool(const PoolOptions&, WorkerFactory, MetricsReporter* metrics = nullptr);
  ~ExecutionPool();
  ExecutionPool(const ExecutionPool&) = delete;
  ExecutionPool& operator=(const ExecutionPool&) = delete;

  // Blocks until the request reaches a terminal outcome. Can be called from any thread.
  // Saturation beyond the queue yields ResourceExceeded{CONCURRENCY}.
  // Throws SandboxError if the isolation boundary cannot be created.
  ExecutionOutcome Submit(const ExecutionRequest&, CancelToken&);

  // Cancels all running executions and rejects further ones; does not wait
  void Shutdown();

  int Capacity() const { return options_.capacity; }
  int InUse() const;
  size_t Waiting() const;
};

#endif  // INCLUDE_CODEBOX_POOL_H_
