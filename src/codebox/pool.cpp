#include <codebox/pool.h>

#include <stdexcept>

#include <spdlog/spdlog.h>
#include <codebox/metrics.h>
#include <codebox/collector.h>
#include <codebox/utils.h>

namespace {

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

// how often a queued request checks whether its caller is still there
constexpr auto kQueuePollInterval = 50ms;

} // namespace

ExecutionPool::ExecutionPool(const PoolOptions& options, WorkerFactory factory, MetricsReporter* metrics) :
    options_(options), factory_(std::move(factory)), metrics_(metrics), waiting_(0), stopping_(false) {
  if (options_.capacity < 1 || options_.capacity > kMaxPoolCapacity) {
    throw std::invalid_argument("pool capacity must be within 1.." + std::to_string(kMaxPoolCapacity));
  }
  for (int i = options_.capacity - 1; i >= 0; i--) free_slots_.push_back({i, kUidBase + i});
  spdlog::info("Execution pool started: capacity={} queue_depth={} queue_wait={}ms",
      options_.capacity, options_.queue_depth, options_.queue_wait.count());
}

ExecutionPool::~ExecutionPool() {
  Shutdown();
}

ExecutionPool::Admission ExecutionPool::AcquireSlot_(PoolSlot& slot, CancelToken& cancel) {
  std::unique_lock lck(mtx_);
  if (stopping_) return Admission::SHUTDOWN;
  if (free_slots_.empty()) {
    if (waiting_ >= options_.queue_depth) return Admission::REJECTED;
    waiting_++;
    auto deadline = Clock::now() + options_.queue_wait;
    while (!stopping_ && free_slots_.empty()) {
      auto now = Clock::now();
      if (now >= deadline) break;
      slot_cv_.wait_for(lck, std::min<Clock::duration>(deadline - now, kQueuePollInterval));
      lck.unlock();
      bool cancelled = cancel.Poll();
      lck.lock();
      if (cancelled) {
        waiting_--;
        return Admission::CANCELLED;
      }
    }
    waiting_--;
    if (stopping_) return Admission::SHUTDOWN;
    if (free_slots_.empty()) return Admission::REJECTED;
  }
  slot = free_slots_.back();
  free_slots_.pop_back();
  running_.insert(&cancel);
  if (metrics_) metrics_->SetSlotsInUse(options_.capacity - (long)free_slots_.size());
  return Admission::ACQUIRED;
}

void ExecutionPool::ReleaseSlot_(const PoolSlot& slot, CancelToken& cancel) {
  {
    std::lock_guard lck(mtx_);
    running_.erase(&cancel);
    free_slots_.push_back(slot);
    if (metrics_) metrics_->SetSlotsInUse(options_.capacity - (long)free_slots_.size());
  }
  slot_cv_.notify_one();
}

ExecutionOutcome ExecutionPool::Submit(const ExecutionRequest& req, CancelToken& cancel) {
  auto start = Clock::now();
  if (metrics_) metrics_->ExecutionStarted();
  auto Finish = [&](const ExecutionOutcome& res) {
    std::chrono::duration<double> duration = Clock::now() - start;
    if (metrics_) {
      metrics_->Record(res, duration);
      metrics_->ExecutionFinished();
    }
    spdlog::info("Request {} finished: status={} duration={:.3f}s",
        req.request_id, StatusName(OutcomeStatus(res)), duration.count());
  };

  PoolSlot slot{};
  switch (AcquireSlot_(slot, cancel)) {
    case Admission::ACQUIRED: break;
    case Admission::REJECTED: {
      spdlog::debug("Request {} rejected: all {} slots busy", req.request_id, options_.capacity);
      ExecutionOutcome res = outcome::ResourceExceeded{LimitKind::CONCURRENCY, {}, {}};
      Finish(res);
      return res;
    }
    case Admission::CANCELLED: {
      spdlog::debug("Request {} cancelled while queued", req.request_id);
      ExecutionOutcome res = outcome::Killed{"cancelled", {}, {}};
      Finish(res);
      return res;
    }
    case Admission::SHUTDOWN: {
      ExecutionOutcome res = outcome::Killed{"service shutting down", {}, {}};
      Finish(res);
      return res;
    }
  }
  spdlog::debug("Request {} acquired slot {} (uid {})", req.request_id, slot.index, slot.uid);
  // Shutdown may have run between acquisition and here
  if (std::lock_guard lck(mtx_); stopping_) cancel.Cancel();

  bool failed = false;
  std::string failure;
  ExecutionOutcome res;
  try {
    std::unique_ptr<Worker> worker = factory_(slot);
    spdlog::debug("Request {} running", req.request_id);
    res = worker->Run(req, cancel);
    // the worker's teardown has to finish before the slot (and its uid) is reused
    worker.reset();
  } catch (const std::exception& e) {
    failed = true;
    failure = e.what();
  }
  ReleaseSlot_(slot, cancel);
  spdlog::debug("Request {} released slot {}", req.request_id, slot.index);

  if (failed) {
    std::chrono::duration<double> duration = Clock::now() - start;
    spdlog::error("Request {} failed: {}", req.request_id, failure);
    if (metrics_) {
      metrics_->RecordInternalError(duration);
      metrics_->ExecutionFinished();
    }
    throw SandboxError(failure);
  }
  Finish(res);
  return res;
}

void ExecutionPool::Shutdown() {
  std::lock_guard lck(mtx_);
  if (!stopping_) spdlog::info("Execution pool shutting down, cancelling {} running", running_.size());
  stopping_ = true;
  for (CancelToken* token : running_) token->Cancel();
  slot_cv_.notify_all();
}

int ExecutionPool::InUse() const {
  std::lock_guard lck(mtx_);
  return options_.capacity - (int)free_slots_.size();
}

size_t ExecutionPool::Waiting() const {
  std::lock_guard lck(mtx_);
  return waiting_;
}
