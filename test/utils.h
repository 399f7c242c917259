#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <atomic>
#include <functional>

#include <gtest/gtest.h>
#include <codebox/pool.h>
#include <codebox/worker.h>
#include <codebox/request.h>

using RunFunc = std::function<ExecutionOutcome(const ExecutionRequest&, CancelToken&)>;

// Counts live workers and the largest number ever alive at once
struct WorkerCensus {
  std::atomic<int> alive, peak, created, destroyed;
  WorkerCensus() : alive(0), peak(0), created(0), destroyed(0) {}
};

class FakeWorker : public Worker {
  RunFunc func_;
  WorkerCensus* census_;
 public:
  FakeWorker(RunFunc func, WorkerCensus* census);
  ~FakeWorker();
  ExecutionOutcome Run(const ExecutionRequest& req, CancelToken& cancel) override {
    return func_(req, cancel);
  }
};

WorkerFactory FakeFactory(RunFunc func, WorkerCensus* census = nullptr);

ExecutionRequest MakeRequest(const std::string& code, long time_ms = 5000,
                             long memory = 256L << 20, long output = 1L << 20);

// Sleeps in small steps until cancelled or timeout; returns whether it was cancelled
bool WaitCancelled(CancelToken& cancel, std::chrono::milliseconds timeout);

// Whether the real sandbox can be used here (root, helper built, python present)
bool SandboxAvailable(std::string& reason);

#endif // TEST_UTILS_H_
