#include "utils.h"

#include <thread>
#include <unistd.h>
#include <codebox/paths.h>

FakeWorker::FakeWorker(RunFunc func, WorkerCensus* census) : func_(std::move(func)), census_(census) {
  if (!census_) return;
  census_->created++;
  int now = ++census_->alive;
  for (int peak = census_->peak; now > peak && !census_->peak.compare_exchange_weak(peak, now););
}

FakeWorker::~FakeWorker() {
  if (!census_) return;
  census_->alive--;
  census_->destroyed++;
}

WorkerFactory FakeFactory(RunFunc func, WorkerCensus* census) {
  return [func, census](const PoolSlot&) -> std::unique_ptr<Worker> {
    return std::make_unique<FakeWorker>(func, census);
  };
}

ExecutionRequest MakeRequest(const std::string& code, long time_ms, long memory, long output) {
  ExecutionRequest req;
  req.request_id = "test";
  req.source_code = code;
  req.limits = ExecutionLimits(std::chrono::milliseconds(time_ms), memory, output);
  return req;
}

bool WaitCancelled(CancelToken& cancel, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel.Poll()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return cancel.Poll();
}

bool SandboxAvailable(std::string& reason) {
  if (geteuid() != 0) {
    reason = "sandbox tests need root";
    return false;
  }
  if (!fs::exists(internal::kDataDir / "sandbox-exec")) {
    reason = "sandbox-exec is not built next to the test binary";
    return false;
  }
  if (!fs::exists(SandboxSettings().python)) {
    reason = "no python interpreter";
    return false;
  }
  return true;
}
