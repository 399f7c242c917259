#ifndef INCLUDE_CODEBOX_WORKER_H_
#define INCLUDE_CODEBOX_WORKER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <functional>
#include <filesystem>

#include "outcome.h"
#include "request.h"

// Failure of the sandbox infrastructure itself (as opposed to failures caused
//  by the executed code, which are always reported as an outcome)
class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Cancellation of one request; can be triggered from any thread.
// The disconnect check (if set) is polled by the governor on every sampling tick, which
//  lets transports report a dropped connection without a thread of their own.
class CancelToken {
  std::atomic_bool cancelled_;
  int event_fd_;
  std::function<bool()> check_;
 public:
  CancelToken();
  ~CancelToken();
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void SetDisconnectCheck(std::function<bool()> check) { check_ = std::move(check); }
  void Cancel();
  // also runs the disconnect check; call only from the thread serving the request
  bool Poll();
  bool IsCancelled() const { return cancelled_; }
  // readable once cancelled; -1 if eventfd is unavailable
  int Fd() const { return event_fd_; }
};

struct PoolSlot {
  int index;
  int uid; // jail uid & gid, unique to this slot
};

class Worker {
 public:
  virtual ~Worker() = default;
  // Produces exactly one outcome; throws SandboxError on infrastructure failure.
  // Called at most once per worker.
  virtual ExecutionOutcome Run(const ExecutionRequest&, CancelToken&) = 0;
};

using WorkerFactory = std::function<std::unique_ptr<Worker>(const PoolSlot&)>;

struct SandboxSettings {
  std::filesystem::path python;
  std::vector<std::string> blocked_modules;
  long scratch_size_kib;
  std::chrono::milliseconds sampling_interval;

  SandboxSettings() :
      python("/usr/bin/python3"),
      blocked_modules{"ctypes", "_ctypes", "cffi", "mmap", "resource"},
      scratch_size_kib(16 * 1024),
      sampling_interval(10) {}
};

// Workers that run the code in a fresh cjail jail per request
WorkerFactory MakeSandboxWorkerFactory(const SandboxSettings&);

#endif  // INCLUDE_CODEBOX_WORKER_H_
