#ifndef CODEBOX_GOVERNOR_H_
#define CODEBOX_GOVERNOR_H_

#include <chrono>
#include <string>
#include <optional>

#include <codebox/outcome.h>
#include <codebox/worker.h>
#include "sandbox_exec.h"

// Both streams share one byte budget. Whatever fits is kept, in arrival
//  order per stream; the rest is only counted.
// Each stream keeps its own first limit bytes
class OutputCapture {
  long limit_;
  long out_total_, err_total_;
  CapturedOutput out_, err_;
 public:
  explicit OutputCapture(long limit) : limit_(limit), out_total_(0), err_total_(0) {}

  void Append(bool is_stderr, const char* buf, size_t len);
  long Total() const { return out_total_ + err_total_; }
  bool Exceeded() const { return out_total_ > limit_ || err_total_ > limit_; }
  CapturedOutput TakeStdout() { return std::move(out_); }
  CapturedOutput TakeStderr() { return std::move(err_); }
};

struct BreachSet {
  bool time, cpu, memory, output;
  BreachSet() : time(false), cpu(false), memory(false), output(false) {}
};

// If several limits are hit within one sampling interval, time wins over
//  memory, and memory over output
std::optional<LimitKind> PrimaryBreach(const BreachSet&);

struct GovernorLimits {
  std::chrono::milliseconds wall;
  std::chrono::milliseconds cpu;
  long memory_kib;
  long output; // bytes, per stream
  long report; // bytes, the side channel on fd 3
  std::chrono::milliseconds sampling_interval;

  GovernorLimits() : wall(0), cpu(0), memory_kib(0), output(0), report(0), sampling_interval(10) {}
};

struct GovernorReport {
  bool has_result; // false if the helper died or had to be killed
  struct cjail_result result;
  bool jail_failed; // cjail_exec itself failed; jail_errno holds errno
  int jail_errno;
  bool cancelled;
  BreachSet breach;
  CapturedOutput out, err;
  std::string report;
  std::chrono::steady_clock::duration elapsed;

  GovernorReport() : has_result(false), result{}, jail_failed(false), jail_errno(0), cancelled(false) {}
};

// Watches one sandbox-exec helper. Created by Attach right after the helper
//  is spawned; Enforce() blocks the calling thread until the jail is gone.
// Destroying a handle whose Enforce() never ran kills the jail.
class GovernedProcess {
  SandboxProcess proc_;
  GovernorLimits limits_;
  CancelToken& cancel_;
  std::chrono::steady_clock::time_point start_;
  bool enforced_;

  void Reap_();
 public:
  GovernedProcess(const SandboxProcess&, const GovernorLimits&, CancelToken&);
  ~GovernedProcess();
  GovernedProcess(const GovernedProcess&) = delete;
  GovernedProcess& operator=(const GovernedProcess&) = delete;

  GovernorReport Enforce();
};

GovernedProcess Attach(const SandboxProcess&, const GovernorLimits&, CancelToken&);

#endif  // CODEBOX_GOVERNOR_H_
