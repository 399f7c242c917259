#ifndef CODEBOX_WORKER_H_
#define CODEBOX_WORKER_H_

#include <optional>

#include <codebox/worker.h>
#include "governor.h"
#include "sandbox.h"

// Limits of the syntax check step; fixed, not charged to the request
constexpr std::chrono::milliseconds kCheckTimeLimit{10'000};
constexpr long kCheckMemoryLimitKiB = 256 * 1024;
constexpr long kCheckOutputLimit = 64 * 1024;
// headroom so that the interpreter can still report a MemoryError
constexpr long kAddressSpaceMarginKiB = 4096;
// slack for the value in the result report, on top of the output limit
constexpr long kReportMargin = 64 * 1024;
// the jail's own wall clock limit, past the governor's deadline
constexpr std::chrono::milliseconds kJailBackstop{1'000};

// One box: kBoxRoot/<id>, a root-owned chroot holding the harness and the
//  code, and a tmpfs scratch directory owned by the slot uid.
class SandboxWorker : public Worker {
  SandboxSettings settings_;
  PoolSlot slot_;
  long id_;
  bool box_created_, scratch_mounted_;

  void Provision_(const ExecutionRequest&);
  SandboxOptions BaseOptions_() const;
  GovernorReport RunJail_(const SandboxOptions&, const GovernorLimits&, CancelToken&);
 public:
  SandboxWorker(const SandboxSettings&, const PoolSlot&);
  // kills everything under the slot uid and deletes the box
  ~SandboxWorker();

  ExecutionOutcome Run(const ExecutionRequest&, CancelToken&) override;
};

// Interpretation of one governed jail run

// nullopt if the code compiled
std::optional<ExecutionOutcome> SyntaxCheckOutcome(GovernorReport&);
ExecutionOutcome BuildOutcome(GovernorReport&);

#endif  // CODEBOX_WORKER_H_
