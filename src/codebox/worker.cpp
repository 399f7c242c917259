#include "worker.h"

#include <signal.h>
#include <unistd.h>
#include <sys/eventfd.h>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "paths.h"
#include "utils.h"
#include "harness.h"
#include "sandbox_exec.h"

using nlohmann::json;

CancelToken::CancelToken() : cancelled_(false), event_fd_(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) {
  if (event_fd_ < 0) spdlog::warn("eventfd failed, cancellation will be polled: {}", strerror(errno));
}

CancelToken::~CancelToken() {
  if (event_fd_ >= 0) close(event_fd_);
}

void CancelToken::Cancel() {
  if (cancelled_.exchange(true)) return;
  if (event_fd_ >= 0) {
    uint64_t one = 1;
    IGNORE_RETURN(write(event_fd_, &one, sizeof(one)));
  }
}

bool CancelToken::Poll() {
  if (!cancelled_ && check_ && check_()) Cancel();
  return cancelled_;
}

namespace {

std::string TrimRight(std::string str) {
  while (!str.empty() && (str.back() == '\n' || str.back() == ' ' || str.back() == '\r')) str.pop_back();
  return str;
}

// the harness writes one line; anything before it came from the user
std::string LastLine(const std::string& str) {
  std::string trimmed = TrimRight(str);
  size_t pos = trimmed.rfind('\n');
  return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

ExecutionOutcome BreachOutcome(LimitKind kind, CapturedOutput out, CapturedOutput err) {
  if (kind == LimitKind::TIME || kind == LimitKind::CPU) {
    return outcome::TimedOut{kind, std::move(out), std::move(err)};
  }
  return outcome::ResourceExceeded{kind, std::move(out), std::move(err)};
}

} // namespace

std::optional<ExecutionOutcome> SyntaxCheckOutcome(GovernorReport& rep) {
  if (rep.jail_failed) {
    throw SandboxError(fmt::format("cjail_exec failed: {}", strerror(rep.jail_errno)));
  }
  if (rep.cancelled) return outcome::Killed{"cancelled", {}, {}};
  if (PrimaryBreach(rep.breach)) {
    return outcome::RuntimeError{ErrorKind::SYNTAX_ERROR,
        "source could not be validated within limits", "", "", {}, {}};
  }
  if (!rep.has_result) throw SandboxError("sandbox helper exited without a result");
  const siginfo_t& info = rep.result.info;
  if (info.si_code == CLD_EXITED && info.si_status == 0) return std::nullopt;
  if (info.si_code == CLD_EXITED && info.si_status == 1) {
    std::string message = TrimRight(rep.out.data);
    std::string exception = "SyntaxError";
    if (size_t pos = message.find(':'); pos != std::string::npos) exception = message.substr(0, pos);
    return outcome::RuntimeError{ErrorKind::SYNTAX_ERROR, message, exception, "", {}, {}};
  }
  if (info.si_code == CLD_EXITED) {
    throw SandboxError(fmt::format("syntax check exited with status {}: {}",
        info.si_status, TrimRight(rep.err.data)));
  }
  return outcome::RuntimeError{ErrorKind::SYNTAX_ERROR,
      "source could not be validated within limits", "", "", {}, {}};
}

ExecutionOutcome BuildOutcome(GovernorReport& rep) {
  if (rep.jail_failed) {
    throw SandboxError(fmt::format("cjail_exec failed: {}", strerror(rep.jail_errno)));
  }
  if (rep.cancelled) return outcome::Killed{"cancelled", std::move(rep.out), std::move(rep.err)};
  if (auto breach = PrimaryBreach(rep.breach)) {
    return BreachOutcome(*breach, std::move(rep.out), std::move(rep.err));
  }
  if (!rep.has_result) throw SandboxError("sandbox helper exited without a result");

  std::string line = LastLine(rep.report);
  if (!line.empty()) {
    try {
      json report = json::parse(line);
      std::string status = report.at("status").get<std::string>();
      if (status == "ok") {
        return outcome::Success{report.value("value", json()), std::move(rep.out), std::move(rep.err)};
      } else if (status == "memory") {
        return outcome::ResourceExceeded{LimitKind::MEMORY, std::move(rep.out), std::move(rep.err)};
      } else if (status == "error") {
        ErrorKind kind = report.value("kind", std::string()) == "PermissionDenied" ?
            ErrorKind::PERMISSION_DENIED : ErrorKind::RUNTIME_ERROR;
        return outcome::RuntimeError{kind,
            report.value("message", std::string()),
            report.value("exception", std::string()),
            report.value("traceback", std::string()),
            std::move(rep.out), std::move(rep.err)};
      }
    } catch (const json::exception& e) {
      spdlog::debug("Unparsable result report: {}", e.what());
    }
    return outcome::Killed{"malformed result report", std::move(rep.out), std::move(rep.err)};
  }

  const siginfo_t& info = rep.result.info;
  if (info.si_code == CLD_KILLED || info.si_code == CLD_DUMPED) {
    if (info.si_status == SIGXCPU) {
      return outcome::TimedOut{LimitKind::CPU, std::move(rep.out), std::move(rep.err)};
    }
    if (info.si_status == SIGXFSZ) {
      return outcome::ResourceExceeded{LimitKind::OUTPUT, std::move(rep.out), std::move(rep.err)};
    }
    return outcome::Killed{fmt::format("terminated by signal {} ({})", info.si_status, strsignal(info.si_status)),
        std::move(rep.out), std::move(rep.err)};
  }
  return outcome::RuntimeError{ErrorKind::RUNTIME_ERROR,
      fmt::format("interpreter exited with status {} before reporting a result", info.si_status),
      "", "", std::move(rep.out), std::move(rep.err)};
}

SandboxWorker::SandboxWorker(const SandboxSettings& settings, const PoolSlot& slot) :
    settings_(settings), slot_(slot), id_(GetUniqueExecutionId()),
    box_created_(false), scratch_mounted_(false) {}

SandboxWorker::~SandboxWorker() {
  KillUid(slot_.uid);
  if (scratch_mounted_) Umount(BoxScratch(id_));
  if (box_created_) RemoveAll(BoxPath(id_));
  spdlog::debug("Worker {} torn down, slot={}", id_, slot_.index);
}

void SandboxWorker::Provision_(const ExecutionRequest& req) {
  spdlog::debug("Provisioning box {} for request {}, uid={}", id_, req.request_id, slot_.uid);
  // a previous owner of the slot may have left something behind
  KillUid(slot_.uid);
  box_created_ = true;
  if (!CreateDirs(BoxPath(id_), kPerm755) || !CreateDirs(BoxHarnessDir(id_), kPerm755) ||
      !CreateDirs(BoxScratch(id_), kPerm755)) {
    throw SandboxError("cannot create box directory");
  }
  if (!WriteFile(BoxRunner(id_), kRunnerScript, kPerm644) ||
      !WriteFile(BoxChecker(id_), kCheckerScript, kPerm644) ||
      !WriteFile(BoxCode(id_), req.source_code, kPerm644) ||
      !WriteFile(BoxBindings(id_), req.bindings.dump(), kPerm644)) {
    throw SandboxError("cannot write box files");
  }
  if (!MountTmpfs(BoxScratch(id_), settings_.scratch_size_kib, slot_.uid)) {
    throw SandboxError("cannot mount scratch directory");
  }
  scratch_mounted_ = true;
}

SandboxOptions SandboxWorker::BaseOptions_() const {
  SandboxOptions opt;
  opt.boxdir = BoxPath(id_);
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8", "HOME=" + BoxScratch(-1, true).string()};
  opt.uid = opt.gid = slot_.uid;
  opt.proc_num = 1;
  opt.file_num = 64;
  opt.share_net = false;
  opt.dirs = {"/usr", "/lib", "/lib64", "/bin", "/etc/alternatives"};
  opt.FilterDirs();
  return opt;
}

GovernorReport SandboxWorker::RunJail_(const SandboxOptions& opt, const GovernorLimits& lim, CancelToken& cancel) {
  SandboxProcess proc;
  if (!SandboxSpawn(opt, proc)) throw SandboxError("cannot start sandbox-exec");
  auto handle = Attach(proc, lim, cancel);
  return handle.Enforce();
}

ExecutionOutcome SandboxWorker::Run(const ExecutionRequest& req, CancelToken& cancel) {
  Provision_(req);
  const std::string python = settings_.python.string();

  {
    SandboxOptions opt = BaseOptions_();
    opt.command = {python, "-I", "-B", "-X", "utf8",
                   BoxChecker(-1, true).string(), BoxCode(-1, true).string()};
    opt.workdir = "/";
    opt.wall_time = (kCheckTimeLimit + kJailBackstop).count() * 1000L;
    opt.cpu_time = kCheckTimeLimit.count() * 1000L;
    opt.vss = kCheckMemoryLimitKiB + kAddressSpaceMarginKiB;
    opt.rss = kCheckMemoryLimitKiB;
    opt.fsize = kCheckOutputLimit / 1024;
    GovernorLimits lim;
    lim.wall = lim.cpu = kCheckTimeLimit;
    lim.memory_kib = 0; // bounded by the rlimit and cgroup only
    lim.output = lim.report = kCheckOutputLimit;
    lim.sampling_interval = settings_.sampling_interval;
    GovernorReport rep = RunJail_(opt, lim, cancel);
    if (auto res = SyntaxCheckOutcome(rep)) {
      spdlog::debug("Request {} rejected by syntax check", req.request_id);
      return std::move(*res);
    }
  }

  long memory_kib = req.limits.memory / 1024;
  SandboxOptions opt = BaseOptions_();
  opt.command = {python, "-I", "-B", "-u", "-X", "utf8",
                 BoxRunner(-1, true).string(), BoxCode(-1, true).string(), BoxBindings(-1, true).string(),
                 fmt::format("{}", fmt::join(settings_.blocked_modules, ","))};
  opt.workdir = BoxScratch(-1, true).string();
  opt.wall_time = (req.limits.time + kJailBackstop).count() * 1000L;
  opt.cpu_time = req.limits.time.count() * 1000L;
  if (opt.cpu_time <= 0) opt.cpu_time = 1; // avoid being regarded as no limit
  opt.vss = memory_kib + kAddressSpaceMarginKiB;
  // scratch files are accounted in the memory cgroup
  opt.rss = memory_kib + settings_.scratch_size_kib;
  opt.fsize = settings_.scratch_size_kib;
  GovernorLimits lim;
  lim.wall = lim.cpu = req.limits.time;
  lim.memory_kib = memory_kib;
  lim.output = req.limits.output;
  lim.report = req.limits.output + kReportMargin;
  lim.sampling_interval = settings_.sampling_interval;
  spdlog::debug("Request {} running in box {}", req.request_id, id_);
  GovernorReport rep = RunJail_(opt, lim, cancel);
  return BuildOutcome(rep);
}

WorkerFactory MakeSandboxWorkerFactory(const SandboxSettings& settings) {
  return [settings](const PoolSlot& slot) -> std::unique_ptr<Worker> {
    return std::make_unique<SandboxWorker>(settings, slot);
  };
}
