#include "governor.h"

#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>
#include <vector>
#include <algorithm>

#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

// stragglers after the jail result, and a helper that ignores a kill
constexpr auto kDrainGrace = 500ms;
constexpr auto kHelperGrace = 1s;

long ToUs(const struct timeval& tv) {
  return tv.tv_sec * 1'000'000L + tv.tv_usec;
}

// Reads until EAGAIN; returns false on EOF or error
template <class Func>
bool DrainFd(int fd, Func&& sink) {
  char buf[65536];
  while (true) {
    ssize_t ret = read(fd, buf, sizeof(buf));
    if (ret > 0) {
      sink(buf, (size_t)ret);
      continue;
    }
    if (ret < 0 && errno == EINTR) continue;
    if (ret < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
  }
}

} // namespace

void OutputCapture::Append(bool is_stderr, const char* buf, size_t len) {
  CapturedOutput& target = is_stderr ? err_ : out_;
  long& total = is_stderr ? err_total_ : out_total_;
  long room = std::max(0L, limit_ - (long)target.data.size());
  size_t keep = std::min((size_t)room, len);
  target.data.append(buf, keep);
  if (keep < len) target.truncated = true;
  total += len;
}

std::optional<LimitKind> PrimaryBreach(const BreachSet& breach) {
  if (breach.time) return LimitKind::TIME;
  if (breach.cpu) return LimitKind::CPU;
  if (breach.memory) return LimitKind::MEMORY;
  if (breach.output) return LimitKind::OUTPUT;
  return std::nullopt;
}

GovernedProcess::GovernedProcess(const SandboxProcess& proc, const GovernorLimits& limits,
                                 CancelToken& cancel) :
    proc_(proc), limits_(limits), cancel_(cancel), start_(Clock::now()), enforced_(false) {}

GovernedProcess::~GovernedProcess() {
  if (!enforced_) {
    KillUid(proc_.uid);
    if (proc_.pid > 0) kill(proc_.pid, SIGKILL);
    Reap_();
  }
  proc_.CloseFds();
}

void GovernedProcess::Reap_() {
  if (proc_.pid <= 0) return;
  while (waitpid(proc_.pid, nullptr, 0) < 0 && errno == EINTR);
  proc_.pid = -1;
}

GovernedProcess Attach(const SandboxProcess& proc, const GovernorLimits& limits, CancelToken& cancel) {
  spdlog::debug("Governor attached: pid={} uid={} wall={}ms cpu={}ms memory={}KiB output={}",
      proc.pid, proc.uid, limits.wall.count(), limits.cpu.count(), limits.memory_kib, limits.output);
  return GovernedProcess(proc, limits, cancel);
}

GovernorReport GovernedProcess::Enforce() {
  enforced_ = true;
  GovernorReport rep;
  OutputCapture capture(limits_.output);
  const auto deadline = start_ + limits_.wall;
  bool killed = false, helper_lost = false, report_too_long = false;
  Clock::time_point kill_time, drain_deadline;
  auto Kill = [&](const char* reason) {
    if (killed) return;
    spdlog::debug("Killing jail uid={}: {}", proc_.uid, reason);
    KillUid(proc_.uid);
    killed = true;
    kill_time = Clock::now();
  };
  auto CloseFd = [](int& fd) {
    close(fd);
    fd = -1;
  };

  while (true) {
    auto now = Clock::now();
    if (rep.has_result || helper_lost) {
      bool open = proc_.stdout_fd >= 0 || proc_.stderr_fd >= 0 || proc_.report_fd >= 0;
      if (!open || now >= drain_deadline) break;
    }

    std::vector<struct pollfd> fds;
    auto Watch = [&](int fd) {
      if (fd >= 0) fds.push_back({fd, POLLIN, 0});
    };
    Watch(proc_.result_fd);
    Watch(proc_.stdout_fd);
    Watch(proc_.stderr_fd);
    Watch(proc_.report_fd);
    if (!killed && !rep.cancelled) Watch(cancel_.Fd());

    auto timeout = limits_.sampling_interval;
    if (!killed && deadline > now) {
      timeout = std::min(timeout, std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    }
    if (timeout < 1ms) timeout = 1ms;
    if (poll(fds.data(), fds.size(), timeout.count()) < 0 && errno != EINTR) {
      spdlog::warn("Governor poll failed: {}", strerror(errno));
      Kill("poll failure");
    }

    if (proc_.stdout_fd >= 0 && !DrainFd(proc_.stdout_fd, [&](const char* buf, size_t len) {
          capture.Append(false, buf, len);
        })) {
      CloseFd(proc_.stdout_fd);
    }
    if (proc_.stderr_fd >= 0 && !DrainFd(proc_.stderr_fd, [&](const char* buf, size_t len) {
          capture.Append(true, buf, len);
        })) {
      CloseFd(proc_.stderr_fd);
    }
    if (proc_.report_fd >= 0 && !DrainFd(proc_.report_fd, [&](const char* buf, size_t len) {
          size_t room = (size_t)std::max(0L, limits_.report - (long)rep.report.size());
          if (len > room) report_too_long = true;
          rep.report.append(buf, std::min(len, room));
        })) {
      CloseFd(proc_.report_fd);
    }
    if (proc_.result_fd >= 0) {
      ssize_t ret = read(proc_.result_fd, &rep.result, sizeof(rep.result));
      if (ret == (ssize_t)sizeof(rep.result)) {
        rep.has_result = true;
        CloseFd(proc_.result_fd);
      } else if (ret >= 0 || (errno != EAGAIN && errno != EINTR)) {
        spdlog::warn("sandbox-exec pid={} exited without a result", proc_.pid);
        helper_lost = true;
        CloseFd(proc_.result_fd);
      }
      if (rep.has_result || helper_lost) {
        // the jail is gone; anything still running under its uid escaped it
        KillUid(proc_.uid);
        drain_deadline = Clock::now() + kDrainGrace;
        continue;
      }
    }
    if (rep.has_result || helper_lost) continue;

    now = Clock::now();
    if (capture.Exceeded() && !rep.breach.output) {
      rep.breach.output = true;
      Kill("output limit");
    }
    if (report_too_long && !rep.breach.output) {
      rep.breach.output = true;
      Kill("report too long");
    }
    if (!rep.cancelled && cancel_.Poll()) {
      rep.cancelled = true;
      Kill("cancelled");
    }
    if (!killed && now >= deadline) {
      rep.breach.time = true;
      Kill("wall clock limit");
    }
    if (killed && now - kill_time > kHelperGrace) {
      spdlog::warn("sandbox-exec pid={} did not report after kill", proc_.pid);
      kill(proc_.pid, SIGKILL);
      helper_lost = true;
      drain_deadline = now;
    }
  }
  Reap_();
  KillUid(proc_.uid);
  rep.elapsed = Clock::now() - start_;
  proc_.CloseFds();

  if (rep.has_result) {
    const struct cjail_result& res = rep.result;
    if (res.timekill == -1) {
      rep.jail_failed = true;
      rep.jail_errno = res.oomkill;
      spdlog::warn("cjail_exec error: errno={} {}", res.oomkill, strerror(res.oomkill));
    } else {
      if (res.timekill) {
        long cpu_us = ToUs(res.rus.ru_utime) + ToUs(res.rus.ru_stime);
        long cpu_limit_us = std::chrono::duration_cast<std::chrono::microseconds>(limits_.cpu).count();
        if (limits_.cpu.count() && cpu_us >= cpu_limit_us) {
          rep.breach.cpu = true;
        } else {
          rep.breach.time = true;
        }
      }
      // oomkill = -1 means failed to read oom (see cjail/cjail.h)
      if (res.oomkill > 0) rep.breach.memory = true;
      if (limits_.memory_kib && (long)res.stats.hiwater_vm > limits_.memory_kib) rep.breach.memory = true;
    }
  }
  if (capture.Exceeded()) rep.breach.output = true;
  rep.out = capture.TakeStdout();
  rep.err = capture.TakeStderr();
  spdlog::debug("Governor finished: uid={} result={} elapsed={}ms output={} time={} cpu={} memory={} "
                "output_breach={} cancelled={}",
      proc_.uid, rep.has_result, std::chrono::duration_cast<std::chrono::milliseconds>(rep.elapsed).count(),
      capture.Total(), rep.breach.time, rep.breach.cpu, rep.breach.memory, rep.breach.output, rep.cancelled);
  return rep;
}
