#include <codebox/metrics.h>

#include <unistd.h>
#include <sys/resource.h>
#include <fstream>
#include <iterator>

#include <fmt/format.h>
#include <codebox/utils.h>
#include <codebox/collector.h>

namespace {

long ResidentMemoryBytes() {
  std::ifstream fin("/proc/self/statm");
  long size = 0, resident = 0;
  if (!(fin >> size >> resident)) return 0;
  return resident * sysconf(_SC_PAGESIZE);
}

// user + system, all threads of the service; jailed code runs in other processes
double ProcessCpuSeconds() {
  struct rusage usage;
  if (getrusage(RUSAGE_SELF, &usage) < 0) return 0;
  auto Seconds = [](const struct timeval& tv) { return tv.tv_sec + tv.tv_usec * 1e-6; };
  return Seconds(usage.ru_utime) + Seconds(usage.ru_stime);
}

} // namespace

MetricsReporter::MetricsReporter() :
    duration_count_(0), duration_sum_us_(0), in_progress_(0), slots_in_use_(0) {
  for (auto& i : executions_) i = 0;
  for (auto& i : errors_) i = 0;
  for (auto& i : limit_hits_) i = 0;
  for (auto& i : duration_buckets_) i = 0;
}

void MetricsReporter::RecordTerminal_(Status status, std::chrono::duration<double> duration) noexcept {
  executions_[(size_t)status]++;
  double seconds = duration.count();
  for (size_t i = 0; i < kDurationBuckets.size(); i++) {
    if (seconds <= kDurationBuckets[i]) {
      duration_buckets_[i]++;
      break;
    }
  }
  duration_count_++;
  duration_sum_us_ += (uint64_t)(seconds * 1e6);
}

void MetricsReporter::Record(const ExecutionOutcome& res, std::chrono::duration<double> duration) noexcept {
  RecordTerminal_(OutcomeStatus(res), duration);
  if (auto kind = OutcomeErrorKind(res)) errors_[(size_t)*kind]++;
  if (auto limit = OutcomeLimit(res)) limit_hits_[(size_t)*limit]++;
}

void MetricsReporter::RecordInternalError(std::chrono::duration<double> duration) noexcept {
  RecordTerminal_(Status::INTERNAL_ERROR, duration);
  errors_[(size_t)ErrorKind::INTERNAL_ERROR]++;
}

void MetricsReporter::RecordInvalidRequest() noexcept {
  errors_[(size_t)ErrorKind::INVALID_REQUEST]++;
}

std::string MetricsReporter::Render() const {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  auto Header = [&](const char* name, const char* type, const char* help) {
    fmt::format_to(out, "# HELP {} {}\n# TYPE {} {}\n", name, help, name, type);
  };

  Header("codebox_executions_total", "counter", "Executions by terminal status.");
  for (size_t i = 0; i < kNumStatus; i++) {
    fmt::format_to(out, "codebox_executions_total{{status=\"{}\"}} {}\n",
        StatusName((Status)i), executions_[i].load());
  }

  Header("codebox_execution_duration_seconds", "histogram", "Wall clock time from submission to outcome.");
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kDurationBuckets.size(); i++) {
    cumulative += duration_buckets_[i];
    fmt::format_to(out, "codebox_execution_duration_seconds_bucket{{le=\"{}\"}} {}\n",
        kDurationBuckets[i], cumulative);
  }
  uint64_t count = duration_count_;
  fmt::format_to(out, "codebox_execution_duration_seconds_bucket{{le=\"+Inf\"}} {}\n", count);
  fmt::format_to(out, "codebox_execution_duration_seconds_sum {}\n", duration_sum_us_ / 1e6);
  fmt::format_to(out, "codebox_execution_duration_seconds_count {}\n", count);

  Header("codebox_resource_limit_hits_total", "counter", "Executions ended by a resource limit.");
  for (size_t i = 0; i < kNumLimitKind; i++) {
    fmt::format_to(out, "codebox_resource_limit_hits_total{{kind=\"{}\"}} {}\n",
        LimitKindName((LimitKind)i), limit_hits_[i].load());
  }

  Header("codebox_errors_total", "counter", "Failed requests by error kind.");
  for (size_t i = 0; i < kNumErrorKind; i++) {
    fmt::format_to(out, "codebox_errors_total{{kind=\"{}\"}} {}\n",
        ErrorKindName((ErrorKind)i), errors_[i].load());
  }

  Header("codebox_executions_in_progress", "gauge", "Requests submitted and not yet finished.");
  fmt::format_to(out, "codebox_executions_in_progress {}\n", in_progress_.load());
  Header("codebox_slots_in_use", "gauge", "Worker slots currently held.");
  fmt::format_to(out, "codebox_slots_in_use {}\n", slots_in_use_.load());
  Header("codebox_process_resident_memory_bytes", "gauge", "Resident memory of the service process.");
  fmt::format_to(out, "codebox_process_resident_memory_bytes {}\n", ResidentMemoryBytes());
  Header("codebox_process_cpu_seconds_total", "counter", "CPU time consumed by the service process.");
  fmt::format_to(out, "codebox_process_cpu_seconds_total {:.6f}\n", ProcessCpuSeconds());
  return fmt::to_string(buf);
}
