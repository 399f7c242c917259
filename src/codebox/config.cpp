#include <codebox/config.h>

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <algorithm>

#include <fmt/core.h>
#include <tortellini.hh>
#include <spdlog/spdlog.h>

namespace {

// distinguishes an absent key from an empty list
constexpr char kUnset[] = "\x01";

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, ',');) {
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (!item.empty()) ret.push_back(item);
  }
  return ret;
}

bool ParseLong(const char* key, const std::string& str, long& val, std::string& error) {
  try {
    size_t pos = 0;
    long ret = std::stol(str, &pos);
    if (pos != str.size()) throw std::invalid_argument(str);
    val = ret;
    return true;
  } catch (const std::exception&) {
    error = fmt::format("{}: not an integer: \"{}\"", key, str);
    return false;
  }
}

// checked before any narrowing or unit scaling
bool InRange(const char* key, long val, long lo, long hi, std::string& error) {
  if (val >= lo && val <= hi) return true;
  error = fmt::format("{}: must be within {}..{}", key, lo, hi);
  return false;
}

} // namespace

bool LoadConfigFile(const std::filesystem::path& conf_path, ServiceConfig& conf, std::string& error) {
  std::ifstream fin(conf_path);
  if (!fin) {
    error = fmt::format("cannot open {}", conf_path.string());
    return false;
  }
  tortellini::ini ini;
  fin >> ini;

  conf.host = ini[""]["host"] | conf.host;
  long main_port = ini[""]["main_port"] | (long)conf.main_port;
  long metrics_port = ini[""]["metrics_port"] | (long)conf.metrics_port;
  long capacity = ini[""]["pool_capacity"] | (long)conf.pool.capacity;
  if (!InRange("main_port", main_port, 1, 65535, error) ||
      !InRange("metrics_port", metrics_port, 1, 65535, error) ||
      !InRange("pool_capacity", capacity, 1, kMaxPoolCapacity, error)) {
    return false;
  }
  conf.main_port = main_port;
  conf.metrics_port = metrics_port;
  conf.pool.capacity = capacity;
  conf.log_level = ToLower(ini[""]["log_level"] | conf.log_level);
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) conf.box_root = box_root;
  long queue_depth = ini[""]["queue_depth"] | (long)conf.pool.queue_depth;
  if (queue_depth < 0) {
    error = "queue_depth: must not be negative";
    return false;
  }
  conf.pool.queue_depth = queue_depth;
  conf.pool.queue_wait = std::chrono::milliseconds(
      ini[""]["queue_wait_ms"] | (long)conf.pool.queue_wait.count());

  auto& lim = conf.limits;
  lim.defaults.time = std::chrono::milliseconds(
      ini["limits"]["default_time_limit_ms"] | (long)lim.defaults.time.count());
  lim.maximums.time = std::chrono::milliseconds(
      ini["limits"]["max_time_limit_ms"] | (long)lim.maximums.time.count());
  auto Scaled = [&](const char* key, long& field, int shift, long absolute_max) {
    long val = ini["limits"][key] | (field >> shift);
    if (!InRange(key, val, 1, absolute_max >> shift, error)) return false;
    field = val << shift;
    return true;
  };
  if (!Scaled("default_memory_limit_mib", lim.defaults.memory, 20, kAbsoluteMaxMemory) ||
      !Scaled("max_memory_limit_mib", lim.maximums.memory, 20, kAbsoluteMaxMemory) ||
      !Scaled("default_output_limit_kib", lim.defaults.output, 10, kAbsoluteMaxOutput) ||
      !Scaled("max_output_limit_kib", lim.maximums.output, 10, kAbsoluteMaxOutput)) {
    return false;
  }

  auto& sandbox = conf.sandbox;
  std::string python = ini["sandbox"]["python"] | "";
  if (python.size()) sandbox.python = python;
  std::string blocked = ini["sandbox"]["blocked_modules"] | kUnset;
  if (blocked != kUnset) sandbox.blocked_modules = SplitList(blocked);
  sandbox.scratch_size_kib = ini["sandbox"]["scratch_size_kib"] | sandbox.scratch_size_kib;
  sandbox.sampling_interval = std::chrono::milliseconds(
      ini["sandbox"]["sampling_interval_ms"] | (long)sandbox.sampling_interval.count());
  spdlog::info("Loaded configuration from {}", conf_path.string());
  return true;
}

bool ApplyEnvironment(ServiceConfig& conf, std::string& error, const EnvLookup& lookup) {
  // apply only sees values within lo..hi
  auto Long = [&](const char* key, long lo, long hi, auto&& apply) {
    const char* val = lookup(key);
    if (!val) return true;
    long num;
    if (!ParseLong(key, val, num, error) || !InRange(key, num, lo, hi, error)) return false;
    apply(num);
    return true;
  };
  using std::chrono::milliseconds;
  constexpr long kLongMax = std::numeric_limits<long>::max();
  const long max_ms = kAbsoluteMaxTime.count();
  if (const char* val = lookup("SERVER_HOST")) conf.host = val;
  if (const char* val = lookup("LOG_LEVEL")) conf.log_level = ToLower(val);
  auto& lim = conf.limits;
  return
      Long("MAIN_PORT", 1, 65535, [&](long x) { conf.main_port = x; }) &&
      Long("METRICS_PORT", 1, 65535, [&](long x) { conf.metrics_port = x; }) &&
      Long("MAX_WORKERS", 1, kMaxPoolCapacity, [&](long x) { conf.pool.capacity = x; }) &&
      Long("CODEBOX_QUEUE_DEPTH", 0, kLongMax, [&](long x) { conf.pool.queue_depth = x; }) &&
      Long("CODEBOX_QUEUE_WAIT_MS", 0, kLongMax, [&](long x) { conf.pool.queue_wait = milliseconds(x); }) &&
      Long("TIMEOUT", 1, max_ms / 1000, [&](long x) { lim.defaults.time = std::chrono::seconds(x); }) &&
      Long("CODEBOX_DEFAULT_TIME_LIMIT_MS", 1, max_ms, [&](long x) { lim.defaults.time = milliseconds(x); }) &&
      Long("CODEBOX_MAX_TIME_LIMIT_MS", 1, max_ms, [&](long x) { lim.maximums.time = milliseconds(x); }) &&
      Long("CODEBOX_DEFAULT_MEMORY_LIMIT_MIB", 1, kAbsoluteMaxMemory >> 20,
           [&](long x) { lim.defaults.memory = x << 20; }) &&
      Long("CODEBOX_MAX_MEMORY_LIMIT_MIB", 1, kAbsoluteMaxMemory >> 20,
           [&](long x) { lim.maximums.memory = x << 20; }) &&
      Long("CODEBOX_DEFAULT_OUTPUT_LIMIT_KIB", 1, kAbsoluteMaxOutput >> 10,
           [&](long x) { lim.defaults.output = x << 10; }) &&
      Long("CODEBOX_MAX_OUTPUT_LIMIT_KIB", 1, kAbsoluteMaxOutput >> 10,
           [&](long x) { lim.maximums.output = x << 10; });
}

bool ValidateConfig(const ServiceConfig& conf, std::string& error) {
  auto Fail = [&](const std::string& msg) {
    error = msg;
    return false;
  };
  if (conf.main_port < 1 || conf.main_port > 65535) return Fail("main_port: must be within 1..65535");
  if (conf.metrics_port < 1 || conf.metrics_port > 65535) return Fail("metrics_port: must be within 1..65535");
  if (conf.main_port == conf.metrics_port) return Fail("metrics_port: must differ from main_port");
  if (!conf.log_level.empty() && conf.log_level != "off" &&
      spdlog::level::from_str(conf.log_level) == spdlog::level::off) {
    return Fail(fmt::format("log_level: unknown level \"{}\"", conf.log_level));
  }
  if (conf.box_root.empty() || !conf.box_root.is_absolute()) return Fail("box_root: must be an absolute path");
  if (conf.pool.capacity < 1 || conf.pool.capacity > kMaxPoolCapacity) {
    return Fail(fmt::format("pool_capacity: must be within 1..{}", kMaxPoolCapacity));
  }
  if (conf.pool.queue_wait.count() < 0) return Fail("queue_wait_ms: must not be negative");

  const auto& lim = conf.limits;
  if (lim.maximums.time.count() <= 0 || lim.maximums.time > kAbsoluteMaxTime) {
    return Fail(fmt::format("max_time_limit_ms: must be within 1..{}", kAbsoluteMaxTime.count()));
  }
  if (lim.defaults.time.count() <= 0 || lim.defaults.time > lim.maximums.time) {
    return Fail("default_time_limit_ms: must be positive and at most max_time_limit_ms");
  }
  if (lim.maximums.memory < kMinMemoryLimit || lim.maximums.memory > kAbsoluteMaxMemory) {
    return Fail(fmt::format("max_memory_limit_mib: must be within {}..{}",
        kMinMemoryLimit >> 20, kAbsoluteMaxMemory >> 20));
  }
  if (lim.defaults.memory < kMinMemoryLimit || lim.defaults.memory > lim.maximums.memory) {
    return Fail(fmt::format("default_memory_limit_mib: must be at least {} and at most max_memory_limit_mib",
        kMinMemoryLimit >> 20));
  }
  if (lim.maximums.output <= 0 || lim.maximums.output > kAbsoluteMaxOutput) {
    return Fail(fmt::format("max_output_limit_kib: must be within 1..{}", kAbsoluteMaxOutput >> 10));
  }
  if (lim.defaults.output <= 0 || lim.defaults.output > lim.maximums.output) {
    return Fail("default_output_limit_kib: must be positive and at most max_output_limit_kib");
  }

  const auto& sandbox = conf.sandbox;
  if (!sandbox.python.is_absolute()) return Fail("python: must be an absolute path");
  if (sandbox.scratch_size_kib <= 0) return Fail("scratch_size_kib: must be positive");
  if (sandbox.sampling_interval.count() <= 0 || sandbox.sampling_interval.count() > 1000) {
    return Fail("sampling_interval_ms: must be within 1..1000");
  }
  for (auto& name : sandbox.blocked_modules) {
    if (name.find_first_of(", \t") != std::string::npos) {
      return Fail(fmt::format("blocked_modules: invalid module name \"{}\"", name));
    }
  }
  return true;
}
