#include <codebox/request.h>

#include <set>
#include <cctype>
#include <limits>

#include <fmt/core.h>
#include <codebox/utils.h>

using nlohmann::json;

namespace {

constexpr size_t kMaxRequestIdLength = 128;

const std::set<std::string> kPythonKeywords = {
  "False", "None", "True", "and", "as", "assert", "async", "await", "break",
  "class", "continue", "def", "del", "elif", "else", "except", "finally", "for",
  "from", "global", "if", "import", "in", "is", "lambda", "nonlocal", "not",
  "or", "pass", "raise", "return", "try", "while", "with", "yield",
};

bool IsIdentifier(const std::string& name) {
  if (name.empty()) return false;
  if (!(isalpha((unsigned char)name[0]) || name[0] == '_')) return false;
  for (char c : name) {
    if (!(isalnum((unsigned char)c) || c == '_')) return false;
  }
  return true;
}

// Reads an optional positive integer field; absent or null keeps val
bool ReadLimit(const json& body, const char* key, long& val, std::string& error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) return true;
  if (!it->is_number_integer()) {
    error = fmt::format("{} must be an integer", key);
    return false;
  }
  if (it->is_number_unsigned() && it->get<uint64_t>() > (uint64_t)std::numeric_limits<long>::max()) {
    error = fmt::format("{} is too large", key);
    return false;
  }
  val = it->get<long>();
  if (val <= 0) {
    error = fmt::format("{} must be positive", key);
    return false;
  }
  return true;
}

// first of the given keys that is present and not null
json::const_iterator FindAny(const json& body, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = body.find(key);
    if (it != body.end() && !it->is_null()) return it;
  }
  return body.end();
}

} // namespace

bool IsForbiddenBindingName(const std::string& name) {
  if (!IsIdentifier(name)) return true;
  if (kPythonKeywords.count(name)) return true;
  if (name.size() >= 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0) {
    return true;
  }
  return name == "exit" || name == "quit";
}

bool ParseRequest(const json& body, const LimitPolicy& policy, ExecutionRequest& req, std::string& error) {
  if (!body.is_object()) {
    error = "request body must be a JSON object";
    return false;
  }
  auto code = FindAny(body, {"source_code", "code"});
  if (code == body.end()) {
    error = "missing field: code";
    return false;
  }
  if (!code->is_string()) {
    error = "code must be a string";
    return false;
  }
  req.source_code = code->get<std::string>();
  if (req.source_code.size() > kMaxSourceSize) {
    error = fmt::format("code is longer than {} bytes", kMaxSourceSize);
    return false;
  }

  req.bindings = json::object();
  if (auto bindings = FindAny(body, {"bindings", "params"}); bindings != body.end()) {
    if (!bindings->is_object()) {
      error = "params must be a JSON object";
      return false;
    }
    req.bindings = *bindings;
  }

  req.limits = policy.defaults;
  long time_ms = req.limits.time.count();
  if (!ReadLimit(body, "time_limit_ms", time_ms, error) ||
      !ReadLimit(body, "memory_limit_bytes", req.limits.memory, error) ||
      !ReadLimit(body, "output_limit_bytes", req.limits.output, error)) {
    return false;
  }
  req.limits.time = std::chrono::milliseconds(time_ms);

  if (auto id = body.find("request_id"); id != body.end() && !id->is_null()) {
    if (!id->is_string() || id->get_ref<const std::string&>().empty() ||
        id->get_ref<const std::string&>().size() > kMaxRequestIdLength) {
      error = fmt::format("request_id must be a non-empty string of at most {} bytes", kMaxRequestIdLength);
      return false;
    }
    req.request_id = id->get<std::string>();
  } else {
    req.request_id = GenerateRequestId();
  }
  return ValidateRequest(req, policy, error);
}

bool ValidateRequest(const ExecutionRequest& req, const LimitPolicy& policy, std::string& error) {
  const ExecutionLimits& lim = req.limits;
  const ExecutionLimits& max = policy.maximums;
  if (lim.time.count() <= 0 || lim.time > max.time) {
    error = fmt::format("time_limit_ms must be within 1..{}", max.time.count());
    return false;
  }
  if (lim.memory < kMinMemoryLimit || lim.memory > max.memory) {
    error = fmt::format("memory_limit_bytes must be within {}..{}", kMinMemoryLimit, max.memory);
    return false;
  }
  if (lim.output <= 0 || lim.output > max.output) {
    error = fmt::format("output_limit_bytes must be within 1..{}", max.output);
    return false;
  }
  if (!req.bindings.is_object()) {
    error = "params must be a JSON object";
    return false;
  }
  for (auto& item : req.bindings.items()) {
    if (IsForbiddenBindingName(item.key())) {
      error = fmt::format("binding name not allowed: {}", item.key());
      return false;
    }
  }
  return true;
}
