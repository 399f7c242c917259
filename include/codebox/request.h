#ifndef INCLUDE_CODEBOX_REQUEST_H_
#define INCLUDE_CODEBOX_REQUEST_H_

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

struct ExecutionLimits {
  std::chrono::milliseconds time; // wall clock; also used as the CPU time limit
  long memory; // bytes
  long output; // bytes, applied to stdout and stderr separately

  ExecutionLimits() : time(0), memory(0), output(0) {}
  ExecutionLimits(std::chrono::milliseconds time, long memory, long output) :
      time(time), memory(memory), output(output) {}
};

// Hard bounds compiled into the service; configured maximums may not exceed them
constexpr std::chrono::milliseconds kAbsoluteMaxTime{600'000};
constexpr long kAbsoluteMaxMemory = 64L << 30;
constexpr long kAbsoluteMaxOutput = 256L << 20;
// the interpreter itself needs this much address space to start
constexpr long kMinMemoryLimit = 32L << 20;
constexpr size_t kMaxSourceSize = 1 << 20;

struct LimitPolicy {
  ExecutionLimits defaults;
  ExecutionLimits maximums; // the server-wide ceiling

  LimitPolicy() :
      defaults(std::chrono::milliseconds(5'000), 256L << 20, 1L << 20),
      maximums(std::chrono::milliseconds(60'000), 2048L << 20, 16L << 20) {}
};

class ExecutionRequest {
 public:
  std::string request_id; // for correlation only; never interpreted
  std::string source_code;
  nlohmann::json bindings; // always an object
  ExecutionLimits limits;

  ExecutionRequest() : bindings(nlohmann::json::object()) {}
};

// Builds a request from the inbound JSON body, filling unspecified limits from
//  policy.defaults. Accepts "code"/"source_code" and "params"/"bindings".
// Returns false with a human-readable reason if the body is malformed or the
//  request violates the policy; no worker should be provisioned in that case.
bool ParseRequest(const nlohmann::json& body, const LimitPolicy& policy,
                  ExecutionRequest& request, std::string& error);

// Checks limits against the policy ceiling and binding names against the
//  names reserved by the sandbox
bool ValidateRequest(const ExecutionRequest& request, const LimitPolicy& policy, std::string& error);

bool IsForbiddenBindingName(const std::string& name);

#endif  // INCLUDE_CODEBOX_REQUEST_H_
