#ifndef INCLUDE_CODEBOX_OUTCOME_H_
#define INCLUDE_CODEBOX_OUTCOME_H_

#include <string>
#include <variant>
#include <optional>

#include <nlohmann/json.hpp>

#define ENUM_STATUS_ \
  X(OK, "ok") \
  X(ERROR, "error") \
  X(TIMEOUT, "timeout") \
  X(RESOURCE_EXCEEDED, "resource_exceeded") \
  X(KILLED, "killed") \
  X(INTERNAL_ERROR, "internal_error")
enum class Status {
#define X(name, wire) name,
  ENUM_STATUS_
#undef X
};

#define ENUM_ERROR_KIND_ \
  X(SYNTAX_ERROR, "SyntaxError") \
  X(PERMISSION_DENIED, "PermissionDenied") \
  X(RUNTIME_ERROR, "RuntimeError") \
  X(TIMED_OUT, "TimedOut") \
  X(MEMORY_EXCEEDED, "MemoryExceeded") \
  X(OUTPUT_EXCEEDED, "OutputExceeded") \
  X(CONCURRENCY_EXCEEDED, "ConcurrencyExceeded") \
  X(KILLED, "Killed") \
  /* not produced by executed code */ \
  X(INVALID_REQUEST, "InvalidRequest") \
  X(INTERNAL_ERROR, "InternalError")
enum class ErrorKind {
#define X(name, wire) name,
  ENUM_ERROR_KIND_
#undef X
};

// TIME is wall clock, CPU is accumulated processor time
#define ENUM_LIMIT_KIND_ \
  X(TIME, "time") \
  X(CPU, "cpu") \
  X(MEMORY, "memory") \
  X(OUTPUT, "output") \
  X(CONCURRENCY, "concurrency")
enum class LimitKind {
#define X(name, wire) name,
  ENUM_LIMIT_KIND_
#undef X
};

// One captured stream; data is always a prefix of what the program wrote
struct CapturedOutput {
  std::string data;
  bool truncated;

  CapturedOutput() : truncated(false) {}
  CapturedOutput(std::string data, bool truncated) :
      data(std::move(data)), truncated(truncated) {}
};

namespace outcome {

struct Success {
  nlohmann::json value;
  CapturedOutput out, err;
};

struct RuntimeError {
  ErrorKind kind; // SYNTAX_ERROR, PERMISSION_DENIED or RUNTIME_ERROR
  std::string message;
  std::string exception; // Python exception class, may be empty
  std::string traceback;
  CapturedOutput out, err;
};

struct TimedOut {
  LimitKind which; // TIME or CPU
  CapturedOutput out, err;
};

struct ResourceExceeded {
  LimitKind which; // MEMORY, OUTPUT or CONCURRENCY
  CapturedOutput out, err;
};

struct Killed {
  std::string reason;
  CapturedOutput out, err;
};

} // namespace outcome

using ExecutionOutcome = std::variant<
    outcome::Success, outcome::RuntimeError, outcome::TimedOut,
    outcome::ResourceExceeded, outcome::Killed>;

struct ErrorDescriptor {
  ErrorKind kind;
  std::string message;
  std::string exception, traceback; // omitted on the wire when empty
};

// The single wire-level shape of every response
struct ResponseEnvelope {
  Status status;
  nlohmann::json value;
  CapturedOutput out, err;
  std::optional<ErrorDescriptor> error;
  std::string request_id;

  ResponseEnvelope() : status(Status::OK) {}
  nlohmann::json ToJson() const;
};

#endif  // INCLUDE_CODEBOX_OUTCOME_H_
