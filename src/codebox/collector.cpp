#include <codebox/collector.h>

#include <type_traits>

#include <codebox/utils.h>

using nlohmann::json;

namespace {

template <class T, class U>
constexpr bool kIs = std::is_same_v<std::decay_t<T>, U>;

ErrorKind LimitErrorKind(LimitKind kind) {
  switch (kind) {
    case LimitKind::TIME: [[fallthrough]];
    case LimitKind::CPU: return ErrorKind::TIMED_OUT;
    case LimitKind::MEMORY: return ErrorKind::MEMORY_EXCEEDED;
    case LimitKind::OUTPUT: return ErrorKind::OUTPUT_EXCEEDED;
    case LimitKind::CONCURRENCY: return ErrorKind::CONCURRENCY_EXCEEDED;
  }
  __builtin_unreachable();
}

const char* LimitMessage(LimitKind kind) {
  switch (kind) {
    case LimitKind::TIME: return "time limit exceeded";
    case LimitKind::CPU: return "CPU time limit exceeded";
    case LimitKind::MEMORY: return "memory limit exceeded";
    case LimitKind::OUTPUT: return "output limit exceeded";
    case LimitKind::CONCURRENCY: return "all execution slots are busy";
  }
  __builtin_unreachable();
}

} // namespace

Status OutcomeStatus(const ExecutionOutcome& res) {
  return std::visit([](auto&& o) {
    using T = decltype(o);
    if constexpr (kIs<T, outcome::Success>) return Status::OK;
    else if constexpr (kIs<T, outcome::RuntimeError>) return Status::ERROR;
    else if constexpr (kIs<T, outcome::TimedOut>) return Status::TIMEOUT;
    else if constexpr (kIs<T, outcome::ResourceExceeded>) return Status::RESOURCE_EXCEEDED;
    else return Status::KILLED;
  }, res);
}

std::optional<ErrorKind> OutcomeErrorKind(const ExecutionOutcome& res) {
  return std::visit([](auto&& o) -> std::optional<ErrorKind> {
    using T = decltype(o);
    if constexpr (kIs<T, outcome::Success>) return std::nullopt;
    else if constexpr (kIs<T, outcome::RuntimeError>) return o.kind;
    else if constexpr (kIs<T, outcome::TimedOut> || kIs<T, outcome::ResourceExceeded>) {
      return LimitErrorKind(o.which);
    } else {
      return ErrorKind::KILLED;
    }
  }, res);
}

std::optional<LimitKind> OutcomeLimit(const ExecutionOutcome& res) {
  if (auto ptr = std::get_if<outcome::TimedOut>(&res)) return ptr->which;
  if (auto ptr = std::get_if<outcome::ResourceExceeded>(&res)) return ptr->which;
  return std::nullopt;
}

ResponseEnvelope Collect(const ExecutionOutcome& res) {
  ResponseEnvelope ret;
  ret.status = OutcomeStatus(res);
  std::visit([&](auto&& o) {
    using T = decltype(o);
    ret.out = o.out;
    ret.err = o.err;
    if constexpr (kIs<T, outcome::Success>) {
      ret.value = o.value;
    } else if constexpr (kIs<T, outcome::RuntimeError>) {
      ret.error = ErrorDescriptor{o.kind, o.message, o.exception, o.traceback};
    } else if constexpr (kIs<T, outcome::TimedOut> || kIs<T, outcome::ResourceExceeded>) {
      ret.error = ErrorDescriptor{LimitErrorKind(o.which), LimitMessage(o.which), "", ""};
    } else {
      ret.error = ErrorDescriptor{ErrorKind::KILLED, o.reason, "", ""};
    }
  }, res);
  return ret;
}

ResponseEnvelope InvalidRequestEnvelope(const std::string& message) {
  ResponseEnvelope ret;
  ret.status = Status::ERROR;
  ret.error = ErrorDescriptor{ErrorKind::INVALID_REQUEST, message, "", ""};
  return ret;
}

ResponseEnvelope InternalErrorEnvelope(const std::string& message) {
  ResponseEnvelope ret;
  ret.status = Status::INTERNAL_ERROR;
  ret.error = ErrorDescriptor{ErrorKind::INTERNAL_ERROR, message, "", ""};
  return ret;
}

json ResponseEnvelope::ToJson() const {
  json ret = {
    {"status", StatusName(status)},
    {"value", value},
    {"stdout", out.data},
    {"stderr", err.data},
    {"stdout_truncated", out.truncated},
    {"stderr_truncated", err.truncated},
    {"error", nullptr},
    {"request_id", request_id},
  };
  if (error) {
    json& err_obj = ret["error"] = {
      {"kind", ErrorKindName(error->kind)},
      {"message", error->message},
    };
    if (!error->exception.empty()) err_obj["exception"] = error->exception;
    if (!error->traceback.empty()) err_obj["traceback"] = error->traceback;
  }
  return ret;
}
