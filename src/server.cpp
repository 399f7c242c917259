#include "server.h"

#include <spdlog/spdlog.h>
#include <codebox/collector.h>
#include <codebox/utils.h>

#include "http_utils.h"

using nlohmann::json;

namespace {

// the source limit, JSON escaping, and the bindings
constexpr size_t kMaxBodySize = 16 << 20;

} // namespace

CodeboxServer::CodeboxServer(const ServiceConfig& conf, ExecutionPool& pool, MetricsReporter& metrics) :
    conf_(conf), pool_(pool), metrics_(metrics) {
  // enough threads that saturation is decided by the pool rather than by the HTTP queue
  size_t threads = conf_.pool.capacity + conf_.pool.queue_depth + 4;
  main_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  main_.set_payload_max_length(kMaxBodySize);
  main_.set_logger(http_utils::LogRequest);
  main_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
    HandleExecute_(req, res);
  });
  main_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
    HandleHealth_(req, res);
  });
  metrics_server_.set_logger(http_utils::LogRequest);
  metrics_server_.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
    HandleMetrics_(req, res);
  });
}

CodeboxServer::~CodeboxServer() {
  Stop();
}

bool CodeboxServer::Start() {
  if (!main_.bind_to_port(conf_.host.c_str(), conf_.main_port)) {
    spdlog::error("Cannot bind {}:{}", conf_.host, conf_.main_port);
    return false;
  }
  if (!metrics_server_.bind_to_port(conf_.host.c_str(), conf_.metrics_port)) {
    spdlog::error("Cannot bind {}:{}", conf_.host, conf_.metrics_port);
    return false;
  }
  main_thread_ = std::thread([this] { main_.listen_after_bind(); });
  metrics_thread_ = std::thread([this] { metrics_server_.listen_after_bind(); });
  spdlog::info("Serving on {}:{}, metrics on {}:{}", conf_.host, conf_.main_port, conf_.host, conf_.metrics_port);
  return true;
}

void CodeboxServer::Stop() {
  main_.stop();
  metrics_server_.stop();
  if (main_thread_.joinable()) main_thread_.join();
  if (metrics_thread_.joinable()) metrics_thread_.join();
}

void CodeboxServer::HandleExecute_(const httplib::Request& req, httplib::Response& res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error& e) {
    metrics_.RecordInvalidRequest();
    ResponseEnvelope env = InvalidRequestEnvelope(std::string("malformed JSON: ") + e.what());
    env.request_id = GenerateRequestId();
    http_utils::ReplyJson(res, 400, env.ToJson());
    return;
  }

  ExecutionRequest request;
  std::string error;
  if (!ParseRequest(body, conf_.limits, request, error)) {
    metrics_.RecordInvalidRequest();
    spdlog::info("Rejected invalid request: {}", error);
    ResponseEnvelope env = InvalidRequestEnvelope(error);
    env.request_id = GenerateRequestId();
    if (auto id = body.find("request_id"); body.is_object() && id != body.end() && id->is_string()) {
      env.request_id = id->get<std::string>();
    }
    http_utils::ReplyJson(res, 400, env.ToJson());
    return;
  }
  spdlog::debug("Request {} received: {} bytes of code, {} bindings, limits {}ms/{}B/{}B",
      request.request_id, request.source_code.size(), request.bindings.size(),
      request.limits.time.count(), request.limits.memory, request.limits.output);

  CancelToken cancel;
  cancel.SetDisconnectCheck([&req] { return req.is_connection_closed(); });
  ResponseEnvelope env;
  int status = 200;
  try {
    ExecutionOutcome result = pool_.Submit(request, cancel);
    env = Collect(result);
    if (auto ptr = std::get_if<outcome::ResourceExceeded>(&result); ptr && ptr->which == LimitKind::CONCURRENCY) {
      status = 503;
    }
  } catch (const SandboxError& e) {
    env = InternalErrorEnvelope(e.what());
    status = 500;
  }
  env.request_id = request.request_id;
  http_utils::ReplyJson(res, status, env.ToJson());
}

void CodeboxServer::HandleHealth_(const httplib::Request&, httplib::Response& res) {
  http_utils::ReplyJson(res, 200, {
    {"status", "ok"},
    {"capacity", pool_.Capacity()},
    {"slots_in_use", pool_.InUse()},
    {"queued", pool_.Waiting()},
  });
}

void CodeboxServer::HandleMetrics_(const httplib::Request&, httplib::Response& res) {
  res.set_content(metrics_.Render(), "text/plain; version=0.0.4");
}
