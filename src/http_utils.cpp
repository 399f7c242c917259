#include "http_utils.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatParams(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  auto level = IsSuccess(res.status) ? spdlog::level::debug : spdlog::level::info;
  spdlog::log(level, "{} {} from {}:{} params {} -> {} ({} bytes)",
      req.method, req.path, req.remote_addr, req.remote_port,
      FormatParams(req.params), res.status, res.body.size());
}

void ReplyJson(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

} // namespace http_utils
