#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests and write JSON replies

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace http_utils {

std::string FormatParams(const httplib::Params&);

bool IsSuccess(int code);

// set as the server logger; one line per request, at debug (info for failures)
void LogRequest(const httplib::Request&, const httplib::Response&);

// invalid UTF-8 (e.g. a truncated multi-byte character) is replaced by U+FFFD
void ReplyJson(httplib::Response&, int status, const nlohmann::json&);

} // namespace http_utils

#endif  // HTTP_UTILS_H_
