#include "http_utils.h"
#include <stdexcept>
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  // request bodies carry source code
  constexpr size_t kMaxLogged = 256;
  if (str.size() <= kMaxLogged) return str;
  return fmt::format("{}... ({} bytes)", str.substr(0, kMaxLogged), str.size());
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

nlohmann::json ParseBody(const httplib::Request& req) {
  auto body = nlohmann::json::parse(req.body);
  if (!body.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
  return body;
}

void ReplyJson(httplib::Response& res, const nlohmann::json& body, int status) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void ReplyError(httplib::Response& res, int status, const std::string& message) {
  ReplyJson(res, {{"error", message}}, status);
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}
