#include "server_io.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>
#include <gradebox/utils.h>
#include "http_utils.h"

namespace {

constexpr size_t kMaxPayload = 16 * 1024 * 1024;
constexpr int kMinServerThreads = 8;
constexpr auto kConnectionPollInterval = std::chrono::milliseconds(50);

using http_utils::ReplyError;
using http_utils::ReplyJson;

// Keeps a request cancellable for the lifetime of its handler
class ScopedRequest {
  RequestRegistry& registry_;
  std::string id_;
  std::shared_ptr<CancelToken> token_;
 public:
  ScopedRequest(RequestRegistry& registry, std::string id) :
      registry_(registry), id_(std::move(id)), token_(registry_.Register(id_)) {}
  ~ScopedRequest() { registry_.Unregister(id_, token_); }
  ScopedRequest(const ScopedRequest&) = delete;
  ScopedRequest& operator=(const ScopedRequest&) = delete;
  CancelToken* Token() const { return token_.get(); }
};

// Cancels the request once its client has gone away
class ConnectionWatch {
  std::mutex mtx_;
  std::condition_variable cv_;
  bool done_;
  std::thread thread_;
 public:
  ConnectionWatch(const httplib::Request& req, CancelToken& token) : done_(false) {
    thread_ = std::thread([this, &req, &token]() {
      std::unique_lock lck(mtx_);
      while (!cv_.wait_for(lck, kConnectionPollInterval, [this]() { return done_; })) {
        if (req.is_connection_closed()) {
          spdlog::info("Client of {} disconnected, cancelling", req.path);
          token.Cancel();
          return;
        }
      }
    });
  }
  ~ConnectionWatch() {
    {
      std::lock_guard lck(mtx_);
      done_ = true;
    }
    cv_.notify_one();
    thread_.join();
  }
  ConnectionWatch(const ConnectionWatch&) = delete;
  ConnectionWatch& operator=(const ConnectionWatch&) = delete;
};

inline double ToMs(long us) { return us / 1000.0; }

template <class Func>
httplib::Server::Handler JsonHandler(const char* name, Func func) {
  return [name, func](const httplib::Request& req, httplib::Response& res) {
    spdlog::debug("{} body {}", name, http_utils::FormatParam(req.body));
    try {
      func(req, res);
    } catch (const nlohmann::json::exception& err) {
      spdlog::info("{}: malformed request: {}", name, err.what());
      ReplyError(res, 400, "Malformed request");
    } catch (const std::invalid_argument& err) {
      ReplyError(res, 400, err.what());
    } catch (const std::exception& err) {
      spdlog::warn("{}: {}", name, err.what());
      ReplyError(res, 500, "Internal error");
    }
  };
}

void HandleExecute(const httplib::Request& req, httplib::Response& res, const SandboxLimits& limits) {
  auto body = http_utils::ParseBody(req);
  std::string language = body.value("language", "");
  if (language.empty() || !body.contains("code")) {
    ReplyError(res, 400, "Language and code are required");
    return;
  }
  // an empty program is valid
  std::string code = body.at("code").get<std::string>();
  std::string input = body.value("input", "");
  if (!Resolve(language)) {
    ReplyError(res, 400, "Unsupported language: " + language);
    return;
  }
  ScopedRequest request(Requests(), body.value("request_id", ""));
  ConnectionWatch watch(req, *request.Token());
  auto result = RunCode(language, code, input, limits, request.Token());
  if (!IsStudentVisible(result.outcome)) {
    ReplyError(res, 500, "Internal execution error");
    return;
  }
  ReplyJson(res, ExecutionToJson(result));
}

void HandleGrade(const httplib::Request& req, httplib::Response& res, const SandboxLimits& limits) {
  auto body = http_utils::ParseBody(req);
  std::string language = body.value("language", "");
  if (language.empty() || !body.contains("code")) {
    ReplyError(res, 400, "Language and code are required");
    return;
  }
  std::string code = body.at("code").get<std::string>();
  auto test_cases = ParseTestCases(body.at("test_cases"));
  auto mode = ParseComparisonMode(body.value("comparison_mode", ""));
  ScopedRequest request(Requests(), body.value("request_id", ""));
  ConnectionWatch watch(req, *request.Token());
  auto summary = Grade(test_cases, language, code, mode, limits, request.Token());
  if (summary.compile_outcome == Outcome::UNSUPPORTED_LANGUAGE) {
    ReplyError(res, 400, "Unsupported language: " + language);
    return;
  }
  if (!IsStudentVisible(summary.compile_outcome)) {
    ReplyError(res, 500, "Internal execution error");
    return;
  }
  ReplyJson(res, SummaryToJson(summary, mode));
}

} // namespace

std::shared_ptr<CancelToken> RequestRegistry::Register(const std::string& id) {
  auto token = std::make_shared<CancelToken>();
  if (id.empty()) return token;
  std::lock_guard lck(mtx_);
  tokens_.emplace(id, token);
  return token;
}

void RequestRegistry::Unregister(const std::string& id, const std::shared_ptr<CancelToken>& token) {
  if (id.empty()) return;
  std::lock_guard lck(mtx_);
  auto [first, last] = tokens_.equal_range(id);
  for (auto it = first; it != last; ++it) {
    if (it->second == token) {
      tokens_.erase(it);
      return;
    }
  }
}

bool RequestRegistry::Cancel(const std::string& id) {
  std::lock_guard lck(mtx_);
  auto [first, last] = tokens_.equal_range(id);
  if (first == last) return false;
  for (auto it = first; it != last; ++it) it->second->Cancel();
  spdlog::info("Cancelled request {}", id);
  return true;
}

size_t RequestRegistry::Size() {
  std::lock_guard lck(mtx_);
  return tokens_.size();
}

RequestRegistry& Requests() {
  static RequestRegistry registry;
  return registry;
}

nlohmann::json ExecutionToJson(const ExecutionResult& result) {
  nlohmann::json ret = {
    {"stdout", result.stdout_text},
    {"stderr", result.outcome == Outcome::COMPILE_ERROR ? result.message : result.stderr_text},
    {"return_code", result.exit_code},
    {"success", result.Success()},
    {"outcome", OutcomeToKey(result.outcome)},
    {"time_ms", ToMs(result.time)},
    {"memory_kib", result.memory},
  };
  if (result.stdout_truncated) ret["stdout_truncated"] = true;
  if (result.stderr_truncated) ret["stderr_truncated"] = true;
  return ret;
}

nlohmann::json SummaryToJson(const GradeSummary& summary, ComparisonMode mode) {
  nlohmann::json results = nlohmann::json::array();
  for (auto& i : summary.results) {
    nlohmann::json item = {
      {"test_case_id", i.test_case_id},
      {"passed", i.passed},
      {"outcome", OutcomeToKey(i.outcome)},
      {"execution_time", ToMs(i.time)},
      {"memory_used", i.memory ? nlohmann::json(*i.memory) : nlohmann::json(nullptr)},
      {"error_message", i.error_message},
      {"hidden", i.hidden},
    };
    if (!i.hidden) {
      item["actual_output"] = i.actual_output;
      item["expected_output"] = i.expected_output;
    }
    results.push_back(std::move(item));
  }
  nlohmann::json ret = {
    {"score", summary.score},
    {"total_tests", summary.total_tests},
    {"passed_tests", summary.passed_tests},
    {"earned_points", summary.earned_points},
    {"total_points", summary.total_points},
    {"comparison_mode", ComparisonModeName(mode)},
    {"results", std::move(results)},
  };
  if (summary.compile_outcome != Outcome::OK) {
    ret["compile_outcome"] = OutcomeToKey(summary.compile_outcome);
    ret["compile_message"] = summary.compile_message;
  }
  return ret;
}

std::vector<TestCase> ParseTestCases(const nlohmann::json& arr) {
  if (!arr.is_array()) throw std::invalid_argument("test_cases must be an array");
  std::vector<TestCase> ret;
  for (size_t idx = 0; idx < arr.size(); idx++) {
    auto& item = arr[idx];
    TestCase tc;
    tc.id = item.value("id", (long)idx + 1);
    tc.input = item.value("input", "");
    tc.expected_output = item.value("expected_output", "");
    tc.hidden = item.value("hidden", false);
    tc.points = item.value("points", 1);
    tc.order_index = item.value("order_index", (int)idx);
    ret.push_back(std::move(tc));
  }
  return ret;
}

void SetupRoutes(httplib::Server& svr, const ServerConfig& cfg) {
  SandboxLimits limits = cfg.Limits();
  svr.set_payload_max_length(kMaxPayload);
  // long-running executions must not starve /cancel and /health
  int threads = std::max(kMinServerThreads, cfg.parallel * 2 + 2);
  svr.new_task_queue = [threads]() { return new httplib::ThreadPool(threads); };
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {}", req.method, req.path, res.status);
  });

  svr.Post("/execute", JsonHandler("execute", [limits](const auto& req, auto& res) {
    HandleExecute(req, res, limits);
  }));
  svr.Post("/grade", JsonHandler("grade", [limits](const auto& req, auto& res) {
    HandleGrade(req, res, limits);
  }));
  svr.Post("/cancel", JsonHandler("cancel", [](const auto& req, auto& res) {
    auto body = http_utils::ParseBody(req);
    std::string id = body.at("request_id").template get<std::string>();
    ReplyJson(res, {{"cancelled", Requests().Cancel(id)}});
  }));
  svr.Get("/languages", [](const httplib::Request&, httplib::Response& res) {
    ReplyJson(res, ListLanguages());
  });
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    ReplyJson(res, {
      {"status", "ok"},
      {"running", RunningExecutions()},
      {"parallel", kMaxParallel},
    });
  });
}

bool ServerWorkLoop(const ServerConfig& cfg) {
  httplib::Server svr;
  SetupRoutes(svr, cfg);
  spdlog::info("Listening on {}:{}", cfg.listen_host, cfg.listen_port);
  if (!svr.listen(cfg.listen_host.c_str(), cfg.listen_port)) {
    spdlog::error("Failed to listen on {}:{}", cfg.listen_host, cfg.listen_port);
    return false;
  }
  return true;
}
