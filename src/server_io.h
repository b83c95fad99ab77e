#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <gradebox/grading.h>
#include "config.h"

// In-flight executions and grading runs, addressable by the client's request_id
class RequestRegistry {
  std::mutex mtx_;
  std::multimap<std::string, std::shared_ptr<CancelToken>> tokens_;
 public:
  // an empty id yields a token nobody else can reach
  std::shared_ptr<CancelToken> Register(const std::string& id);
  void Unregister(const std::string& id, const std::shared_ptr<CancelToken>&);
  // cancels every request registered under id; false if there is none
  bool Cancel(const std::string& id);
  size_t Size();
};

RequestRegistry& Requests();

nlohmann::json ExecutionToJson(const ExecutionResult&);
// actual and expected output of hidden test cases are withheld
nlohmann::json SummaryToJson(const GradeSummary&, ComparisonMode);
// throws nlohmann::json::exception on malformed entries
std::vector<TestCase> ParseTestCases(const nlohmann::json&);

void SetupRoutes(httplib::Server&, const ServerConfig&);

// Serve until the listener fails; returns false if it could not bind.
bool ServerWorkLoop(const ServerConfig&);

#endif  // SERVER_IO_H_
