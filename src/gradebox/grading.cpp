#include <gradebox/grading.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <gradebox/utils.h>

namespace {

TestCaseResult FailedResult(const TestCase& tc, Outcome outcome, const std::string& message) {
  TestCaseResult ret;
  ret.test_case_id = tc.id;
  ret.hidden = tc.hidden;
  ret.expected_output = tc.expected_output;
  ret.passed = false;
  ret.outcome = outcome;
  ret.error_message = message;
  return ret;
}

std::string ErrorMessage(const ExecutionResult& res) {
  switch (res.outcome) {
    case Outcome::OK: return "";
    case Outcome::RUNTIME_ERROR: return res.stderr_text;
    case Outcome::TIMEOUT:
    case Outcome::RESOURCE_LIMIT_EXCEEDED:
    case Outcome::CANCELLED:
      return OutcomeToDesc(res.outcome);
    default:
      return res.message.empty() ? OutcomeToDesc(res.outcome) : res.message;
  }
}

} // namespace

double ScorePercent(int passed, int total) {
  if (total <= 0) return 0;
  return (double)passed / total * 100;
}

GradeSummary Grade(const std::vector<TestCase>& test_cases, const std::string& language_id,
                   const std::string& source, ComparisonMode mode,
                   const SandboxLimits& limits, const CancelToken* cancel) {
  if (language_id.empty()) throw std::invalid_argument("language is required");

  auto start = std::chrono::steady_clock::now();
  std::vector<TestCase> ordered = test_cases;
  std::stable_sort(ordered.begin(), ordered.end(), [](const TestCase& a, const TestCase& b) {
    return a.order_index < b.order_index;
  });

  GradeSummary ret;
  ret.total_tests = ordered.size();
  for (auto& tc : ordered) ret.total_points += tc.points;

  auto FailAll = [&](Outcome outcome, const std::string& message) {
    ret.compile_outcome = outcome;
    ret.compile_message = message;
    for (auto& tc : ordered) ret.results.push_back(FailedResult(tc, outcome, message));
  };

  auto spec = Resolve(language_id);
  if (!spec) {
    spdlog::info("Grade: unsupported language {}", language_id);
    FailAll(Outcome::UNSUPPORTED_LANGUAGE, "unsupported language: " + language_id);
    return ret;
  }

  Program prog = Program::Prepare(*spec, source, limits, cancel);
  if (!prog.Ready()) {
    auto& res = prog.CompileResult();
    FailAll(res.outcome, res.message.empty() ? OutcomeToDesc(res.outcome) : res.message);
    spdlog::info("Grade: language={} tests={} preparation failed: {}",
                 language_id, ret.total_tests, OutcomeToKey(res.outcome));
    return ret;
  }

  for (auto& tc : ordered) {
    if (cancel && cancel->IsCancelled()) {
      ret.results.push_back(FailedResult(tc, Outcome::CANCELLED, OutcomeToDesc(Outcome::CANCELLED)));
      continue;
    }
    auto res = prog.Execute(tc.input, limits, cancel);
    TestCaseResult result;
    result.test_case_id = tc.id;
    result.hidden = tc.hidden;
    result.expected_output = tc.expected_output;
    result.outcome = res.outcome;
    result.time = res.time;
    if (res.memory > 0) result.memory = res.memory;
    result.actual_output = std::move(res.stdout_text);
    result.passed = res.Success() && Compare(result.actual_output, tc.expected_output, mode);
    result.error_message = ErrorMessage(res);
    if (result.passed) {
      ret.passed_tests++;
      ret.earned_points += tc.points;
    }
    spdlog::debug("Grade: test case {} outcome={} passed={}", tc.id, OutcomeToKey(result.outcome),
                  result.passed);
    ret.results.push_back(std::move(result));
  }
  ret.score = ScorePercent(ret.passed_tests, ret.total_tests);
  spdlog::info("Grade: language={} mode={} passed={}/{} score={:.2f} elapsed={}ms",
               language_id, ComparisonModeName(mode), ret.passed_tests, ret.total_tests, ret.score,
               std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start).count());
  return ret;
}
