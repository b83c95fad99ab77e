#ifndef INCLUDE_GRADEBOX_GRADING_H_
#define INCLUDE_GRADEBOX_GRADING_H_

#include <string>
#include <vector>
#include <optional>

#include <gradebox/compare.h>
#include <gradebox/sandbox.h>

struct TestCase {
  long id;
  std::string input, expected_output;
  bool hidden; // presentation only; graded like any other test case
  int points;
  int order_index;

  TestCase() : id(0), hidden(false), points(1), order_index(0) {}
};

struct TestCaseResult {
  long test_case_id;
  std::string actual_output;
  std::string expected_output; // copied from the test case
  bool passed;
  long time; // us
  std::optional<long> memory; // KiB
  std::string error_message;
  Outcome outcome;
  bool hidden; // copied from the test case

  TestCaseResult() : test_case_id(0), passed(false), time(0), outcome(Outcome::OK), hidden(false) {}
};

struct GradeSummary {
  double score; // 0-100
  int total_tests, passed_tests;
  long earned_points, total_points;
  // outcome of the preparation phase; OK unless compilation or setup failed
  Outcome compile_outcome;
  std::string compile_message;
  std::vector<TestCaseResult> results; // ordered by TestCase::order_index

  GradeSummary() :
      score(0), total_tests(0), passed_tests(0),
      earned_points(0), total_points(0),
      compile_outcome(Outcome::OK) {}
};

// Runs the submission against every test case. A failing test case never aborts
// the others. Throws std::invalid_argument only if language is empty.
GradeSummary Grade(const std::vector<TestCase>&, const std::string& language_id,
                   const std::string& source, ComparisonMode = ComparisonMode::EXACT,
                   const SandboxLimits& = SandboxLimits(), const CancelToken* = nullptr);

// passed / total * 100; 0 if total is 0
double ScorePercent(int passed, int total);

#endif  // INCLUDE_GRADEBOX_GRADING_H_
