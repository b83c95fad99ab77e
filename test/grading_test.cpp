#include <stdexcept>
#include <gradebox/grading.h>
#include "utils.h"

namespace {

TestCase MakeCase(long id, const std::string& input, const std::string& expected,
                  int order_index = 0, bool hidden = false, int points = 1) {
  TestCase tc;
  tc.id = id;
  tc.input = input;
  tc.expected_output = expected;
  tc.order_index = order_index;
  tc.hidden = hidden;
  tc.points = points;
  return tc;
}

const char kPythonDouble[] = "print(int(input()) * 2)";

} // namespace

TEST(Grading, ScorePercent) {
  EXPECT_DOUBLE_EQ(ScorePercent(3, 4), 75);
  EXPECT_DOUBLE_EQ(ScorePercent(0, 4), 0);
  EXPECT_DOUBLE_EQ(ScorePercent(2, 2), 100);
  EXPECT_DOUBLE_EQ(ScorePercent(0, 0), 0);
}

TEST(Grading, ThreeOfFour) {
  SKIP_WITHOUT_TOOLCHAIN("python");
  std::vector<TestCase> cases = {
    MakeCase(1, "1", "2"),
    MakeCase(2, "5", "10"),
    MakeCase(3, "21", "42", 0, true),
    MakeCase(4, "3", "7"),
  };
  auto summary = Grade(cases, "python", kPythonDouble, ComparisonMode::EXACT, TestLimits());
  EXPECT_DOUBLE_EQ(summary.score, 75);
  EXPECT_EQ(summary.total_tests, 4);
  EXPECT_EQ(summary.passed_tests, 3);
  EXPECT_EQ(summary.earned_points, 3);
  EXPECT_EQ(summary.total_points, 4);
  ASSERT_EQ(summary.results.size(), 4u);
  EXPECT_TRUE(summary.results[2].passed);
  EXPECT_TRUE(summary.results[2].hidden);
  EXPECT_FALSE(summary.results[3].passed);
  EXPECT_EQ(summary.results[3].outcome, Outcome::OK);
  EXPECT_EQ(summary.results[3].actual_output, "6\n");
}

TEST(Grading, OrderIndexAndPoints) {
  SKIP_WITHOUT_TOOLCHAIN("python");
  std::vector<TestCase> cases = {
    MakeCase(10, "1", "2", 2, false, 5),
    MakeCase(11, "2", "4", 0, false, 3),
    MakeCase(12, "3", "0", 1, false, 2),
  };
  auto summary = Grade(cases, "python", kPythonDouble, ComparisonMode::EXACT, TestLimits());
  ASSERT_EQ(summary.results.size(), 3u);
  EXPECT_EQ(summary.results[0].test_case_id, 11);
  EXPECT_EQ(summary.results[1].test_case_id, 12);
  EXPECT_EQ(summary.results[2].test_case_id, 10);
  EXPECT_EQ(summary.earned_points, 8);
  EXPECT_EQ(summary.total_points, 10);
}

TEST(Grading, FailureDoesNotAbortOthers) {
  SKIP_WITHOUT_TOOLCHAIN("python");
  std::vector<TestCase> cases = {
    MakeCase(1, "4", "8"),
    MakeCase(2, "oops", "0"),
    MakeCase(3, "6", "12"),
  };
  auto summary = Grade(cases, "python", kPythonDouble, ComparisonMode::EXACT, TestLimits());
  EXPECT_EQ(summary.passed_tests, 2);
  EXPECT_EQ(summary.results[1].outcome, Outcome::RUNTIME_ERROR);
  EXPECT_NE(summary.results[1].error_message.find("ValueError"), std::string::npos);
  EXPECT_TRUE(summary.results[2].passed);
}

TEST(Grading, NumericAndContainsModes) {
  SKIP_WITHOUT_TOOLCHAIN("python");
  std::vector<TestCase> cases = {MakeCase(1, "", "3")};
  auto summary = Grade(cases, "python", "print('3.0')", ComparisonMode::NUMERIC, TestLimits());
  EXPECT_EQ(summary.passed_tests, 1);
  summary = Grade(cases, "python", "print('3.0')", ComparisonMode::EXACT, TestLimits());
  EXPECT_EQ(summary.passed_tests, 0);
  cases = {MakeCase(1, "", "answer is 42")};
  summary = Grade(cases, "python", "print('The Answer is 42!')", ComparisonMode::CONTAINS, TestLimits());
  EXPECT_EQ(summary.passed_tests, 1);
}

TEST(Grading, TimeoutCountsAsFailure) {
  SKIP_WITHOUT_TOOLCHAIN("python");
  std::vector<TestCase> cases = {MakeCase(1, "", "")};
  auto summary = Grade(cases, "python", "while True:\n    pass\n", ComparisonMode::EXACT,
                       TestLimits(500));
  EXPECT_EQ(summary.passed_tests, 0);
  EXPECT_EQ(summary.results[0].outcome, Outcome::TIMEOUT);
  EXPECT_FALSE(summary.results[0].passed);
}

TEST(Grading, CompileErrorFailsEveryCase) {
  SKIP_WITHOUT_TOOLCHAIN("cpp");
  std::vector<TestCase> cases = {MakeCase(1, "", ""), MakeCase(2, "", "")};
  auto summary = Grade(cases, "cpp", "int main( {", ComparisonMode::EXACT, TestLimits());
  EXPECT_EQ(summary.compile_outcome, Outcome::COMPILE_ERROR);
  EXPECT_FALSE(summary.compile_message.empty());
  EXPECT_DOUBLE_EQ(summary.score, 0);
  ASSERT_EQ(summary.results.size(), 2u);
  for (auto& i : summary.results) {
    EXPECT_EQ(i.outcome, Outcome::COMPILE_ERROR);
    EXPECT_FALSE(i.passed);
  }
}

TEST(Grading, UnsupportedLanguage) {
  std::vector<TestCase> cases = {MakeCase(1, "", ""), MakeCase(2, "", "")};
  auto summary = Grade(cases, "cobol", "DISPLAY 'HI'.");
  EXPECT_EQ(summary.compile_outcome, Outcome::UNSUPPORTED_LANGUAGE);
  EXPECT_EQ(summary.passed_tests, 0);
  EXPECT_EQ(summary.total_tests, 2);
  for (auto& i : summary.results) EXPECT_EQ(i.outcome, Outcome::UNSUPPORTED_LANGUAGE);
}

TEST(Grading, NoTestCases) {
  SKIP_WITHOUT_TOOLCHAIN("python");
  auto summary = Grade({}, "python", "print(1)", ComparisonMode::EXACT, TestLimits());
  EXPECT_DOUBLE_EQ(summary.score, 0);
  EXPECT_EQ(summary.total_tests, 0);
  EXPECT_TRUE(summary.results.empty());
}

TEST(Grading, MalformedRequestThrows) {
  std::vector<TestCase> cases = {MakeCase(1, "", "")};
  EXPECT_THROW(Grade(cases, "", "print(1)"), std::invalid_argument);
}

TEST(Grading, EmptySourceIsAProgram) {
  SKIP_WITHOUT_TOOLCHAIN("python");
  std::vector<TestCase> cases = {MakeCase(1, "", ""), MakeCase(2, "", "1")};
  auto summary = Grade(cases, "python", "", ComparisonMode::EXACT, TestLimits());
  EXPECT_EQ(summary.compile_outcome, Outcome::OK);
  ASSERT_EQ(summary.results.size(), 2u);
  EXPECT_TRUE(summary.results[0].passed);
  EXPECT_EQ(summary.results[0].outcome, Outcome::OK);
  EXPECT_FALSE(summary.results[1].passed);
  EXPECT_DOUBLE_EQ(summary.score, 50);
}
