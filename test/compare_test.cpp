#include <gtest/gtest.h>
#include <gradebox/compare.h>

namespace {

struct CompareParam {
  std::string actual, expected;
  ComparisonMode mode;
  bool result;
};

std::string ParamName(const ::testing::TestParamInfo<CompareParam>& info) {
  return std::string(ComparisonModeName(info.param.mode)) + "_" + std::to_string(info.index);
}

} // namespace

class CompareGrid : public testing::TestWithParam<CompareParam> {};
TEST_P(CompareGrid, Compare) {
  auto& param = GetParam();
  EXPECT_EQ(Compare(param.actual, param.expected, param.mode), param.result)
      << "actual=\"" << param.actual << "\" expected=\"" << param.expected << "\"";
}
INSTANTIATE_TEST_SUITE_P(Modes, CompareGrid,
    testing::Values(
      CompareParam{"3.0", "3", ComparisonMode::EXACT, false},
      CompareParam{"hello\n", "hello", ComparisonMode::EXACT, true},
      CompareParam{"  hello \r\n", "\thello", ComparisonMode::EXACT, true},
      CompareParam{"Hello", "hello", ComparisonMode::EXACT, false},
      CompareParam{"a  b", "a b", ComparisonMode::EXACT, false},
      CompareParam{"", "\n", ComparisonMode::EXACT, true},
      CompareParam{"3.0", "3", ComparisonMode::NUMERIC, true},
      CompareParam{"1e3\n", "1000", ComparisonMode::NUMERIC, true},
      CompareParam{"-0.5", "-.5", ComparisonMode::NUMERIC, true},
      CompareParam{"3.01", "3", ComparisonMode::NUMERIC, false},
      CompareParam{"abc", "abc", ComparisonMode::NUMERIC, true},
      CompareParam{"abc", "3", ComparisonMode::NUMERIC, false},
      CompareParam{"0x10", "16", ComparisonMode::NUMERIC, false},
      CompareParam{"1 2", "1 2", ComparisonMode::NUMERIC, true},
      // non-finite and digit-grouped spellings fall back to exact comparison
      CompareParam{"inf", "Infinity", ComparisonMode::NUMERIC, false},
      CompareParam{"inf", "inf", ComparisonMode::NUMERIC, true},
      CompareParam{"nan", "nan", ComparisonMode::NUMERIC, true},
      CompareParam{"1_000", "1000", ComparisonMode::NUMERIC, false},
      CompareParam{"The Answer is 42", "42", ComparisonMode::CONTAINS, true},
      CompareParam{"The Answer is 42", "answer", ComparisonMode::CONTAINS, true},
      CompareParam{"The Answer", "  ANSWER\n", ComparisonMode::CONTAINS, true},
      CompareParam{"The Answer", "question", ComparisonMode::CONTAINS, false},
      CompareParam{"anything", "", ComparisonMode::CONTAINS, true}
    ),
    ParamName);

TEST(Compare, ParseMode) {
  EXPECT_EQ(ParseComparisonMode("exact"), ComparisonMode::EXACT);
  EXPECT_EQ(ParseComparisonMode("numeric"), ComparisonMode::NUMERIC);
  EXPECT_EQ(ParseComparisonMode("contains"), ComparisonMode::CONTAINS);
  EXPECT_EQ(ParseComparisonMode(""), ComparisonMode::EXACT);
  EXPECT_EQ(ParseComparisonMode("fuzzy"), ComparisonMode::EXACT);
  EXPECT_STREQ(ComparisonModeName(ComparisonMode::NUMERIC), "numeric");
}

TEST(Compare, Trim) {
  EXPECT_EQ(Trim(" \t a b \n\v\f\r"), "a b");
  EXPECT_EQ(Trim("   "), "");
  EXPECT_EQ(Trim("x"), "x");
}
