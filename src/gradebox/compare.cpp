#include <gradebox/compare.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace {

constexpr char kWhitespace[] = " \t\n\r\v\f";

// the whole string must be a decimal number; hex, inf and nan forms are rejected
bool ParseNumber(const std::string& str, double& val) {
  if (str.empty()) return false;
  for (char c : str) {
    if (!isdigit((unsigned char)c) && c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
      return false;
    }
  }
  const char* begin = str.c_str();
  char* end = nullptr;
  errno = 0;
  val = strtod(begin, &end);
  return end == begin + str.size() && errno != ERANGE && std::isfinite(val);
}

std::string ToLower(std::string str) {
  for (auto& c : str) c = tolower((unsigned char)c);
  return str;
}

} // namespace

ComparisonMode ParseComparisonMode(const std::string& name) {
#define X(name_, key) if (name == key) return ComparisonMode::name_;
  ENUM_COMPARISON_MODE_
#undef X
  return ComparisonMode::EXACT;
}

const char* ComparisonModeName(ComparisonMode mode) {
  switch (mode) {
#define X(name, key) case ComparisonMode::name: return key;
    ENUM_COMPARISON_MODE_
#undef X
  }
  __builtin_unreachable();
}

std::string Trim(const std::string& str) {
  size_t first = str.find_first_not_of(kWhitespace);
  if (first == std::string::npos) return "";
  size_t last = str.find_last_not_of(kWhitespace);
  return str.substr(first, last - first + 1);
}

bool Compare(const std::string& actual, const std::string& expected, ComparisonMode mode) {
  std::string a = Trim(actual), e = Trim(expected);
  switch (mode) {
    case ComparisonMode::NUMERIC: {
      double x, y;
      if (ParseNumber(a, x) && ParseNumber(e, y)) return x == y;
      return a == e;
    }
    case ComparisonMode::CONTAINS:
      return ToLower(a).find(ToLower(e)) != std::string::npos;
    case ComparisonMode::EXACT:
      break;
  }
  return a == e;
}
