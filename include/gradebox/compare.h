#ifndef INCLUDE_GRADEBOX_COMPARE_H_
#define INCLUDE_GRADEBOX_COMPARE_H_

#include <string>

#define ENUM_COMPARISON_MODE_ \
  X(EXACT, "exact") \
  X(NUMERIC, "numeric") \
  X(CONTAINS, "contains")
enum class ComparisonMode {
#define X(name, key) name,
  ENUM_COMPARISON_MODE_
#undef X
};

// unknown or empty strings map to EXACT
ComparisonMode ParseComparisonMode(const std::string&);
const char* ComparisonModeName(ComparisonMode);

// Pure; no I/O.
//  - EXACT: equal after trimming surrounding whitespace
//  - NUMERIC: equal as floating point numbers; EXACT if either side is not a number
//  - CONTAINS: trimmed expected is a case-insensitive substring of trimmed actual
bool Compare(const std::string& actual, const std::string& expected, ComparisonMode);

std::string Trim(const std::string&);

#endif  // INCLUDE_GRADEBOX_COMPARE_H_
