#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <gtest/gtest.h>
#include <gradebox/sandbox.h>

// true if every program the language needs is on PATH
bool ToolchainAvailable(const std::string& language_id);

#define SKIP_WITHOUT_TOOLCHAIN(lang) \
  if (!ToolchainAvailable(lang)) GTEST_SKIP() << "toolchain of " << (lang) << " not installed"

SandboxLimits TestLimits(long wall_ms = 10000, long memory_mib = 256);

#endif // TEST_UTILS_H_
