#include <cstdlib>
#include <sstream>
#include <gtest/gtest.h>
#include "config.h"

TEST(Config, Defaults) {
  ServerConfig cfg;
  EXPECT_EQ(cfg.listen_port, 8080);
  EXPECT_TRUE(ValidateConfig(cfg));
  auto limits = cfg.Limits();
  EXPECT_EQ(limits.wall_time, 10L * 1'000'000);
  EXPECT_EQ(limits.cpu_time, 10L * 1'000'000);
  EXPECT_EQ(limits.memory, 256L * 1024);
  EXPECT_EQ(limits.output, 1024);
  EXPECT_EQ(limits.compile_wall_time, 30L * 1'000'000);
}

TEST(Config, ParseIni) {
  std::istringstream ini(
      "listen_port = 9000\n"
      "box_root = /var/tmp/box\n"
      "max_execution_time_ms = 2500\n"
      "memory_limit_mb = 128\n"
      "parallel = 3\n");
  ServerConfig cfg;
  ASSERT_TRUE(ParseConfig(ini, cfg));
  EXPECT_EQ(cfg.listen_port, 9000);
  EXPECT_EQ(cfg.box_root, "/var/tmp/box");
  EXPECT_EQ(cfg.parallel, 3);
  EXPECT_EQ(cfg.listen_host, "0.0.0.0");
  auto limits = cfg.Limits();
  EXPECT_EQ(limits.wall_time, 2'500'000);
  EXPECT_EQ(limits.cpu_time, 2'500'000);
  EXPECT_EQ(limits.memory, 128L * 1024);
}

TEST(Config, MissingFile) {
  ServerConfig cfg;
  EXPECT_TRUE(ParseConfigFile("/nonexistent/gradebox.conf", cfg, false));
  EXPECT_FALSE(ParseConfigFile("/nonexistent/gradebox.conf", cfg, true));
}

TEST(Config, EnvironmentOverrides) {
  ServerConfig cfg;
  cfg.memory_limit_mb = 64;
  setenv("GRADEBOX_MEMORY_LIMIT_MB", "512", 1);
  setenv("GRADEBOX_LISTEN_HOST", "127.0.0.1", 1);
  EXPECT_TRUE(ApplyEnv(cfg));
  EXPECT_EQ(cfg.memory_limit_mb, 512);
  EXPECT_EQ(cfg.listen_host, "127.0.0.1");
  setenv("GRADEBOX_MEMORY_LIMIT_MB", "lots", 1);
  EXPECT_FALSE(ApplyEnv(cfg));
  unsetenv("GRADEBOX_MEMORY_LIMIT_MB");
  unsetenv("GRADEBOX_LISTEN_HOST");
}

TEST(Config, Validate) {
  ServerConfig cfg;
  cfg.max_execution_time_ms = 0;
  EXPECT_FALSE(ValidateConfig(cfg));
  cfg = ServerConfig();
  cfg.parallel = 0;
  EXPECT_FALSE(ValidateConfig(cfg));
  cfg = ServerConfig();
  cfg.box_root = "relative/box";
  EXPECT_FALSE(ValidateConfig(cfg));
  cfg = ServerConfig();
  cfg.cpu_time_ms = 1500;
  EXPECT_TRUE(ValidateConfig(cfg));
  EXPECT_EQ(cfg.Limits().cpu_time, 1'500'000);
}
