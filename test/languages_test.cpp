#include <algorithm>
#include <gtest/gtest.h>
#include <gradebox/languages.h>

TEST(Languages, ListInRegistryOrder) {
  std::vector<std::string> expected = {"python", "javascript", "java", "cpp", "c", "go"};
  EXPECT_EQ(ListLanguages(), expected);
}

TEST(Languages, Resolve) {
  for (auto& id : ListLanguages()) {
    auto spec = Resolve(id);
    ASSERT_TRUE(spec) << id;
    EXPECT_EQ(spec->id, id);
    EXPECT_FALSE(spec->source_name.empty());
  }
  EXPECT_FALSE(Resolve("brainfuck"));
  EXPECT_FALSE(Resolve(""));
  EXPECT_FALSE(Resolve("Python"));
}

TEST(Languages, ToolchainVariants) {
  EXPECT_TRUE(std::holds_alternative<Interpreted>(Resolve("python")->toolchain));
  EXPECT_TRUE(std::holds_alternative<Interpreted>(Resolve("javascript")->toolchain));
  EXPECT_TRUE(std::holds_alternative<CompileThenRun>(Resolve("cpp")->toolchain));
  EXPECT_TRUE(std::holds_alternative<CompileThenRun>(Resolve("java")->toolchain));
  EXPECT_TRUE(std::holds_alternative<CompileThenRun>(Resolve("go")->toolchain));
  EXPECT_TRUE(Resolve("c")->NeedsCompile());
  EXPECT_TRUE(Resolve("go")->NeedsCompile());
  EXPECT_FALSE(Resolve("python")->NeedsCompile());
  EXPECT_EQ(Resolve("java")->source_name, "Main.java");
}

TEST(Languages, ExpandCommand) {
  CommandVars vars{.source = "/box/ws/main.cpp", .binary = "/box/ws/main", .dir = "/box/ws",
                  .memory_mib = 256};
  auto cmd = ExpandCommand({"/usr/bin/env", "g++", "-o", "{binary}", "{source}"}, vars);
  std::vector<std::string> expected = {"/usr/bin/env", "g++", "-o", "/box/ws/main", "/box/ws/main.cpp"};
  EXPECT_EQ(cmd, expected);
  cmd = ExpandCommand({"-Xmx{memory_mib}m", "-cp", "{dir}", "HOME={dir}"}, vars);
  expected = {"-Xmx256m", "-cp", "/box/ws", "HOME=/box/ws"};
  EXPECT_EQ(cmd, expected);
}

TEST(Languages, GoCachePrivateToWorkspace) {
  auto spec = Resolve("go");
  ASSERT_TRUE(spec);
  CommandVars vars{.source = "/box/ws1/main.go", .binary = "/box/ws1/main", .dir = "/box/ws1",
                  .memory_mib = 256};
  auto envs = ExpandCommand(spec->envs, vars);
  EXPECT_NE(std::find(envs.begin(), envs.end(), "GOCACHE=/box/ws1/.gocache"), envs.end());
}
