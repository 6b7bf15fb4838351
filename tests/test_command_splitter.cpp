#include <gtest/gtest.h>

#include "permission/command_splitter.hpp"

using namespace tether::permission;

TEST(CommandSplitterTest, SingleCommand) {
  auto parts = split_bash_commands("ls -la");
  ASSERT_EQ(parts.size(), 1);
  EXPECT_EQ(parts[0], "ls -la");
  EXPECT_FALSE(is_compound_command("ls -la"));
}

TEST(CommandSplitterTest, SplitsOnOperators) {
  auto parts = split_bash_commands("cd /repo && npm test || echo failed; git status");
  ASSERT_EQ(parts.size(), 4);
  EXPECT_EQ(parts[0], "cd /repo");
  EXPECT_EQ(parts[1], "npm test");
  EXPECT_EQ(parts[2], "echo failed");
  EXPECT_EQ(parts[3], "git status");
  EXPECT_TRUE(is_compound_command("cd /repo && npm test"));
}

TEST(CommandSplitterTest, PipesAndRedirectsStayTogether) {
  auto parts = split_bash_commands("pnpm build 2>&1 | tee build.log");
  ASSERT_EQ(parts.size(), 1);
  EXPECT_EQ(parts[0], "pnpm build 2>&1 | tee build.log");
}

TEST(CommandSplitterTest, OperatorsInsideQuotesAreIgnored) {
  auto parts = split_bash_commands("echo 'a && b' && echo \"c; d\"");
  ASSERT_EQ(parts.size(), 2);
  EXPECT_EQ(parts[0], "echo 'a && b'");
  EXPECT_EQ(parts[1], "echo \"c; d\"");
}

TEST(CommandSplitterTest, EscapedQuoteDoesNotOpenString) {
  auto parts = split_bash_commands("echo \\\"x && ls");
  ASSERT_EQ(parts.size(), 2);
  EXPECT_EQ(parts[0], "echo \\\"x");
  EXPECT_EQ(parts[1], "ls");
}

TEST(CommandSplitterTest, EmptyPartsAreDropped) {
  auto parts = split_bash_commands(" ;; ls ;  ");
  ASSERT_EQ(parts.size(), 1);
  EXPECT_EQ(parts[0], "ls");

  EXPECT_TRUE(split_bash_commands("").empty());
  EXPECT_TRUE(split_bash_commands("   ").empty());
}
