#include <gtest/gtest.h>

#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

using namespace tether;

TEST(MessageTest, CreateUserMessage) {
  auto msg = StoredMessage::user("Hello, world!");

  EXPECT_EQ(msg.role, Role::User);
  EXPECT_EQ(msg.content, "Hello, world!");
  EXPECT_GT(msg.timestamp, 0);
}

TEST(MessageTest, CreateAssistantMessage) {
  json blocks = json::array({{{"type", "text"}, {"text", "Hi there!"}}});
  auto msg = StoredMessage::assistant(blocks);

  EXPECT_EQ(msg.role, Role::Assistant);
  EXPECT_EQ(msg.content, blocks);
}

TEST(MessageTest, JsonKeepsSequenceAndContent) {
  auto msg = StoredMessage::assistant(json::array({{{"type", "tool_use"}, {"id", "tu_1"}, {"name", "Bash"}}}));
  msg.sequence = 7;

  auto loaded = StoredMessage::from_json(msg.to_json());
  EXPECT_EQ(loaded.role, Role::Assistant);
  EXPECT_EQ(loaded.sequence, 7u);
  EXPECT_EQ(loaded.timestamp, msg.timestamp);
  EXPECT_EQ(loaded.content[0]["name"], "Bash");
}

TEST(MessageTest, RoleStrings) {
  EXPECT_EQ(to_string(Role::User), "user");
  EXPECT_EQ(to_string(Role::Assistant), "assistant");
  EXPECT_EQ(role_from_string("assistant"), Role::Assistant);
  EXPECT_EQ(role_from_string("something"), Role::User);
}

TEST(TypesTest, PermissionModeStrings) {
  for (auto mode : {PermissionMode::Default, PermissionMode::AcceptEdits, PermissionMode::BypassPermissions, PermissionMode::Plan}) {
    auto parsed = permission_mode_from_string(to_string(mode));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, mode);
  }
  EXPECT_EQ(to_string(PermissionMode::AcceptEdits), "acceptEdits");
  EXPECT_FALSE(permission_mode_from_string("yolo").has_value());
}

TEST(TypesTest, ContextUsageJson) {
  ContextUsage usage{1500, 200000, 0.25};
  auto j = usage.to_json();
  EXPECT_EQ(j["tokensUsed"], 1500);
  EXPECT_EQ(j["contextWindow"], 200000);
  EXPECT_DOUBLE_EQ(j["costUsd"].get<double>(), 0.25);
  EXPECT_TRUE(ContextUsage::from_json(j) == usage);
}

TEST(UUIDTest, GenerateIsUniqueV4) {
  auto a = UUID::generate();
  auto b = UUID::generate();
  EXPECT_NE(a, b);
  ASSERT_EQ(a.size(), 36u);
  EXPECT_EQ(a[8], '-');
  EXPECT_EQ(a[14], '4');
}

TEST(UUIDTest, ShortId) {
  auto id = UUID::short_id();
  EXPECT_EQ(id.size(), 8u);
  EXPECT_EQ(UUID::short_id(12).size(), 12u);
}
