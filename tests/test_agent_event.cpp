#include <gtest/gtest.h>

#include "agent/agent_event.hpp"

using namespace tether;
using namespace tether::agent;

TEST(AgentEventTest, SystemInit) {
  json j = {{"type", "system"},
            {"subtype", "init"},
            {"session_id", "conv-1"},
            {"model", "claude-sonnet"},
            {"slash_commands", {"/review", "/compact", 3}}};

  auto event = parse_agent_event(j);
  ASSERT_TRUE(event.has_value());
  auto *init = std::get_if<SystemInit>(&*event);
  ASSERT_NE(init, nullptr);
  EXPECT_EQ(init->conversation_id, "conv-1");
  EXPECT_EQ(init->model, "claude-sonnet");
  EXPECT_EQ(init->slash_commands, (std::vector<std::string>{"/review", "/compact"}));
  EXPECT_EQ(event_kind(*event), "system-init");
}

TEST(AgentEventTest, OtherSystemSubtypesIgnored) {
  EXPECT_FALSE(parse_agent_event({{"type", "system"}, {"subtype", "compact_boundary"}}).has_value());
}

TEST(AgentEventTest, AssistantContentVerbatim) {
  json content = json::array({{{"type", "text"}, {"text", "Done."}}, {{"type", "tool_use"}, {"id", "tu_1"}, {"name", "Bash"}}});
  auto event = parse_agent_event({{"type", "assistant"}, {"message", {{"role", "assistant"}, {"content", content}}}});

  ASSERT_TRUE(event.has_value());
  auto *msg = std::get_if<AssistantMessage>(&*event);
  ASSERT_NE(msg, nullptr);
  EXPECT_EQ(msg->content, content);
  EXPECT_EQ(event_kind(*event), "assistant");
}

TEST(AgentEventTest, ToolResultIdFromContentBlock) {
  json j = {{"type", "user"},
            {"message", {{"role", "user"}, {"content", json::array({{{"type", "tool_result"}, {"tool_use_id", "tu_9"}, {"content", "ok"}}})}}},
            {"tool_use_result", {{"stdout", "ok"}}}};

  auto event = parse_agent_event(j);
  ASSERT_TRUE(event.has_value());
  auto *msg = std::get_if<UserMessage>(&*event);
  ASSERT_NE(msg, nullptr);
  ASSERT_TRUE(msg->tool_use_id.has_value());
  EXPECT_EQ(*msg->tool_use_id, "tu_9");
  ASSERT_TRUE(msg->tool_result.has_value());
  EXPECT_EQ((*msg->tool_result)["stdout"], "ok");
  EXPECT_FALSE(msg->is_replay);
}

TEST(AgentEventTest, ToolResultIdFromParent) {
  json j = {{"type", "user"}, {"parent_tool_use_id", "tu_parent"}, {"message", {{"role", "user"}}}, {"tool_use_result", "text"}};
  auto event = parse_agent_event(j);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(std::get<UserMessage>(*event).tool_use_id.value_or(""), "tu_parent");
}

TEST(AgentEventTest, ReplayedUserMessage) {
  json j = {{"type", "user"}, {"isReplay", true}, {"message", {{"role", "user"}, {"content", "earlier prompt"}}}};
  auto event = parse_agent_event(j);
  ASSERT_TRUE(event.has_value());
  auto &msg = std::get<UserMessage>(*event);
  EXPECT_TRUE(msg.is_replay);
  EXPECT_FALSE(msg.tool_use_id.has_value());
  EXPECT_EQ(msg.message["content"], "earlier prompt");
}

TEST(AgentEventTest, ResultUsage) {
  json j = {{"type", "result"},
            {"subtype", "success"},
            {"total_cost_usd", 0.42},
            {"usage", {{"input_tokens", 1000}, {"cache_read_input_tokens", 500}, {"output_tokens", 200}}},
            {"modelUsage", {{"claude-sonnet", {{"contextWindow", 1000000}, {"inputTokens", 99999}}}}}};

  auto event = parse_agent_event(j);
  ASSERT_TRUE(event.has_value());
  auto &result = std::get<ResultMessage>(*event);
  EXPECT_EQ(result.subtype, "success");
  EXPECT_EQ(result.output_tokens, 200);

  auto usage = result.context_usage(200000);
  EXPECT_EQ(usage.tokens_used, 1500);
  EXPECT_EQ(usage.context_window, 1000000);
  EXPECT_DOUBLE_EQ(usage.cost_usd, 0.42);
  EXPECT_EQ(event_kind(*event), "result");
}

TEST(AgentEventTest, ResultFallsBackToDefaultWindow) {
  auto event = parse_agent_event({{"type", "result"}, {"subtype", "error_during_execution"}, {"is_error", true}});
  ASSERT_TRUE(event.has_value());
  auto &result = std::get<ResultMessage>(*event);
  EXPECT_TRUE(result.is_error);

  auto usage = result.context_usage(200000);
  EXPECT_EQ(usage.tokens_used, 0);
  EXPECT_EQ(usage.context_window, 200000);
}

TEST(AgentEventTest, UnknownShapes) {
  EXPECT_FALSE(parse_agent_event(json::array()).has_value());
  EXPECT_FALSE(parse_agent_event({{"type", "stream_event"}}).has_value());
  EXPECT_FALSE(parse_agent_event(json::object()).has_value());
}

TEST(AgentEventTest, NullAndMistypedFieldsReadAsDefaults) {
  auto init = parse_agent_event({{"type", "system"}, {"subtype", "init"}, {"session_id", nullptr}, {"model", 4}});
  ASSERT_TRUE(init.has_value());
  EXPECT_EQ(std::get<SystemInit>(*init).conversation_id, "");
  EXPECT_EQ(std::get<SystemInit>(*init).model, "");

  auto result = parse_agent_event(
      {{"type", "result"}, {"subtype", nullptr}, {"is_error", nullptr}, {"total_cost_usd", nullptr}, {"usage", {{"input_tokens", "12"}}}});
  ASSERT_TRUE(result.has_value());
  auto usage = std::get<ResultMessage>(*result).context_usage(200000);
  EXPECT_EQ(usage.tokens_used, 0);
  EXPECT_DOUBLE_EQ(usage.cost_usd, 0.0);

  json content = json::array({{{"type", "tool_result"}, {"tool_use_id", nullptr}}});
  auto user = parse_agent_event({{"type", "user"}, {"isReplay", nullptr}, {"message", {{"content", content}}}, {"tool_use_result", "ok"}});
  ASSERT_TRUE(user.has_value());
  EXPECT_FALSE(std::get<UserMessage>(*user).tool_use_id.has_value());
  EXPECT_FALSE(std::get<UserMessage>(*user).is_replay);

  auto assistant = parse_agent_event({{"type", "assistant"}, {"message", {{"content", nullptr}}}});
  ASSERT_TRUE(assistant.has_value());
  EXPECT_EQ(std::get<AssistantMessage>(*assistant).content, json::array());

  EXPECT_FALSE(parse_agent_event({{"type", nullptr}}).has_value());
}
