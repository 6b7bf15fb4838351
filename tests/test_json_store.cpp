#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/json_store.hpp"
#include "core/uuid.hpp"

using namespace tether;
namespace fs = std::filesystem;

class JsonStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("tether_test_" + UUID::generate());
    store_ = std::make_shared<JsonSessionStore>(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  fs::path test_dir_;
  std::shared_ptr<JsonSessionStore> store_;
};

TEST_F(JsonStoreTest, CreateAndGetSession) {
  auto record = store_->create_session("api work", "/repo", PermissionMode::AcceptEdits);
  EXPECT_FALSE(record.id.empty());

  auto loaded = store_->get_session(record.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->name, "api work");
  EXPECT_EQ(loaded->working_dir, "/repo");
  EXPECT_EQ(loaded->permission_mode, PermissionMode::AcceptEdits);
  EXPECT_EQ(loaded->status, "idle");
  EXPECT_TRUE(loaded->messages.empty());
  EXPECT_FALSE(loaded->agent_conversation_id.has_value());
}

TEST_F(JsonStoreTest, DefaultNameFromId) {
  auto record = store_->create_session("", "/repo", PermissionMode::Default);
  EXPECT_EQ(record.name, "session-" + record.id.substr(0, 8));
}

TEST_F(JsonStoreTest, UpdateAppliesOnlySetFields) {
  auto record = store_->create_session("s", "/repo", PermissionMode::Default);

  SessionPatch patch;
  patch.agent_conversation_id = "conv-1";
  patch.context_usage = ContextUsage{1200, 200000, 0.01};
  patch.allowed_tools = std::vector<std::string>{"Glob"};
  ASSERT_TRUE(store_->update_session(record.id, patch));

  SessionPatch mode_patch;
  mode_patch.permission_mode = PermissionMode::Plan;
  ASSERT_TRUE(store_->update_session(record.id, mode_patch));

  auto loaded = store_->get_session(record.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->agent_conversation_id.value_or(""), "conv-1");
  ASSERT_TRUE(loaded->context_usage.has_value());
  EXPECT_EQ(loaded->context_usage->tokens_used, 1200);
  EXPECT_EQ(loaded->allowed_tools, (std::vector<std::string>{"Glob"}));
  EXPECT_EQ(loaded->permission_mode, PermissionMode::Plan);
  EXPECT_EQ(loaded->name, "s");
}

TEST_F(JsonStoreTest, AppendMessagesKeepsOrder) {
  auto record = store_->create_session("s", "/repo", PermissionMode::Default);

  for (int i = 0; i < 3; ++i) {
    SessionPatch patch;
    auto msg = StoredMessage::user("message " + std::to_string(i));
    msg.sequence = i;
    patch.append_messages.push_back(msg);
    ASSERT_TRUE(store_->update_session(record.id, patch));
  }

  auto loaded = store_->get_session(record.id);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->messages.size(), 3);
  EXPECT_EQ(loaded->messages[0].content, "message 0");
  EXPECT_EQ(loaded->messages[2].content, "message 2");
  EXPECT_EQ(loaded->messages[2].sequence, 2u);
  EXPECT_TRUE(fs::exists(test_dir_ / record.id / "messages.json"));
}

TEST_F(JsonStoreTest, UpdateUnknownSessionFails) {
  SessionPatch patch;
  patch.status = "running";
  EXPECT_FALSE(store_->update_session("nonexistent", patch));
}

TEST_F(JsonStoreTest, QueueAndDrainPendingMessages) {
  auto record = store_->create_session("s", "/repo", PermissionMode::Default);

  EXPECT_TRUE(store_->queue_message(record.id, "first"));
  EXPECT_TRUE(store_->queue_message(record.id, "second"));
  EXPECT_FALSE(store_->queue_message("nonexistent", "lost"));

  auto pending = store_->get_pending_messages(record.id);
  EXPECT_EQ(pending, (std::vector<std::string>{"first", "second"}));

  // Returns and clears
  EXPECT_TRUE(store_->get_pending_messages(record.id).empty());
  EXPECT_TRUE(store_->get_pending_messages("nonexistent").empty());
}

TEST_F(JsonStoreTest, GlobalSettings) {
  EXPECT_TRUE(store_->get_global_settings().allowed_tools.empty());

  ASSERT_TRUE(store_->set_global_settings(GlobalSettings{{"Bash(git status)", "Glob"}}));
  EXPECT_EQ(store_->get_global_settings().allowed_tools, (std::vector<std::string>{"Bash(git status)", "Glob"}));
}

TEST_F(JsonStoreTest, ForkSession) {
  auto source = store_->create_session("main", "/repo", PermissionMode::AcceptEdits);

  SessionPatch patch;
  patch.agent_conversation_id = "conv-main";
  patch.append_messages.push_back(StoredMessage::user("hello"));
  ASSERT_TRUE(store_->update_session(source.id, patch));

  auto fork = store_->fork_session(source.id, "");
  ASSERT_TRUE(fork.has_value());
  EXPECT_NE(fork->id, source.id);
  EXPECT_EQ(fork->name, "main (fork)");
  EXPECT_EQ(fork->working_dir, "/repo");
  EXPECT_EQ(fork->permission_mode, PermissionMode::AcceptEdits);
  EXPECT_EQ(fork->agent_conversation_id.value_or(""), "conv-main");
  EXPECT_EQ(fork->forked_from.value_or(""), source.id);

  auto loaded = store_->get_session(fork->id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->messages.empty());

  EXPECT_FALSE(store_->fork_session("nonexistent", "x").has_value());
}

TEST_F(JsonStoreTest, ListAndRemoveSessions) {
  auto a = store_->create_session("a", "/a", PermissionMode::Default);
  auto b = store_->create_session("b", "/b", PermissionMode::Default);

  SessionPatch patch;
  patch.append_messages.push_back(StoredMessage::user("x"));
  store_->update_session(b.id, patch);

  EXPECT_EQ(store_->list_sessions().size(), 2);

  EXPECT_TRUE(store_->remove_session(b.id));
  EXPECT_FALSE(store_->remove_session(b.id));
  EXPECT_FALSE(fs::exists(test_dir_ / b.id));

  auto sessions = store_->list_sessions();
  ASSERT_EQ(sessions.size(), 1);
  EXPECT_EQ(sessions[0].id, a.id);
}

TEST_F(JsonStoreTest, ResetRunningSessions) {
  auto a = store_->create_session("a", "/a", PermissionMode::Default);
  auto b = store_->create_session("b", "/b", PermissionMode::Default);

  SessionPatch running;
  running.status = "running";
  store_->update_session(a.id, running);

  EXPECT_EQ(store_->reset_running_sessions(), 1);
  EXPECT_EQ(store_->get_session(a.id)->status, "stopped");
  EXPECT_EQ(store_->get_session(b.id)->status, "idle");
  EXPECT_EQ(store_->reset_running_sessions(), 0);
}

TEST_F(JsonStoreTest, EmptyStore) {
  // Operations on empty store should not crash
  EXPECT_FALSE(store_->get_session("nonexistent").has_value());
  EXPECT_TRUE(store_->list_sessions().empty());
  EXPECT_TRUE(store_->get_pending_messages("nonexistent").empty());
  EXPECT_TRUE(store_->get_global_settings().allowed_tools.empty());
}

TEST_F(JsonStoreTest, CorruptIndexIsTreatedAsEmpty) {
  {
    std::ofstream file(test_dir_ / "sessions.json");
    file << "{not json";
  }
  EXPECT_TRUE(store_->list_sessions().empty());
  EXPECT_FALSE(store_->get_session("anything").has_value());
}

TEST_F(JsonStoreTest, PersistenceAcrossInstances) {
  auto record = store_->create_session("persistent", "/repo", PermissionMode::Default);
  SessionPatch patch;
  patch.append_messages.push_back(StoredMessage::user("Persisted message"));
  store_->update_session(record.id, patch);
  store_->queue_message(record.id, "later");

  // Create a new store instance pointing to the same directory
  auto store2 = std::make_shared<JsonSessionStore>(test_dir_);

  auto loaded = store2->get_session(record.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->name, "persistent");
  ASSERT_EQ(loaded->messages.size(), 1);
  EXPECT_EQ(loaded->messages[0].content, "Persisted message");
  EXPECT_EQ(loaded->pending_messages, (std::vector<std::string>{"later"}));
}
