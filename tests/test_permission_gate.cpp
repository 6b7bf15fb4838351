#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "permission/permission_gate.hpp"

using namespace tether;
using namespace tether::permission;
using namespace std::chrono_literals;

class PermissionGateTest : public ::testing::Test {
 protected:
  void SetUp() override {
    global_ = std::make_shared<GlobalAllowlist>();
    gate_ = std::make_unique<PermissionGate>(global_);
  }

  static PermissionDecision allow(bool remember = false, bool global = false) {
    PermissionDecision decision;
    decision.behavior = PermissionBehavior::Allow;
    decision.remember = remember;
    decision.global = global;
    return decision;
  }

  std::shared_ptr<GlobalAllowlist> global_;
  std::unique_ptr<PermissionGate> gate_;
};

TEST_F(PermissionGateTest, DenyFeedbackText) {
  EXPECT_EQ(deny_feedback(std::nullopt),
            "[USER FEEDBACK] Permission denied by user. Respect this decision and do not attempt this action again.");
  EXPECT_EQ(deny_feedback("Use the staging DB"),
            "[USER FEEDBACK] Use the staging DB. Respect this decision and do not attempt this action again.");
}

TEST_F(PermissionGateTest, SuspendedRequestIsPendingUntilDecided) {
  json input = {{"command", "rm -rf build"}};
  auto future = gate_->suspend("tool-1", "Bash", input);

  EXPECT_TRUE(gate_->has_pending());
  ASSERT_EQ(gate_->pending().size(), 1);
  EXPECT_EQ(gate_->pending()[0].tool_name, "Bash");
  EXPECT_EQ(future.wait_for(0ms), std::future_status::timeout);

  auto outcome = gate_->render_decision("tool-1", allow());
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(gate_->has_pending());

  auto result = future.get();
  EXPECT_TRUE(result.allowed());
  EXPECT_EQ(result.updated_input, input);
}

TEST_F(PermissionGateTest, AllowWithUpdatedInput) {
  auto future = gate_->suspend("tool-1", "Write", {{"file_path", "/repo/a"}, {"content", "old"}});

  auto decision = allow();
  decision.updated_input = json{{"file_path", "/repo/a"}, {"content", "new"}};
  gate_->render_decision("tool-1", decision);

  EXPECT_EQ(future.get().updated_input["content"], "new");
}

TEST_F(PermissionGateTest, DenyCarriesFeedback) {
  auto future = gate_->suspend("tool-1", "Bash", {{"command", "git push --force"}});

  PermissionDecision decision;
  decision.behavior = PermissionBehavior::Deny;
  decision.message = "Never force push";
  auto outcome = gate_->render_decision("tool-1", decision);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(outcome->remembered_pattern.has_value());

  auto result = future.get();
  EXPECT_FALSE(result.allowed());
  EXPECT_EQ(result.message, deny_feedback("Never force push"));
}

TEST_F(PermissionGateTest, SecondDecisionIsNoOp) {
  auto future = gate_->suspend("tool-1", "Glob", {{"pattern", "*"}});
  EXPECT_TRUE(gate_->render_decision("tool-1", allow()).has_value());
  EXPECT_FALSE(gate_->render_decision("tool-1", allow()).has_value());
  EXPECT_FALSE(gate_->render_decision("unknown", allow()).has_value());
  EXPECT_TRUE(future.get().allowed());
}

TEST_F(PermissionGateTest, RememberAddsToSessionOnly) {
  auto future = gate_->suspend("tool-1", "Write", {{"file_path", "/repo/README.md"}});
  auto outcome = gate_->render_decision("tool-1", allow(true, false));

  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->added_to_session);
  EXPECT_FALSE(outcome->added_to_global);
  ASSERT_TRUE(outcome->remembered_pattern.has_value());
  EXPECT_EQ(*outcome->remembered_pattern, "Write(/repo/README.md)");
  EXPECT_EQ(gate_->session_allowed(), (PatternList{"Write(/repo/README.md)"}));
  EXPECT_TRUE(global_->patterns().empty());

  EXPECT_TRUE(gate_->is_allowed("Write", {{"file_path", "/repo/README.md"}}));

  // A fresh gate sharing the global list knows nothing about it
  PermissionGate other(global_);
  EXPECT_FALSE(other.is_allowed("Write", {{"file_path", "/repo/README.md"}}));
}

TEST_F(PermissionGateTest, RememberGlobalIsSharedAcrossGates) {
  auto future = gate_->suspend("tool-1", "Bash", {{"command", "pnpm build"}});
  auto outcome = gate_->render_decision("tool-1", allow(true, true));

  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->added_to_global);
  EXPECT_FALSE(outcome->added_to_session);
  EXPECT_TRUE(gate_->session_allowed().empty());

  PermissionGate other(global_);
  EXPECT_TRUE(other.is_allowed("Bash", {{"command", "pnpm build --filter web"}}));
  EXPECT_FALSE(other.is_allowed("Bash", {{"command", "pnpm buildx"}}));
}

TEST_F(PermissionGateTest, RejectAllFailsEveryContinuation) {
  auto f1 = gate_->suspend("tool-1", "Bash", {{"command", "a"}});
  auto f2 = gate_->suspend("tool-2", "Bash", {{"command", "b"}});

  EXPECT_EQ(gate_->reject_all("Session aborted"), 2);
  EXPECT_FALSE(gate_->has_pending());

  EXPECT_THROW(f1.get(), PermissionCancelled);
  try {
    f2.get();
    FAIL() << "expected PermissionCancelled";
  } catch (const PermissionCancelled &e) {
    EXPECT_STREQ(e.what(), "Session aborted");
  }

  EXPECT_EQ(gate_->reject_all("again"), 0);
}

TEST_F(PermissionGateTest, DuplicateIdSupersedesOlderEntry) {
  auto old_future = gate_->suspend("tool-1", "Bash", {{"command", "a"}});
  auto new_future = gate_->suspend("tool-1", "Bash", {{"command", "b"}});

  ASSERT_EQ(gate_->pending().size(), 1);
  EXPECT_EQ(gate_->pending()[0].input["command"], "b");
  EXPECT_THROW(old_future.get(), PermissionCancelled);

  gate_->render_decision("tool-1", allow());
  EXPECT_EQ(new_future.get().updated_input["command"], "b");
}

TEST_F(PermissionGateTest, PendingKeepsInsertionOrder) {
  auto f1 = gate_->suspend("b", "Read", {{"file_path", "/1"}});
  auto f2 = gate_->suspend("a", "Read", {{"file_path", "/2"}});
  auto f3 = gate_->suspend("c", "Read", {{"file_path", "/3"}});

  auto pending = gate_->pending();
  ASSERT_EQ(pending.size(), 3);
  EXPECT_EQ(pending[0].invocation_id, "b");
  EXPECT_EQ(pending[1].invocation_id, "a");
  EXPECT_EQ(pending[2].invocation_id, "c");
  gate_->reject_all("done");
}

TEST_F(PermissionGateTest, WaiterOnAnotherThreadIsReleased) {
  auto future = gate_->suspend("tool-1", "Bash", {{"command", "make"}});

  PermissionResult received;
  std::thread waiter([&]() { received = future.get(); });

  std::this_thread::sleep_for(20ms);
  gate_->render_decision("tool-1", allow());
  waiter.join();

  EXPECT_TRUE(received.allowed());
}
