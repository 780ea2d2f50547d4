#include <gtest/gtest.h>
#include <agentcoord/agentcoord.hpp>

#include "../test_helpers.hpp"

using namespace agentcoord;
using namespace agentcoord::testing;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture: WorkQueue with guardrail scanning over an in-memory store
// ===========================================================================

class WorkQueueTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStore> store;
    std::shared_ptr<RecordingMonitor> monitor;
    std::shared_ptr<GuardrailEngine> guardrails;
    std::unique_ptr<WorkQueue> queue;

    void SetUp() override {
        store = std::make_shared<MemoryStore>();
        monitor = std::make_shared<RecordingMonitor>();
        guardrails = std::make_shared<GuardrailEngine>(store);
        queue = std::make_unique<WorkQueue>(store, QueueConfig{}, guardrails, monitor);
    }

    TaskId submit(const std::string& type, std::optional<TaskPriority> priority = std::nullopt,
                  std::vector<TaskId> deps = {}) {
        TaskSpec spec;
        spec.type = type;
        spec.description = type + " task";
        spec.priority = priority;
        spec.dependency_ids = std::move(deps);
        auto result = queue->submit(spec);
        EXPECT_TRUE(result.success) << result.message;
        return result.task_id;
    }

    CompleteResult complete(const TaskId& id, const AgentId& agent, bool success,
                            const std::string& result = "ok", TrustLevel trust = TRUST_STANDARD) {
        CompletionReport report;
        report.task_id = id;
        report.claimant = agent;
        report.success = success;
        report.result = success ? result : "";
        report.error = success ? "" : "compile error";
        report.trust_level = trust;
        return queue->complete(report);
    }
};

// ===========================================================================
// Submission
// ===========================================================================

TEST_F(WorkQueueTest, SubmitAppliesDefaults) {
    auto id = submit("build");
    auto task = queue->get(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->priority, PRIORITY_DEFAULT);
    EXPECT_EQ(task->max_attempts, 3);
    EXPECT_EQ(task->status, TaskStatus::Pending);
    EXPECT_EQ(task->attempt_count, 0);
    EXPECT_EQ(monitor->count(EventType::TaskSubmitted), 1u);
}

TEST_F(WorkQueueTest, SubmitValidatesInput) {
    TaskSpec spec;
    EXPECT_EQ(queue->submit(spec).reason, ReasonCode::InvalidRequest);

    spec.type = "build";
    spec.priority = 0;
    EXPECT_EQ(queue->submit(spec).reason, ReasonCode::InvalidPriority);
    spec.priority = 11;
    EXPECT_EQ(queue->submit(spec).reason, ReasonCode::InvalidPriority);

    spec.priority = 5;
    spec.max_attempts = 0;
    EXPECT_EQ(queue->submit(spec).reason, ReasonCode::InvalidRequest);
}

TEST_F(WorkQueueTest, SubmitRejectsUnknownDependencies) {
    auto known = submit("build");

    TaskSpec spec;
    spec.type = "test";
    spec.dependency_ids = {known, "ghost-1", "ghost-2"};
    auto result = queue->submit(spec);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, ReasonCode::UnknownDependency);
    EXPECT_EQ(result.missing_dependencies, (std::vector<TaskId>{"ghost-1", "ghost-2"}));
    EXPECT_EQ(queue->pending().size(), 1u);
}

// ===========================================================================
// Claiming
// ===========================================================================

TEST_F(WorkQueueTest, ClaimHighestPriorityFirst) {
    auto low = submit("build", 8);
    auto high = submit("build", 1);
    auto mid = submit("build", 5);

    EXPECT_EQ(queue->claim("w").task->id, high);
    EXPECT_EQ(queue->claim("w").task->id, mid);
    EXPECT_EQ(queue->claim("w").task->id, low);

    auto empty = queue->claim("w");
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.reason, ReasonCode::NoTasksAvailable);
}

TEST_F(WorkQueueTest, ClaimRequiresRequester) {
    submit("build");
    EXPECT_EQ(queue->claim("").reason, ReasonCode::InvalidRequest);
}

TEST_F(WorkQueueTest, DependentWaitsForCompletion) {
    auto parent = submit("build", 5);
    auto child = submit("test", 1, {parent});

    auto first = queue->claim("w");
    ASSERT_TRUE(first.success);
    EXPECT_EQ(first.task->id, parent);
    EXPECT_FALSE(queue->claim("w").success);

    ASSERT_TRUE(complete(parent, "w", true).success);
    auto second = queue->claim("w");
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.task->id, child);
}

TEST_F(WorkQueueTest, PassedDeadlineFailsTaskOnClaim) {
    TaskSpec spec;
    spec.type = "build";
    spec.deadline = current_time() - 1s;
    auto late = queue->submit(spec).task_id;

    auto result = queue->claim("w");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.deadline_expired, std::vector<TaskId>{late});
    EXPECT_EQ(queue->get(late)->status, TaskStatus::Failed);
    EXPECT_EQ(monitor->count(EventType::TaskDeadlineExceeded), 1u);
}

// ===========================================================================
// Completion
// ===========================================================================

TEST_F(WorkQueueTest, CompleteRecordsResult) {
    auto id = submit("build");
    queue->claim("alice");

    auto result = complete(id, "alice", true, "built 3 targets");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.task->status, TaskStatus::Completed);
    EXPECT_EQ(result.task->result, std::string("built 3 targets"));
    EXPECT_EQ(monitor->count(EventType::TaskCompleted), 1u);
}

TEST_F(WorkQueueTest, CompleteByNonClaimantIsRejected) {
    auto id = submit("build");
    queue->claim("alice");

    auto result = complete(id, "bob", true);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, ReasonCode::TaskNotClaimedByAgent);
    EXPECT_EQ(queue->get(id)->status, TaskStatus::Claimed);

    EXPECT_EQ(complete("ghost", "alice", true).reason, ReasonCode::TaskNotFound);
}

TEST_F(WorkQueueTest, DestructiveResultIsBlockedByGuardrails) {
    auto id = submit("cleanup");
    queue->claim("alice");

    auto result = complete(id, "alice", true, "ran: rm -rf /var/data");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, ReasonCode::GuardrailViolation);
    EXPECT_FALSE(result.violations.empty());

    // The task stays claimed so the claimant can report again
    EXPECT_EQ(queue->get(id)->status, TaskStatus::Claimed);
    EXPECT_TRUE(complete(id, "alice", true, "cleaned build directory").success);
}

TEST_F(WorkQueueTest, TrustedAgentBypassesGuardrails) {
    auto id = submit("release");
    queue->claim("alice");

    auto result = complete(id, "alice", true, "git push origin main --force", TRUST_ELEVATED);
    EXPECT_TRUE(result.success);
}

TEST_F(WorkQueueTest, FailureIsTerminalUnderExplicitResubmit) {
    auto id = submit("build");
    queue->claim("alice");

    auto result = complete(id, "alice", false);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.requeued);
    EXPECT_EQ(result.task->status, TaskStatus::Failed);
    EXPECT_EQ(result.task->error, std::string("compile error"));
}

TEST_F(WorkQueueTest, RequeuePolicyRetriesUntilExhausted) {
    QueueConfig cfg;
    cfg.retry_policy = RetryPolicy::RequeueUntilExhausted;
    WorkQueue retrying(store, cfg, guardrails, monitor);

    TaskSpec spec;
    spec.type = "flaky";
    spec.max_attempts = 2;
    auto id = retrying.submit(spec).task_id;

    retrying.claim("w");
    CompletionReport report;
    report.task_id = id;
    report.claimant = "w";
    report.success = false;
    report.error = "timeout";
    auto first = retrying.complete(report);
    EXPECT_TRUE(first.requeued);
    EXPECT_EQ(first.task->status, TaskStatus::Pending);

    auto again = retrying.claim("w");
    ASSERT_TRUE(again.success);
    EXPECT_EQ(again.task->attempt_count, 2);

    auto second = retrying.complete(report);
    EXPECT_FALSE(second.requeued);
    EXPECT_EQ(second.task->status, TaskStatus::Failed);
}

// ===========================================================================
// Cancel and resubmit
// ===========================================================================

TEST_F(WorkQueueTest, CancelPendingTask) {
    auto id = submit("build");
    auto result = queue->cancel(id);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(queue->get(id)->status, TaskStatus::Cancelled);

    EXPECT_EQ(queue->cancel(id).reason, ReasonCode::TaskAlreadyTerminal);
    EXPECT_EQ(queue->cancel("ghost").reason, ReasonCode::TaskNotFound);
}

TEST_F(WorkQueueTest, ResubmitFailedTaskRedirectsDependents) {
    auto parent = submit("build", 5);
    auto child = submit("test", 5, {parent});
    queue->claim("w", {"build"});
    complete(parent, "w", false);

    auto copy = queue->resubmit(parent);
    ASSERT_TRUE(copy.success);
    EXPECT_NE(copy.task_id, parent);

    auto replacement = queue->get(copy.task_id);
    ASSERT_TRUE(replacement.has_value());
    EXPECT_EQ(replacement->type, "build");
    EXPECT_EQ(replacement->status, TaskStatus::Pending);
    EXPECT_EQ(replacement->attempt_count, 0);
    EXPECT_EQ(queue->get(child)->dependency_ids, std::vector<TaskId>{copy.task_id});
}

TEST_F(WorkQueueTest, ResubmitRequiresFailedOrCancelled) {
    auto id = submit("build");
    EXPECT_EQ(queue->resubmit(id).reason, ReasonCode::TaskNotFailed);
    EXPECT_EQ(queue->resubmit("ghost").reason, ReasonCode::TaskNotFound);

    queue->cancel(id);
    EXPECT_TRUE(queue->resubmit(id).success);
}

TEST_F(WorkQueueTest, ResubmitDropsElapsedDeadline) {
    TaskSpec spec;
    spec.type = "build";
    spec.deadline = current_time() - 1s;
    auto id = queue->submit(spec).task_id;
    queue->claim("w");  // fails it

    auto copy = queue->resubmit(id);
    ASSERT_TRUE(copy.success);
    EXPECT_FALSE(queue->get(copy.task_id)->deadline.has_value());
}

// ===========================================================================
// Queries
// ===========================================================================

TEST_F(WorkQueueTest, PendingListingHonorsLimit) {
    for (int i = 0; i < 25; ++i) {
        submit("bulk");
    }
    EXPECT_EQ(queue->pending().size(), 20u);
    EXPECT_EQ(queue->pending(5).size(), 5u);
}

TEST_F(WorkQueueTest, ClaimedByAgent) {
    submit("a");
    submit("b");
    queue->claim("alice");
    queue->claim("bob");

    auto mine = queue->claimed_by("alice");
    ASSERT_EQ(mine.size(), 1u);
    EXPECT_EQ(mine[0].claimant, AgentId("alice"));
}
