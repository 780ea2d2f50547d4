#include <gtest/gtest.h>
#include <agentcoord/agentcoord.hpp>

#include "../test_helpers.hpp"

#include <memory>
#include <type_traits>

using namespace agentcoord;
using namespace agentcoord::testing;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture: the same contract runs against every backend
// ===========================================================================

template<typename StoreT>
class StoreContractTest : public ::testing::Test {
protected:
    std::unique_ptr<TempDatabase> db;
    std::shared_ptr<CoordinationStore> store;

    void SetUp() override {
        if constexpr (std::is_same_v<StoreT, SqliteStore>) {
            db = std::make_unique<TempDatabase>("contract");
            store = std::make_shared<SqliteStore>(db->path());
        } else {
            store = std::make_shared<MemoryStore>();
        }
    }

    void TearDown() override {
        store.reset();
        db.reset();
    }

    ClaimOutcome claim(const AgentId& agent, std::vector<std::string> types = {}) {
        ClaimRequest request;
        request.claimant = agent;
        request.accepted_types = std::move(types);
        request.now = current_time();
        return store->claim_task(request);
    }

    CompletionRecord finish(const TaskId& id, const AgentId& agent, bool success,
                            bool requeue = false) {
        TaskCompletion completion;
        completion.task_id = id;
        completion.claimant = agent;
        completion.success = success;
        completion.result = success ? "done" : "";
        completion.error = success ? "" : "boom";
        completion.requeue_on_failure = requeue;
        completion.now = current_time();
        return store->complete_task(completion);
    }
};

using StoreTypes = ::testing::Types<MemoryStore, SqliteStore>;
TYPED_TEST_SUITE(StoreContractTest, StoreTypes);

// ===========================================================================
// Locks
// ===========================================================================

TYPED_TEST(StoreContractTest, AcquireFreeKeyGrants) {
    auto now = current_time();
    auto outcome = this->store->acquire_lock(make_lock("src/a.cpp", "alice", now, 60s), now);
    EXPECT_EQ(outcome.outcome, LockOutcome::Granted);
    EXPECT_EQ(outcome.lock.holder_id, "alice");
    EXPECT_EQ(outcome.lock.expires_at, now + 60s);
}

TYPED_TEST(StoreContractTest, SameHolderRefreshesLease) {
    auto now = current_time();
    auto first = make_lock("k", "alice", now, 60s);
    first.reason = "editing";
    this->store->acquire_lock(first, now);

    auto later = now + 10s;
    auto outcome = this->store->acquire_lock(make_lock("k", "alice", later, 120s), later);
    EXPECT_EQ(outcome.outcome, LockOutcome::Refreshed);
    EXPECT_EQ(outcome.lock.expires_at, later + 120s);
    // An empty reason on refresh keeps the previous one
    EXPECT_EQ(outcome.lock.reason, "editing");
}

TYPED_TEST(StoreContractTest, OtherHolderIsDeniedWithHolderInfo) {
    auto now = current_time();
    this->store->acquire_lock(make_lock("k", "alice", now, 60s), now);

    auto outcome = this->store->acquire_lock(make_lock("k", "bob", now, 60s), now);
    EXPECT_EQ(outcome.outcome, LockOutcome::Denied);
    EXPECT_EQ(outcome.lock.holder_id, "alice");
}

TYPED_TEST(StoreContractTest, ExpiredLockIsPurgedByNextAcquire) {
    auto now = current_time();
    this->store->acquire_lock(make_lock("k", "alice", now - 120s, 60s), now - 120s);

    auto outcome = this->store->acquire_lock(make_lock("k", "bob", now, 60s), now);
    EXPECT_EQ(outcome.outcome, LockOutcome::Granted);
    EXPECT_EQ(outcome.expired_purged, 1u);
    EXPECT_EQ(outcome.lock.holder_id, "bob");
}

TYPED_TEST(StoreContractTest, ReleaseRequiresOwnership) {
    auto now = current_time();
    this->store->acquire_lock(make_lock("k", "alice", now, 60s), now);

    EXPECT_FALSE(this->store->release_lock("k", "bob"));
    EXPECT_TRUE(this->store->release_lock("k", "alice"));
    EXPECT_FALSE(this->store->release_lock("k", "alice"));
}

TYPED_TEST(StoreContractTest, ListLiveLocksFiltersAndSkipsExpired) {
    auto now = current_time();
    this->store->acquire_lock(make_lock("a", "alice", now - 2s, 60s), now - 2s);
    this->store->acquire_lock(make_lock("b", "bob", now - 1s, 60s), now - 1s);
    this->store->acquire_lock(make_lock("old", "bob", now - 120s, 60s), now - 120s);

    auto all = this->store->list_live_locks({}, now);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].resource_key, "b");  // newest first
    EXPECT_EQ(all[1].resource_key, "a");

    LockFilter by_holder;
    by_holder.holder = "alice";
    auto mine = this->store->list_live_locks(by_holder, now);
    ASSERT_EQ(mine.size(), 1u);
    EXPECT_EQ(mine[0].resource_key, "a");

    LockFilter by_key;
    by_key.keys = {"b", "missing"};
    EXPECT_EQ(this->store->list_live_locks(by_key, now).size(), 1u);
}

TYPED_TEST(StoreContractTest, ReleaseLocksHeldByAgent) {
    auto now = current_time();
    this->store->acquire_lock(make_lock("a", "alice", now, 60s), now);
    this->store->acquire_lock(make_lock("b", "alice", now, 60s), now);
    this->store->acquire_lock(make_lock("c", "bob", now, 60s), now);

    EXPECT_EQ(this->store->release_locks_held_by("alice"), 2u);
    EXPECT_EQ(this->store->list_live_locks({}, now).size(), 1u);
}

TYPED_TEST(StoreContractTest, MetadataIsStoredVerbatim) {
    auto now = current_time();
    auto lock = make_lock("k", "alice", now, 60s);
    lock.metadata = R"({"files": ["a.cpp", "b.cpp"], "note": "x\ty"})";
    this->store->acquire_lock(lock, now);

    auto live = this->store->list_live_locks({}, now);
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0].metadata, lock.metadata);
}

// ===========================================================================
// Tasks
// ===========================================================================

TYPED_TEST(StoreContractTest, ClaimOrdersByPriorityThenAge) {
    auto t1 = make_task("t1", "build", 5);
    auto t2 = make_task("t2", "build", 1);
    auto t3 = make_task("t3", "build", 5);
    t3.created_at = t1.created_at + 1ms;
    this->store->insert_task(t1);
    this->store->insert_task(t2);
    this->store->insert_task(t3);

    EXPECT_EQ(this->claim("w").task->id, "t2");
    EXPECT_EQ(this->claim("w").task->id, "t1");
    EXPECT_EQ(this->claim("w").task->id, "t3");
    EXPECT_FALSE(this->claim("w").task.has_value());
}

TYPED_TEST(StoreContractTest, ClaimFiltersByAcceptedType) {
    this->store->insert_task(make_task("t1", "review", 1));
    this->store->insert_task(make_task("t2", "build", 5));

    auto outcome = this->claim("w", {"build"});
    ASSERT_TRUE(outcome.task.has_value());
    EXPECT_EQ(outcome.task->id, "t2");
    EXPECT_EQ(outcome.task->status, TaskStatus::Claimed);
    EXPECT_EQ(outcome.task->claimant, AgentId("w"));
    EXPECT_EQ(outcome.task->attempt_count, 1);
}

TYPED_TEST(StoreContractTest, DependencyGatesClaim) {
    this->store->insert_task(make_task("parent", "build", 5));
    this->store->insert_task(make_task("child", "build", 1, {"parent"}));

    // The child has the better priority but waits for its parent
    auto first = this->claim("w");
    ASSERT_TRUE(first.task.has_value());
    EXPECT_EQ(first.task->id, "parent");
    EXPECT_FALSE(this->claim("w").task.has_value());

    this->finish("parent", "w", true);
    auto second = this->claim("w");
    ASSERT_TRUE(second.task.has_value());
    EXPECT_EQ(second.task->id, "child");
    EXPECT_EQ(second.task->dependency_ids, std::vector<TaskId>{"parent"});
}

TYPED_TEST(StoreContractTest, MissingTasksReportsUnknownIds) {
    this->store->insert_task(make_task("t1", "build"));
    auto missing = this->store->missing_tasks({"t1", "ghost"});
    EXPECT_EQ(missing, std::vector<TaskId>{"ghost"});
}

TYPED_TEST(StoreContractTest, ExpiredDeadlineFailsPendingTask) {
    auto task = make_task("late", "build");
    task.deadline = current_time() - 1s;
    this->store->insert_task(task);

    auto outcome = this->claim("w");
    EXPECT_FALSE(outcome.task.has_value());
    EXPECT_EQ(outcome.deadline_expired, std::vector<TaskId>{"late"});

    auto stored = this->store->get_task("late");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, TaskStatus::Failed);
    EXPECT_EQ(stored->error, std::string("deadline_exceeded"));
}

TYPED_TEST(StoreContractTest, CompletionRequiresClaimant) {
    this->store->insert_task(make_task("t1", "build"));
    this->claim("alice");

    EXPECT_EQ(this->finish("t1", "bob", true).outcome, CompletionOutcome::NotClaimant);
    EXPECT_EQ(this->finish("ghost", "alice", true).outcome, CompletionOutcome::NotFound);

    auto record = this->finish("t1", "alice", true);
    EXPECT_EQ(record.outcome, CompletionOutcome::Completed);
    ASSERT_TRUE(record.task.has_value());
    EXPECT_EQ(record.task->status, TaskStatus::Completed);
    EXPECT_EQ(record.task->result, std::string("done"));
    EXPECT_TRUE(record.task->completed_at.has_value());

    // Terminal: a second completion is refused
    EXPECT_EQ(this->finish("t1", "alice", true).outcome, CompletionOutcome::NotClaimant);
}

TYPED_TEST(StoreContractTest, FailureRequeuesUntilAttemptsExhausted) {
    auto task = make_task("t1", "build");
    task.max_attempts = 2;
    this->store->insert_task(task);

    this->claim("w");
    auto first = this->finish("t1", "w", false, true);
    EXPECT_EQ(first.outcome, CompletionOutcome::Requeued);
    EXPECT_EQ(first.task->status, TaskStatus::Pending);
    EXPECT_FALSE(first.task->claimant.has_value());

    auto again = this->claim("w");
    ASSERT_TRUE(again.task.has_value());
    EXPECT_EQ(again.task->attempt_count, 2);

    auto second = this->finish("t1", "w", false, true);
    EXPECT_EQ(second.outcome, CompletionOutcome::Failed);
    EXPECT_EQ(second.task->error, std::string("boom"));
}

TYPED_TEST(StoreContractTest, CancelOnlyNonTerminalTasks) {
    this->store->insert_task(make_task("t1", "build"));
    EXPECT_EQ(this->store->cancel_task("t1", current_time()), CancelOutcome::Cancelled);
    EXPECT_EQ(this->store->cancel_task("t1", current_time()), CancelOutcome::AlreadyTerminal);
    EXPECT_EQ(this->store->cancel_task("ghost", current_time()), CancelOutcome::NotFound);
    EXPECT_FALSE(this->claim("w").task.has_value());
}

TYPED_TEST(StoreContractTest, ReplaceRepointsPendingDependents) {
    this->store->insert_task(make_task("parent", "build"));
    this->store->insert_task(make_task("child", "build", 5, {"parent"}));

    EXPECT_EQ(this->store->replace_task("parent", make_task("copy", "build")),
              ReplaceOutcome::NotFailed);

    this->claim("w", {"build"});
    this->finish("parent", "w", false);

    EXPECT_EQ(this->store->replace_task("parent", make_task("copy", "build")),
              ReplaceOutcome::Replaced);
    EXPECT_EQ(this->store->get_task("child")->dependency_ids, std::vector<TaskId>{"copy"});
    EXPECT_EQ(this->store->replace_task("ghost", make_task("x", "build")),
              ReplaceOutcome::NotFound);
}

TYPED_TEST(StoreContractTest, InputPayloadIsStoredByteForByte) {
    auto task = make_task("t1", "build");
    task.input = std::string("binary\0payload\xff", 15);
    this->store->insert_task(task);

    auto stored = this->store->get_task("t1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->input, task.input);
}

TYPED_TEST(StoreContractTest, ListTasksByStatusAndClaimant) {
    this->store->insert_task(make_task("t1", "build", 3));
    this->store->insert_task(make_task("t2", "build", 1));
    this->store->insert_task(make_task("t3", "build", 2));
    this->claim("alice");

    TaskFilter pending;
    pending.status = TaskStatus::Pending;
    auto listed = this->store->list_tasks(pending);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].id, "t3");
    EXPECT_EQ(listed[1].id, "t1");

    TaskFilter mine;
    mine.claimant = "alice";
    auto claimed = this->store->list_tasks(mine);
    ASSERT_EQ(claimed.size(), 1u);
    EXPECT_EQ(claimed[0].id, "t2");

    pending.limit = 1;
    EXPECT_EQ(this->store->list_tasks(pending).size(), 1u);
}

// ===========================================================================
// Sessions
// ===========================================================================

TYPED_TEST(StoreContractTest, SessionLifecycle) {
    auto now = current_time();
    AgentSession session;
    session.id = "s1";
    session.agent_id = "alice";
    session.agent_type = "claude_code";
    session.capabilities = {"cpp", "review"};
    session.started_at = now - 10s;
    session.last_heartbeat = now - 10s;
    this->store->upsert_session(session);

    auto touched = this->store->touch_session("s1", now, SessionStatus::Idle, std::string("t9"));
    ASSERT_TRUE(touched.has_value());
    EXPECT_EQ(touched->status, SessionStatus::Idle);
    EXPECT_EQ(touched->last_heartbeat, now);
    EXPECT_EQ(touched->current_task, std::string("t9"));
    EXPECT_FALSE(this->store->touch_session("ghost", now, std::nullopt, std::nullopt).has_value());

    auto loaded = this->store->get_session("s1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->capabilities, (std::vector<std::string>{"cpp", "review"}));
}

TYPED_TEST(StoreContractTest, ListSessionsByCapabilityNewestFirst) {
    auto now = current_time();
    for (int i = 0; i < 3; ++i) {
        AgentSession s;
        s.id = "s" + std::to_string(i);
        s.agent_id = "agent" + std::to_string(i);
        s.capabilities = i == 1 ? std::vector<std::string>{"python"}
                                : std::vector<std::string>{"cpp"};
        s.started_at = now;
        s.last_heartbeat = now - std::chrono::seconds(10 - i);
        this->store->upsert_session(s);
    }

    SessionFilter cpp;
    cpp.capability = "cpp";
    auto found = this->store->list_sessions(cpp);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].id, "s2");
    EXPECT_EQ(found[1].id, "s0");
}

TYPED_TEST(StoreContractTest, ReapStaleSessionsReleasesTheirLocks) {
    auto now = current_time();
    AgentSession stale;
    stale.id = "old";
    stale.agent_id = "ghost";
    stale.started_at = now - 1h;
    stale.last_heartbeat = now - 1h;
    this->store->upsert_session(stale);

    AgentSession fresh = stale;
    fresh.id = "new";
    fresh.agent_id = "alive";
    fresh.last_heartbeat = now;
    this->store->upsert_session(fresh);

    this->store->acquire_lock(make_lock("a", "ghost", now, 10min), now);
    this->store->acquire_lock(make_lock("b", "ghost", now, 10min), now);
    this->store->acquire_lock(make_lock("c", "alive", now, 10min), now);

    auto reaped = this->store->reap_stale_sessions(now - 15min);
    ASSERT_EQ(reaped.size(), 1u);
    EXPECT_EQ(reaped[0].agent_id, "ghost");
    EXPECT_EQ(reaped[0].locks_released, 2u);
    EXPECT_EQ(this->store->get_session("old")->status, SessionStatus::Disconnected);
    EXPECT_EQ(this->store->get_session("new")->status, SessionStatus::Active);

    auto left = this->store->list_live_locks({}, now);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].holder_id, "alive");

    // Disconnected sessions are hidden unless asked for
    EXPECT_EQ(this->store->list_sessions({}).size(), 1u);
    SessionFilter gone;
    gone.status = SessionStatus::Disconnected;
    EXPECT_EQ(this->store->list_sessions(gone).size(), 1u);

    EXPECT_TRUE(this->store->reap_stale_sessions(now - 15min).empty());
}

TYPED_TEST(StoreContractTest, HeartbeatBeforeReapKeepsLocks) {
    auto now = current_time();
    AgentSession session;
    session.id = "s1";
    session.agent_id = "worker";
    session.started_at = now - 1h;
    session.last_heartbeat = now - 1h;
    this->store->upsert_session(session);
    this->store->acquire_lock(make_lock("k", "worker", now, 10min), now);

    ASSERT_TRUE(this->store->touch_session("s1", now, std::nullopt, std::nullopt));
    EXPECT_TRUE(this->store->reap_stale_sessions(now - 15min).empty());
    EXPECT_EQ(this->store->list_live_locks({}, now).size(), 1u);
}

// ===========================================================================
// Audit
// ===========================================================================

TYPED_TEST(StoreContractTest, AuditQueryNewestFirstWithFilters) {
    auto now = current_time();
    auto a = make_audit_entry("e1", "alice", "acquire_lock", now - 3s);
    a.parameters["resource_key"] = "src/a.cpp";
    a.result["outcome"] = "granted";
    a.duration = 1500us;
    this->store->append_audit({a,
                               make_audit_entry("e2", "bob", "claim_task", now - 2s),
                               make_audit_entry("e3", "alice", "release_lock", now - 1s)});

    auto all = this->store->query_audit({});
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "e3");
    EXPECT_EQ(all[2].id, "e1");
    EXPECT_EQ(all[2].parameters.at("resource_key"), "src/a.cpp");
    EXPECT_EQ(all[2].result.at("outcome"), "granted");
    EXPECT_EQ(all[2].duration, std::chrono::duration_cast<Duration>(1500us));

    AuditFilter alice;
    alice.agent_id = "alice";
    EXPECT_EQ(this->store->query_audit(alice).size(), 2u);

    AuditFilter window;
    window.since = now - 2s;
    window.until = now - 2s;
    auto windowed = this->store->query_audit(window);
    ASSERT_EQ(windowed.size(), 1u);
    EXPECT_EQ(windowed[0].id, "e2");

    AuditFilter limited;
    limited.limit = 1;
    EXPECT_EQ(this->store->query_audit(limited).size(), 1u);
}

TYPED_TEST(StoreContractTest, AuditPurgeRemovesOnlyOlderEntries) {
    auto now = current_time();
    this->store->append_audit({make_audit_entry("old", "a", "op", now - 48h),
                               make_audit_entry("new", "a", "op", now)});

    EXPECT_EQ(this->store->purge_audit_before(now - 24h, 24h), 1u);
    auto left = this->store->query_audit({});
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, "new");
}

TYPED_TEST(StoreContractTest, AuditPurgeClampsCutoffToRetention) {
    auto now = current_time();
    this->store->append_audit({make_audit_entry("old", "a", "op", now - 48h),
                               make_audit_entry("recent", "a", "op", now - 1h),
                               make_audit_entry("new", "a", "op", now)});

    EXPECT_EQ(this->store->purge_audit_before(now + 24h * 365, 24h), 1u);
    auto left = this->store->query_audit({});
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left[0].id, "new");
    EXPECT_EQ(left[1].id, "recent");
}

// ===========================================================================
// Registries
// ===========================================================================

TYPED_TEST(StoreContractTest, SeededRegistriesLoad) {
    seed_defaults(*this->store);

    EXPECT_EQ(this->store->load_guardrail_patterns().size(), 15u);
    EXPECT_EQ(this->store->load_network_policies().size(), 5u);

    auto documents = this->store->load_policy_documents();
    ASSERT_EQ(documents.size(), 5u);
    EXPECT_EQ(documents.front().name, "suspended-agents");
    EXPECT_EQ(documents.back().name, "network-access");
}

TYPED_TEST(StoreContractTest, DisabledPatternIsNotLoaded) {
    GuardrailPattern p;
    p.name = "custom";
    p.category = "test";
    p.regex = "danger";
    this->store->upsert_guardrail_pattern(p);
    EXPECT_EQ(this->store->load_guardrail_patterns().size(), 1u);

    p.enabled = false;
    this->store->upsert_guardrail_pattern(p);
    EXPECT_TRUE(this->store->load_guardrail_patterns().empty());
}

TYPED_TEST(StoreContractTest, ProfileResolutionPrefersAssignment) {
    seed_defaults(*this->store);

    auto by_type = this->store->find_profile("anyone", "claude_code");
    ASSERT_TRUE(by_type.has_value());
    EXPECT_EQ(by_type->name, "claude-code-cli");

    this->store->assign_profile("reviewer-1", "claude-code-web-reviewer");
    auto assigned = this->store->find_profile("reviewer-1", "claude_code");
    ASSERT_TRUE(assigned.has_value());
    EXPECT_EQ(assigned->name, "claude-code-web-reviewer");
    EXPECT_EQ(assigned->trust_level, TRUST_RESTRICTED);

    EXPECT_FALSE(this->store->find_profile("x", "unknown").has_value());
    EXPECT_THROW(this->store->assign_profile("x", "no-such-profile"), InvalidRequestException);
}

TYPED_TEST(StoreContractTest, ProfileCarriesNetworkOverrides) {
    seed_defaults(*this->store);

    NetworkAccessPolicy deny;
    deny.domain_pattern = "pypi.org";
    deny.action = NetworkAction::Deny;
    deny.priority = 1;
    deny.profile_name = "codex-cloud-worker";
    this->store->upsert_network_policy(deny);

    auto profile = this->store->find_profile("c1", "codex");
    ASSERT_TRUE(profile.has_value());
    ASSERT_EQ(profile->network_overrides.size(), 1u);
    EXPECT_EQ(profile->network_overrides[0].action, NetworkAction::Deny);
    EXPECT_EQ(this->store->load_network_policies().size(), 6u);
}

TYPED_TEST(StoreContractTest, ViolationsListedNewestFirst) {
    GuardrailViolation v;
    v.agent_id = "alice";
    v.pattern_name = "rm_rf";
    v.created_at = current_time();
    auto w = v;
    w.pattern_name = "git_force_push";
    this->store->record_violations({v, w});

    auto listed = this->store->list_violations(std::string("alice"), 10);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].pattern_name, "git_force_push");
    EXPECT_TRUE(this->store->list_violations(std::string("bob"), 10).empty());
}
