#include <gtest/gtest.h>
#include <agentcoord/agentcoord.hpp>

#include "../test_helpers.hpp"

using namespace agentcoord;
using namespace agentcoord::testing;

// ===========================================================================
// Fixture: SQLite store with one old and one recent audit entry
// ===========================================================================

class AuditImmutabilityTest : public ::testing::Test {
protected:
    TempDatabase db{"audit_immutable"};
    std::shared_ptr<SqliteStore> store;
    Timestamp now;

    void SetUp() override {
        store = std::make_shared<SqliteStore>(db.path());
        now = current_time();

        auto old_entry = make_audit_entry("entry-old", "alice", "acquire_lock",
                                          now - std::chrono::hours(24 * 200));
        old_entry.parameters["resource_key"] = "src/old.cpp";

        auto new_entry = make_audit_entry("entry-new", "bob", "complete_task",
                                          now - std::chrono::hours(1));
        new_entry.result["status"] = "completed";

        store->append_audit({old_entry, new_entry});
    }

    std::size_t count() {
        AuditFilter filter;
        filter.limit = 100;
        return store->query_audit(filter).size();
    }
};

TEST_F(AuditImmutabilityTest, UpdateIsRejected) {
    EXPECT_THROW(store->execute("UPDATE audit_log SET agent_id = 'mallory' WHERE id = 'entry-new'"),
                 AuditImmutableException);
    EXPECT_THROW(store->execute("UPDATE audit_log_fields SET value = 'failed' "
                                "WHERE entry_id = 'entry-new'"),
                 AuditImmutableException);

    AuditFilter filter;
    filter.agent_id = std::string("bob");
    auto entries = store->query_audit(filter);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].result.at("status"), "completed");
}

TEST_F(AuditImmutabilityTest, DeleteIsRejected) {
    EXPECT_THROW(store->execute("DELETE FROM audit_log"), AuditImmutableException);
    EXPECT_THROW(store->execute("DELETE FROM audit_log_fields"), AuditImmutableException);
    EXPECT_EQ(count(), 2u);
}

TEST_F(AuditImmutabilityTest, RetentionPurgeStillWorks) {
    EXPECT_EQ(store->purge_audit_before(now - std::chrono::hours(24 * 90),
                                        std::chrono::hours(24 * 90)), 1u);
    EXPECT_EQ(count(), 1u);

    // Entries inside the retention window stay protected after a purge
    EXPECT_THROW(store->execute("DELETE FROM audit_log WHERE id = 'entry-new'"),
                 AuditImmutableException);
    EXPECT_EQ(count(), 1u);
}

TEST_F(AuditImmutabilityTest, FutureCutoffCannotReachRecentEntries) {
    EXPECT_EQ(store->purge_audit_before(now + std::chrono::hours(24 * 365),
                                        std::chrono::hours(24)), 1u);
    EXPECT_EQ(count(), 1u);

    // The stored horizon stays behind the retention window
    store->append_audit({make_audit_entry("entry-fresh", "carol", "heartbeat", current_time())});
    EXPECT_THROW(store->execute("DELETE FROM audit_log WHERE id = 'entry-fresh'"),
                 AuditImmutableException);
    EXPECT_THROW(store->execute("DELETE FROM audit_log WHERE id = 'entry-new'"),
                 AuditImmutableException);
    EXPECT_EQ(count(), 2u);
}

TEST_F(AuditImmutabilityTest, ProtectionSurvivesReopen) {
    store.reset();
    SqliteStore reopened(db.path());
    EXPECT_THROW(reopened.execute("DELETE FROM audit_log WHERE id = 'entry-old'"),
                 AuditImmutableException);
}

TEST_F(AuditImmutabilityTest, OtherSqlErrorsAreStoreErrors) {
    EXPECT_THROW(store->execute("SELECT * FROM no_such_table"), StoreException);
}

TEST_F(AuditImmutabilityTest, ServicePurgeThroughPolicy) {
    Config cfg;
    cfg.audit.retention_days = 90;
    CoordinationService service(store, cfg);
    service.seed_defaults();

    AgentIdentity admin;
    admin.agent_id = "ops";
    admin.agent_type = "strands";

    auto purged = service.purge_audit(admin);
    ASSERT_TRUE(purged.success) << purged.message;
    EXPECT_EQ(purged.payload, 1u);
}

TEST_F(AuditImmutabilityTest, ServicePurgeKeepsRetentionWindow) {
    Config cfg;
    cfg.audit.async = false;
    cfg.audit.retention_days = 1;
    CoordinationService service(store, cfg);
    service.seed_defaults();

    AgentIdentity admin;
    admin.agent_id = "ops";
    admin.agent_type = "strands";
    ASSERT_TRUE(service.acquire_lock(admin, "src/main.cpp").success);

    auto purged = service.purge_audit(admin);
    ASSERT_TRUE(purged.success) << purged.message;
    EXPECT_EQ(purged.payload, 1u);

    AuditFilter filter;
    filter.limit = 100;
    auto left = store->query_audit(filter);
    ASSERT_FALSE(left.empty());
    for (const auto& entry : left) {
        EXPECT_NE(entry.id, "entry-old");
        EXPECT_THROW(store->execute("DELETE FROM audit_log WHERE id = '" + entry.id + "'"),
                     AuditImmutableException);
    }
}
