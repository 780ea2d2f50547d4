// 01_basic_usage.cpp
//
// Minimal AgentCoord example: two agents share one SQLite store.
// Demonstrates leased file locks and the dependency-aware work queue.
//
// Scenario:
//   - An orchestrator submits a "design" task and an "implement" task
//     that depends on it.
//   - Two workers race for the same source file; only one gets the lock.
//   - The implement task stays unclaimable until the design task completes.
//   - Every operation lands in the append-only audit trail.

#include <agentcoord/agentcoord.hpp>

#include <cstdio>
#include <iostream>
#include <string>

using namespace agentcoord;
using namespace std::chrono_literals;

namespace {

AgentIdentity make_identity(const std::string& id, const std::string& type) {
    AgentIdentity identity;
    identity.agent_id = id;
    identity.agent_type = type;
    identity.session_id = id + "-session";
    return identity;
}

} // anonymous namespace

int main() {
    std::cout << "=== AgentCoord: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Open the shared store and create the service.
    // ----------------------------------------------------------------
    const std::string db_path = "agentcoord_example.db";
    std::remove(db_path.c_str());

    Config config;
    config.store.backend = StoreBackend::Sqlite;
    config.store.database_path = db_path;

    // Attach a console monitor so we can see what happens internally.
    CoordinationService service(
        config, std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // Profiles, guardrail patterns, network allow list and policy documents
    service.seed_defaults();
    service.start();

    auto orchestrator = make_identity("orchestrator", "strands");
    auto alice = make_identity("alice", "codex");
    auto bob = make_identity("bob", "codex");

    service.register_session(orchestrator, {"planning"});
    service.register_session(alice, {"cpp", "review"});
    service.register_session(bob, {"cpp"});

    // ----------------------------------------------------------------
    // 2. Two agents race for the same file.
    // ----------------------------------------------------------------
    std::cout << "--- alice locks src/parser.cpp ---\n";
    auto first = service.acquire_lock(alice, "src/parser.cpp", 30min, "refactor tokenizer");
    std::cout << "Result: " << to_string(first.payload.outcome) << "\n\n";

    std::cout << "--- bob tries the same file ---\n";
    auto second = service.acquire_lock(bob, "src/parser.cpp");
    std::cout << "Result: " << to_string(second.reason);
    if (second.payload.lock) {
        std::cout << " (held by " << second.payload.lock->holder_id << ")";
    }
    std::cout << "\n\n";

    // ----------------------------------------------------------------
    // 3. Submit two tasks, the second depending on the first.
    // ----------------------------------------------------------------
    TaskSpec design;
    design.type = "design";
    design.description = "Sketch the new parser API";
    design.priority = PRIORITY_HIGHEST;
    auto design_id = service.submit_task(orchestrator, design).payload.task_id;

    TaskSpec implement;
    implement.type = "implement";
    implement.description = "Implement the parser API";
    implement.dependency_ids = {design_id};
    auto implement_id = service.submit_task(orchestrator, implement).payload.task_id;

    std::cout << "Submitted " << design_id << " and dependent " << implement_id << "\n\n";

    // bob only accepts implementation work: nothing is eligible yet
    std::cout << "--- bob claims implement work ---\n";
    auto blocked = service.claim_task(bob, {"implement"});
    std::cout << "Result: " << to_string(blocked.reason) << "\n\n";

    std::cout << "--- alice claims and completes the design ---\n";
    auto claimed = service.claim_task(alice);
    if (claimed.payload) {
        service.complete_task(alice, claimed.payload->id, true, "API sketch in docs/parser.md");
    }

    std::cout << "--- bob claims implement work again ---\n";
    auto ready = service.claim_task(bob, {"implement"});
    std::cout << "Result: " << to_string(ready.reason);
    if (ready.payload) {
        std::cout << " (" << ready.payload->id << ")";
    }
    std::cout << "\n\n";

    // ----------------------------------------------------------------
    // 4. Release the lock and look at the audit trail.
    // ----------------------------------------------------------------
    service.release_lock(alice, "src/parser.cpp");

    AuditFilter filter;
    filter.agent_id = alice.agent_id;
    filter.limit = 10;
    auto audit = service.query_audit(orchestrator, filter);

    std::cout << "=== Audit trail for alice ===\n";
    for (const auto& entry : audit.payload) {
        std::cout << "  " << entry.operation << " -> "
                  << (entry.success ? "ok" : "failed") << "\n";
    }

    auto snap = service.snapshot();
    std::cout << "\nLive locks: " << snap.live_locks
              << ", pending tasks: " << snap.pending_tasks
              << ", claimed tasks: " << snap.claimed_tasks << "\n";

    // ----------------------------------------------------------------
    // 5. Stop the service (drains the audit queue).
    // ----------------------------------------------------------------
    service.stop();

    std::cout << "\n=== Done ===\n";
    return 0;
}
