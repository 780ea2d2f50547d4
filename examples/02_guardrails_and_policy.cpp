// 02_guardrails_and_policy.cpp
//
// Trust-based authorization with the declarative policy engine.
//
// Scenario:
//   - A read-only reviewer, a standard worker and an elevated CLI agent
//     share an in-memory store seeded with the default registries.
//   - The reviewer may inspect locks but not take them.
//   - A force push is blocked for the worker, but the CLI agent's
//     elevated trust level bypasses that pattern.
//   - Outbound network access follows the domain allow list.
//   - A custom forbid document quarantines one agent without touching
//     the profile registry.

#include <agentcoord/agentcoord.hpp>

#include <iostream>
#include <string>

using namespace agentcoord;

namespace {

AgentIdentity make_identity(const std::string& id, const std::string& type) {
    AgentIdentity identity;
    identity.agent_id = id;
    identity.agent_type = type;
    identity.session_id = id + "-session";
    return identity;
}

void print_decision(const std::string& label, const OperationResult<PolicyDecision>& r) {
    std::cout << "  " << label << ": "
              << (r.success && r.payload.allowed ? "ALLOWED" : "DENIED")
              << " (" << (r.success ? r.payload.reason : r.message) << ")\n";
}

void print_scan(const std::string& label, const OperationResult<GuardrailResult>& r) {
    std::cout << "  " << label << ": " << (r.payload.safe ? "safe" : "BLOCKED");
    for (const auto& v : r.payload.violations) {
        std::cout << " [" << v.pattern_name << "]";
    }
    if (!r.payload.bypassed.empty()) {
        std::cout << " (" << r.payload.bypassed.size() << " bypassed by trust)";
    }
    std::cout << "\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== AgentCoord: Guardrails & Policy Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Service with the declarative engine.
    // ----------------------------------------------------------------
    auto store = std::make_shared<MemoryStore>();
    auto metrics = std::make_shared<MetricsMonitor>();

    Config config;
    config.policy.engine = PolicyEngineKind::Declarative;
    config.audit.async = false;

    CoordinationService service(store, config, metrics);
    service.seed_defaults();
    store->assign_profile("reviewer", "claude-code-web-reviewer");

    auto reviewer = make_identity("reviewer", "claude_code");
    auto worker = make_identity("worker", "codex");
    auto cli = make_identity("cli", "claude_code");
    store->assign_profile("cli", "claude-code-cli");

    std::cout << "Policy engine: " << service.policy_engine()->name() << "\n\n";

    // ----------------------------------------------------------------
    // 2. Read-only reviewer.
    // ----------------------------------------------------------------
    std::cout << "--- Reviewer (trust 1) ---\n";
    auto peek = service.check_locks(reviewer);
    std::cout << "  check_locks: " << (peek.success ? "ok" : peek.message) << "\n";
    auto grab = service.acquire_lock(reviewer, "src/main.cpp");
    std::cout << "  acquire_lock: " << (grab.success ? "granted" : grab.message) << "\n\n";

    // ----------------------------------------------------------------
    // 3. Guardrail scans at different trust levels.
    // ----------------------------------------------------------------
    std::cout << "--- Guardrails ---\n";
    print_scan("worker: rm -rf /", service.check_guardrails(worker, "rm -rf / --no-preserve-root"));
    print_scan("worker: git push --force",
               service.check_guardrails(worker, "git push --force origin main"));
    print_scan("cli:    git push --force",
               service.check_guardrails(cli, "git push --force origin main"));
    print_scan("worker: ls -la", service.check_guardrails(worker, "ls -la"));
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 4. Network allow list.
    // ----------------------------------------------------------------
    std::cout << "--- Network access ---\n";
    print_decision("github.com", service.check_network_access(worker, "github.com"));
    print_decision("pypi.org", service.check_network_access(worker, "pypi.org"));
    print_decision("example.net", service.check_network_access(worker, "example.net"));
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 5. Quarantine one agent with a custom forbid document.
    // ----------------------------------------------------------------
    PolicyDocument quarantine;
    quarantine.name = "quarantine-worker";
    quarantine.priority = 5;
    quarantine.description = "Incident response: worker is quarantined";
    quarantine.text =
        "forbid(principal == Agent::\"worker\", action, resource);";
    store->upsert_policy_document(quarantine);
    service.invalidate_caches();

    std::cout << "--- After quarantine ---\n";
    PolicyRequest request;
    request.principal.agent_id = worker.agent_id;
    request.principal.agent_type = worker.agent_type;
    request.action = "get_work";
    print_decision("worker get_work", service.check_policy(cli, request));

    auto claim = service.claim_task(worker);
    std::cout << "  worker claim_task: " << (claim.success ? "ok" : claim.message) << "\n\n";

    // ----------------------------------------------------------------
    // 6. Metrics.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "=== Metrics ===\n"
              << "  policy allowed:       " << m.policy_allowed << "\n"
              << "  policy denied:        " << m.policy_denied << "\n"
              << "  avg evaluation (us):  " << m.policy_eval_avg_duration_us << "\n"
              << "  guardrail violations: " << m.guardrail_violations << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
