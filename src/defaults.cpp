#include "agentcoord/defaults.hpp"

#include <algorithm>

namespace agentcoord {

namespace {

GuardrailPattern pattern(const char* name, const char* category, const char* regex,
                         Severity severity, TrustLevel min_trust, const char* description) {
    GuardrailPattern p;
    p.name = name;
    p.category = category;
    p.regex = regex;
    p.severity = severity;
    p.min_trust_to_bypass = min_trust;
    p.description = description;
    return p;
}

AgentProfile profile(const char* name, const char* agent_type, TrustLevel trust,
                     std::vector<std::string> allowed_ops, std::int64_t max_file_modifications,
                     const char* description) {
    AgentProfile p;
    p.name = name;
    p.agent_type = agent_type;
    p.trust_level = trust;
    p.allowed_ops = std::move(allowed_ops);
    p.resource_limits.max_file_modifications = max_file_modifications;
    p.description = description;
    return p;
}

NetworkAccessPolicy allow_domain(const char* domain, std::int32_t priority, const char* description) {
    NetworkAccessPolicy p;
    p.domain_pattern = domain;
    p.action = NetworkAction::Allow;
    p.priority = priority;
    p.description = description;
    return p;
}

std::string permit_each(const std::vector<std::string>& actions, const std::string& condition) {
    std::string text;
    for (const auto& action : actions) {
        text += "permit(principal, action == Action::\"" + action + "\", resource)";
        if (!condition.empty()) {
            text += " when { " + condition + " }";
        }
        text += ";\n";
    }
    return text;
}

const std::vector<std::string>& default_domains() {
    static const std::vector<std::string> domains = {
        "github.com",
        "api.github.com",
        "raw.githubusercontent.com",
        "registry.npmjs.org",
        "pypi.org",
    };
    return domains;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // anonymous namespace

// ========== Action vocabulary ==========

const std::vector<std::string>& read_actions() {
    static const std::vector<std::string> actions = {
        "check_locks", "get_work", "recall", "discover_agents", "read_handoff",
        "query_audit", "check_policy", "register_session", "heartbeat",
    };
    return actions;
}

const std::vector<std::string>& write_actions() {
    static const std::vector<std::string> actions = {
        "acquire_lock", "release_lock", "complete_work", "submit_work", "cancel_work",
        "remember", "write_handoff", "check_guardrails",
    };
    return actions;
}

const std::vector<std::string>& admin_actions() {
    static const std::vector<std::string> actions = {
        "force_push", "delete_branch", "cleanup_agents", "purge_audit",
    };
    return actions;
}

ActionClass classify_action(const std::string& action) {
    if (contains(read_actions(), action)) return ActionClass::Read;
    if (contains(write_actions(), action)) return ActionClass::Write;
    if (contains(admin_actions(), action)) return ActionClass::Admin;
    if (action == NETWORK_ACCESS_ACTION) return ActionClass::Network;
    return ActionClass::Unknown;
}

// ========== Embedded registries ==========

std::vector<GuardrailPattern> baseline_guardrail_patterns() {
    return {
        pattern("git_force_push", "git", R"(git\s+push\s+.*--force)",
                Severity::Block, TRUST_ELEVATED, "Force push can overwrite remote history"),
        pattern("git_reset_hard", "git", R"(git\s+reset\s+--hard)",
                Severity::Block, TRUST_ELEVATED, "Hard reset discards uncommitted changes"),
        pattern("git_clean_force", "git", R"(git\s+clean\s+-[fd])",
                Severity::Block, TRUST_ELEVATED, "Clean force removes untracked files"),
        pattern("git_branch_delete", "git", R"(git\s+(branch\s+-D|push\s+.*--delete))",
                Severity::Warn, TRUST_ELEVATED, "Branch deletion may lose work"),
        pattern("rm_recursive_force", "file", R"(rm\s+-r[f]?\s+/)",
                Severity::Block, TRUST_ADMIN, "Recursive delete from root is destructive"),
        pattern("rm_rf", "file", R"(rm\s+-rf\s+)",
                Severity::Block, TRUST_ELEVATED, "Force recursive delete is destructive"),
        pattern("find_delete", "file", R"(find\s+.*-delete)",
                Severity::Warn, TRUST_ELEVATED, "Find with delete can remove many files"),
        pattern("drop_table", "database", R"(DROP\s+TABLE)",
                Severity::Block, TRUST_ADMIN, "Dropping tables destroys data"),
        pattern("truncate_table", "database", R"(TRUNCATE\s+)",
                Severity::Block, TRUST_ADMIN, "Truncating tables destroys data"),
        pattern("delete_no_where", "database", R"(DELETE\s+FROM\s+\w+\s*;)",
                Severity::Block, TRUST_ELEVATED, "DELETE without WHERE removes all rows"),
        pattern("env_file_modify", "credential", R"(\.(env|env\.local|env\.production))",
                Severity::Warn, TRUST_STANDARD, "Environment files may contain secrets"),
        pattern("credentials_file", "credential",
                R"((credentials|secrets|passwords)\.(json|yaml|yml|txt))",
                Severity::Warn, TRUST_STANDARD, "Credential files should not be modified by agents"),
        pattern("ssh_key_modify", "credential", R"(\.ssh/(id_rsa|id_ed25519|authorized_keys))",
                Severity::Block, TRUST_ADMIN, "SSH key modification is security-sensitive"),
        pattern("deploy_command", "deployment", R"((kubectl\s+apply|terraform\s+apply|docker\s+push))",
                Severity::Block, TRUST_ELEVATED, "Production deployment should require approval"),
        pattern("npm_publish", "deployment", R"(npm\s+publish)",
                Severity::Block, TRUST_ELEVATED, "Publishing packages should require approval"),
    };
}

std::vector<AgentProfile> default_profiles() {
    const std::vector<std::string> implementer_ops = {
        "acquire_lock", "release_lock", "check_locks", "get_work", "complete_work",
        "submit_work", "write_handoff", "read_handoff", "register_session",
        "discover_agents", "heartbeat", "remember", "recall", "check_guardrails",
        "get_my_profile", "query_audit",
    };

    auto orchestrator_ops = implementer_ops;
    orchestrator_ops.push_back("cleanup_agents");

    return {
        profile("claude-code-cli", "claude_code", TRUST_ELEVATED, implementer_ops, 100,
                "Local CLI agent with full trust"),
        profile("claude-code-web-reviewer", "claude_code", TRUST_RESTRICTED,
                {"check_locks", "read_handoff", "discover_agents", "recall",
                 "check_guardrails", "get_my_profile", "query_audit"},
                0, "Web reviewer with read-only access"),
        profile("claude-code-web-implementer", "claude_code", TRUST_STANDARD, implementer_ops, 50,
                "Web implementer with standard trust"),
        profile("codex-cloud-worker", "codex", TRUST_STANDARD,
                {"acquire_lock", "release_lock", "check_locks", "get_work", "complete_work",
                 "submit_work", "register_session", "heartbeat", "remember", "recall",
                 "check_guardrails", "get_my_profile"},
                50, "Cloud worker with standard trust"),
        profile("strands-orchestrator", "strands", TRUST_ELEVATED, orchestrator_ops, 200,
                "Orchestrator with elevated trust"),
    };
}

std::vector<NetworkAccessPolicy> default_network_policies() {
    return {
        allow_domain("github.com", 1, "GitHub for all agents"),
        allow_domain("api.github.com", 1, "GitHub API for all agents"),
        allow_domain("raw.githubusercontent.com", 1, "Raw GitHub content for all agents"),
        allow_domain("registry.npmjs.org", 2, "npm registry for package installs"),
        allow_domain("pypi.org", 2, "PyPI for package installs"),
    };
}

std::vector<PolicyDocument> default_policy_documents() {
    std::vector<PolicyDocument> documents;

    PolicyDocument suspended;
    suspended.name = "suspended-agents";
    suspended.text = "forbid(principal, action, resource) when { principal.trust_level == 0 };\n";
    suspended.priority = 1;
    suspended.description = "Deny all operations for suspended agents";
    documents.push_back(std::move(suspended));

    PolicyDocument reads;
    reads.name = "read-operations";
    reads.text = permit_each(read_actions(), "");
    reads.priority = 10;
    reads.description = "Allow all agents to perform read operations";
    documents.push_back(std::move(reads));

    PolicyDocument writes;
    writes.name = "write-operations";
    writes.text = permit_each(write_actions(),
                              "principal.trust_level >= " + std::to_string(WRITE_MIN_TRUST));
    writes.priority = 20;
    writes.description = "Allow trusted agents to perform write operations";
    documents.push_back(std::move(writes));

    PolicyDocument admin;
    admin.name = "admin-operations";
    admin.text = permit_each(admin_actions(),
                             "principal.trust_level >= " + std::to_string(ADMIN_MIN_TRUST));
    admin.priority = 30;
    admin.description = "Allow high-trust agents to perform admin operations";
    documents.push_back(std::move(admin));

    PolicyDocument network;
    network.name = "network-access";
    for (const auto& domain : default_domains()) {
        network.text += "permit(principal, action == Action::\"" + std::string(NETWORK_ACCESS_ACTION) +
                        "\", resource == Domain::\"" + domain + "\");\n";
    }
    network.priority = 40;
    network.description = "Allow network access to known package registries";
    documents.push_back(std::move(network));

    return documents;
}

void seed_defaults(CoordinationStore& store) {
    for (const auto& p : baseline_guardrail_patterns()) {
        store.upsert_guardrail_pattern(p);
    }
    for (const auto& p : default_profiles()) {
        store.upsert_profile(p);
    }
    for (const auto& p : default_network_policies()) {
        store.upsert_network_policy(p);
    }
    for (const auto& d : default_policy_documents()) {
        store.upsert_policy_document(d);
    }
}

} // namespace agentcoord
