#include "agentcoord/policy_engine.hpp"
#include "agentcoord/defaults.hpp"
#include "agentcoord/exceptions.hpp"

#include <algorithm>

namespace agentcoord {

namespace {

PolicyDecision decide(bool allowed, std::string reason, const char* engine) {
    PolicyDecision decision;
    decision.allowed = allowed;
    decision.reason = std::move(reason);
    decision.engine = engine;
    return decision;
}

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

} // anonymous namespace

TrustLevel resolve_trust(const PolicyRequest& request, ProfileService& profiles) {
    if (request.context.trust_level) {
        return *request.context.trust_level;
    }
    return profiles.trust_level(request.principal.agent_id, request.principal.agent_type);
}

// ========== NativePolicyEngine ==========

NativePolicyEngine::NativePolicyEngine(std::shared_ptr<ProfileService> profiles,
                                       std::shared_ptr<NetworkPolicyEvaluator> network)
    : profiles_(std::move(profiles))
    , network_(std::move(network))
{
    if (!profiles_ || !network_) {
        throw InvalidRequestException("NativePolicyEngine requires profile and network services");
    }
}

PolicyDecision NativePolicyEngine::evaluate(const PolicyRequest& request) {
    const auto& principal = request.principal;
    const auto& action = request.action;
    TrustLevel trust = resolve_trust(request, *profiles_);

    if (trust <= TRUST_SUSPENDED) {
        return decide(false, "agent_suspended: trust_level=" + std::to_string(trust), "native");
    }

    auto check = profiles_->check_operation(principal.agent_id, principal.agent_type, action,
                                            request.context.files_modified);
    if (!check.allowed && (starts_with(check.reason, "operation_blocked") ||
                           starts_with(check.reason, "resource_limit_exceeded"))) {
        return decide(false, check.reason, "native");
    }

    switch (classify_action(action)) {
        case ActionClass::Read:
            return decide(true, "read_permitted", "native");

        case ActionClass::Write:
            if (trust >= WRITE_MIN_TRUST) {
                return decide(true, "write_permitted: trust_level=" + std::to_string(trust), "native");
            }
            return decide(false, "write_denied: trust_level=" + std::to_string(trust) +
                                 " < " + std::to_string(WRITE_MIN_TRUST), "native");

        case ActionClass::Admin:
            if (trust >= ADMIN_MIN_TRUST) {
                return decide(true, "admin_permitted: trust_level=" + std::to_string(trust), "native");
            }
            return decide(false, "admin_denied: trust_level=" + std::to_string(trust) +
                                 " < " + std::to_string(ADMIN_MIN_TRUST), "native");

        case ActionClass::Network: {
            auto network = network_->check(request.resource, check.profile_name);
            auto decision = decide(network.allowed, network.reason, "native");
            decision.matched_policy = network.matched_pattern;
            return decision;
        }

        case ActionClass::Unknown:
            break;
    }

    // Default deny unless the profile names the action explicitly
    auto profile = profiles_->resolve(principal.agent_id, principal.agent_type);
    if (profile && std::find(profile->allowed_ops.begin(), profile->allowed_ops.end(), action) !=
                       profile->allowed_ops.end()) {
        auto decision = decide(true, "profile_allowlist: " + action, "native");
        decision.matched_policy = profile->name;
        return decision;
    }
    return decide(false, "unknown_action: " + action, "native");
}

// ========== DeclarativePolicyEngine ==========

DeclarativePolicyEngine::DeclarativePolicyEngine(std::shared_ptr<CoordinationStore> store,
                                                 std::shared_ptr<ProfileService> profiles,
                                                 PolicyConfig config,
                                                 std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , profiles_(std::move(profiles))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
{
    if (!store_ || !profiles_) {
        throw InvalidRequestException("DeclarativePolicyEngine requires a store and profile service");
    }
}

void DeclarativePolicyEngine::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

PolicyDecision DeclarativePolicyEngine::evaluate(const PolicyRequest& request) {
    auto active = rules();
    TrustLevel trust = resolve_trust(request, *profiles_);

    const PolicyRule* permit = nullptr;
    for (const auto& rule : *active) {
        if (!rule.matches(request.principal.agent_id, request.action, request.resource, trust)) {
            continue;
        }
        if (rule.effect == PolicyEffect::Forbid) {
            auto decision = decide(false, "policy_forbid", "declarative");
            decision.matched_policy = rule.policy_name;
            return decision;
        }
        if (permit == nullptr) {
            permit = &rule;
        }
    }

    if (permit != nullptr) {
        auto decision = decide(true, "policy_permit", "declarative");
        decision.matched_policy = permit->policy_name;
        return decision;
    }
    return decide(false, "no_matching_permit", "declarative");
}

void DeclarativePolicyEngine::invalidate_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.reset();
    rules_expire_ = Timestamp{};
}

std::size_t DeclarativePolicyEngine::rule_count() {
    return rules()->size();
}

std::shared_ptr<const std::vector<PolicyRule>> DeclarativePolicyEngine::rules() {
    auto now = current_time();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rules_ && now < rules_expire_) {
            return rules_;
        }
    }

    std::vector<PolicyDocument> documents;
    std::string fallback_reason;
    try {
        documents = store_->load_policy_documents();
        if (documents.empty()) {
            fallback_reason = "no policy documents in store";
        }
    } catch (const StoreException& e) {
        if (!config_.fallback_to_defaults) {
            throw;
        }
        fallback_reason = e.what();
    }

    if (!fallback_reason.empty() && config_.fallback_to_defaults) {
        documents = default_policy_documents();
        emit_event(EventType::PolicyFallbackActivated,
                   "Using embedded default policies: " + fallback_reason);
    }

    std::stable_sort(documents.begin(), documents.end(),
                     [](const PolicyDocument& a, const PolicyDocument& b) {
                         return a.priority < b.priority;
                     });

    auto parsed = std::make_shared<std::vector<PolicyRule>>();
    for (const auto& document : documents) {
        if (!document.enabled) {
            continue;
        }
        try {
            auto rules = parse_policy(document.name, document.text);
            parsed->insert(parsed->end(), rules.begin(), rules.end());
        } catch (const PolicyParseException& e) {
            emit_event(EventType::PolicyDocumentInvalid, e.what(), document.name);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rules_ = parsed;
    rules_expire_ = now + config_.cache_ttl;
    return rules_;
}

void DeclarativePolicyEngine::emit_event(EventType type, const std::string& message,
                                         std::optional<std::string> resource) {
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mon = monitor_;
    }

    if (!mon) {
        return;
    }

    MonitorEvent event;
    event.type = type;
    event.timestamp = current_time();
    event.message = message;
    event.resource = std::move(resource);
    mon->on_event(event);
}

// ========== Factory ==========

std::shared_ptr<PolicyEngine> make_policy_engine(const PolicyConfig& config,
                                                 std::shared_ptr<CoordinationStore> store,
                                                 std::shared_ptr<ProfileService> profiles,
                                                 std::shared_ptr<NetworkPolicyEvaluator> network,
                                                 std::shared_ptr<Monitor> monitor) {
    switch (config.engine) {
        case PolicyEngineKind::Native:
            return std::make_shared<NativePolicyEngine>(std::move(profiles), std::move(network));
        case PolicyEngineKind::Declarative:
            return std::make_shared<DeclarativePolicyEngine>(std::move(store), std::move(profiles),
                                                             config, std::move(monitor));
    }
    throw InvalidRequestException("Unknown policy engine");
}

} // namespace agentcoord
