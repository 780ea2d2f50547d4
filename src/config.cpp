#include "agentcoord/config.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

#include <cstdlib>
#include <optional>
#include <string>

#include <unistd.h>

namespace agentcoord {

namespace {

std::optional<std::string> env_string(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<long long> env_integer(const char* name) {
    auto value = env_string(name);
    if (!value) {
        return std::nullopt;
    }
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(*value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationException(name, *value);
    }
    if (consumed != value->size() || parsed < 0) {
        throw ConfigurationException(name, *value);
    }
    return parsed;
}

std::optional<bool> env_bool(const char* name) {
    auto value = env_string(name);
    if (!value) {
        return std::nullopt;
    }
    auto lowered = detail::to_lower(*value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw ConfigurationException(name, *value);
}

} // anonymous namespace

Config Config::from_env() {
    Config config;

    // ========== Store ==========
    if (auto backend = env_string("AGENTCOORD_STORE")) {
        auto lowered = detail::to_lower(*backend);
        if (lowered == "memory") {
            config.store.backend = StoreBackend::Memory;
        } else if (lowered == "sqlite") {
            config.store.backend = StoreBackend::Sqlite;
        } else {
            throw ConfigurationException("AGENTCOORD_STORE", *backend);
        }
    }
    if (auto path = env_string("AGENTCOORD_DB_PATH")) {
        config.store.database_path = *path;
    }

    // ========== Locks ==========
    if (auto ttl = env_integer("LOCK_TTL_MINUTES")) {
        if (*ttl == 0) {
            throw ConfigurationException("LOCK_TTL_MINUTES", "0");
        }
        config.locks.default_ttl = std::chrono::minutes(*ttl);
        if (config.locks.default_ttl > config.locks.max_ttl) {
            config.locks.max_ttl = config.locks.default_ttl;
        }
    }

    // ========== Guardrails ==========
    if (auto ttl = env_integer("GUARDRAILS_CACHE_TTL")) {
        config.guardrails.cache_ttl = std::chrono::seconds(*ttl);
    }
    if (auto fallback = env_bool("GUARDRAILS_CODE_FALLBACK")) {
        config.guardrails.fallback_to_baseline = *fallback;
    }

    // ========== Profiles ==========
    if (auto trust = env_integer("PROFILES_DEFAULT_TRUST")) {
        if (*trust > TRUST_ADMIN) {
            throw ConfigurationException("PROFILES_DEFAULT_TRUST", std::to_string(*trust));
        }
        config.profiles.default_trust_level = static_cast<TrustLevel>(*trust);
    }
    if (auto enforce = env_bool("PROFILES_ENFORCE_LIMITS")) {
        config.profiles.enforce_resource_limits = *enforce;
    }
    if (auto ttl = env_integer("PROFILES_CACHE_TTL")) {
        config.profiles.cache_ttl = std::chrono::seconds(*ttl);
    }

    // ========== Audit ==========
    if (auto days = env_integer("AUDIT_RETENTION_DAYS")) {
        if (*days == 0) {
            throw ConfigurationException("AUDIT_RETENTION_DAYS", "0");
        }
        config.audit.retention_days = static_cast<std::int32_t>(*days);
    }
    if (auto async = env_bool("AUDIT_ASYNC")) {
        config.audit.async = *async;
    }

    // ========== Network ==========
    if (auto action = env_string("NETWORK_DEFAULT_POLICY")) {
        auto parsed = parse_network_action(detail::to_lower(*action));
        if (!parsed) {
            throw ConfigurationException("NETWORK_DEFAULT_POLICY", *action);
        }
        config.network.default_action = *parsed;
    }

    // ========== Policy ==========
    if (auto engine = env_string("POLICY_ENGINE")) {
        auto lowered = detail::to_lower(*engine);
        if (lowered == "native") {
            config.policy.engine = PolicyEngineKind::Native;
        } else if (lowered == "declarative" || lowered == "cedar") {
            config.policy.engine = PolicyEngineKind::Declarative;
        } else {
            throw ConfigurationException("POLICY_ENGINE", *engine);
        }
    }
    if (auto ttl = env_integer("POLICY_CACHE_TTL")) {
        config.policy.cache_ttl = std::chrono::seconds(*ttl);
    }

    // ========== Liveness ==========
    if (auto minutes = env_integer("STALE_THRESHOLD_MINUTES")) {
        config.liveness.stale_threshold = std::chrono::minutes(*minutes);
    }

    return config;
}

AgentIdentity AgentIdentity::from_env() {
    AgentIdentity identity;
    identity.agent_id = env_string("AGENT_ID").value_or(
        "agent-" + std::to_string(static_cast<long long>(::getpid())));
    identity.agent_type = env_string("AGENT_TYPE").value_or("unknown");
    identity.session_id = env_string("SESSION_ID").value_or(
        identity.agent_id + "-" + detail::generate_uuid());
    return identity;
}

} // namespace agentcoord
