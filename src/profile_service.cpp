#include "agentcoord/profile_service.hpp"
#include "agentcoord/exceptions.hpp"

#include <algorithm>

namespace agentcoord {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // anonymous namespace

ProfileService::ProfileService(std::shared_ptr<CoordinationStore> store, ProfileConfig config)
    : store_(std::move(store))
    , config_(std::move(config))
{
    if (!store_) {
        throw InvalidRequestException("ProfileService requires a store");
    }
}

std::optional<AgentProfile> ProfileService::resolve(const AgentId& agent_id,
                                                    const std::string& agent_type) {
    auto key = std::make_pair(agent_id, agent_type);
    auto now = current_time();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end() && now < it->second.expires_at) {
            return it->second.profile;
        }
    }

    auto profile = store_->find_profile(agent_id, agent_type);

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = CacheEntry{profile, now + config_.cache_ttl};
    return profile;
}

TrustLevel ProfileService::trust_level(const AgentId& agent_id, const std::string& agent_type) {
    auto profile = resolve(agent_id, agent_type);
    return profile ? profile->trust_level : config_.default_trust_level;
}

OperationCheck ProfileService::check_operation(const AgentId& agent_id,
                                               const std::string& agent_type,
                                               const std::string& operation,
                                               std::optional<std::int64_t> files_modified) {
    OperationCheck check;
    auto profile = resolve(agent_id, agent_type);
    if (!profile) {
        check.reason = "no_profile_default_allow";
        return check;
    }
    check.profile_name = profile->name;

    if (contains(profile->blocked_ops, operation)) {
        check.allowed = false;
        check.reason = "operation_blocked: " + operation;
        return check;
    }

    if (config_.enforce_resource_limits && files_modified &&
        *files_modified >= profile->resource_limits.max_file_modifications) {
        check.allowed = false;
        check.reason = "resource_limit_exceeded: max_file_modifications=" +
                       std::to_string(profile->resource_limits.max_file_modifications);
        return check;
    }

    if (!profile->allowed_ops.empty() && !contains(profile->allowed_ops, operation)) {
        check.allowed = false;
        check.reason = "operation_not_in_allowlist: " + operation;
        return check;
    }

    check.reason = "operation_allowed";
    return check;
}

void ProfileService::invalidate_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

} // namespace agentcoord
