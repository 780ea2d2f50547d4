#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/store.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace agentcoord {

struct OperationCheck {
    bool allowed{true};
    std::string reason;
    std::optional<std::string> profile_name;
};

// Resolves agents to profiles: explicit assignment, then the earliest
// enabled profile for the agent type, then none (default trust).
class ProfileService {
public:
    explicit ProfileService(std::shared_ptr<CoordinationStore> store,
                            ProfileConfig config = {});
    ~ProfileService() = default;

    // Non-copyable
    ProfileService(const ProfileService&) = delete;
    ProfileService& operator=(const ProfileService&) = delete;

    std::optional<AgentProfile> resolve(const AgentId& agent_id, const std::string& agent_type);

    TrustLevel trust_level(const AgentId& agent_id, const std::string& agent_type);

    // Blocked list, resource limits, then allowlist
    OperationCheck check_operation(const AgentId& agent_id,
                                   const std::string& agent_type,
                                   const std::string& operation,
                                   std::optional<std::int64_t> files_modified = std::nullopt);

    void invalidate_cache();

    const ProfileConfig& config() const noexcept { return config_; }

private:
    struct CacheEntry {
        std::optional<AgentProfile> profile;
        Timestamp expires_at{};
    };

    std::shared_ptr<CoordinationStore> store_;
    ProfileConfig config_;
    std::mutex mutex_;
    std::map<std::pair<AgentId, std::string>, CacheEntry> cache_;
};

} // namespace agentcoord
