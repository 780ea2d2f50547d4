#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

struct NetworkDecision {
    bool allowed{false};
    std::string reason;
    std::optional<std::string> matched_pattern;
};

// Outbound domain access. Profile-specific policies are consulted before
// global ones; within a group the lowest priority value wins.
class NetworkPolicyEvaluator {
public:
    explicit NetworkPolicyEvaluator(std::shared_ptr<CoordinationStore> store,
                                    NetworkConfig config = {},
                                    std::shared_ptr<Monitor> monitor = nullptr);
    ~NetworkPolicyEvaluator() = default;

    // Non-copyable
    NetworkPolicyEvaluator(const NetworkPolicyEvaluator&) = delete;
    NetworkPolicyEvaluator& operator=(const NetworkPolicyEvaluator&) = delete;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    NetworkDecision check(const std::string& domain,
                          const std::optional<std::string>& profile_name = std::nullopt);

    void invalidate_cache();

    // Case-insensitive; '*' matches any run of characters
    static bool domain_matches(const std::string& pattern, const std::string& domain);

private:
    std::shared_ptr<CoordinationStore> store_;
    NetworkConfig config_;

    mutable std::mutex mutex_;
    std::shared_ptr<const std::vector<NetworkAccessPolicy>> cache_;
    Timestamp cache_expires_{};
    std::shared_ptr<Monitor> monitor_;

    std::shared_ptr<const std::vector<NetworkAccessPolicy>> policies();
    void emit_event(const std::string& domain, const NetworkDecision& decision);
};

} // namespace agentcoord
