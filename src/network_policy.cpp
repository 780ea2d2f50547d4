#include "agentcoord/network_policy.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

#include <algorithm>

namespace agentcoord {

NetworkPolicyEvaluator::NetworkPolicyEvaluator(std::shared_ptr<CoordinationStore> store,
                                               NetworkConfig config,
                                               std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
{
    if (!store_) {
        throw InvalidRequestException("NetworkPolicyEvaluator requires a store");
    }
}

void NetworkPolicyEvaluator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

NetworkDecision NetworkPolicyEvaluator::check(const std::string& domain,
                                              const std::optional<std::string>& profile_name) {
    auto all = policies();
    auto target = detail::to_lower(domain);

    // Lowest priority value first; load order breaks ties
    auto best_match = [&](bool profile_group) -> const NetworkAccessPolicy* {
        const NetworkAccessPolicy* best = nullptr;
        for (const auto& policy : *all) {
            if (profile_group) {
                if (!profile_name || policy.profile_name != profile_name) continue;
            } else if (policy.profile_name) {
                continue;
            }
            if (!domain_matches(policy.domain_pattern, target)) continue;
            if (best == nullptr || policy.priority < best->priority) {
                best = &policy;
            }
        }
        return best;
    };

    const NetworkAccessPolicy* match = best_match(true);
    if (match == nullptr) {
        match = best_match(false);
    }

    NetworkDecision decision;
    if (match != nullptr) {
        decision.allowed = match->action == NetworkAction::Allow;
        decision.reason = std::string("policy_") + to_string(match->action) + ": " +
                          match->domain_pattern;
        decision.matched_pattern = match->domain_pattern;
    } else {
        decision.allowed = config_.default_action == NetworkAction::Allow;
        decision.reason = "no_matching_policy";
    }

    emit_event(domain, decision);
    return decision;
}

void NetworkPolicyEvaluator::invalidate_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.reset();
    cache_expires_ = Timestamp{};
}

bool NetworkPolicyEvaluator::domain_matches(const std::string& pattern, const std::string& domain) {
    auto p = detail::to_lower(pattern);
    auto d = detail::to_lower(domain);

    // Greedy wildcard match with backtracking to the last '*'
    std::size_t pi = 0, di = 0;
    std::size_t star = std::string::npos, mark = 0;
    while (di < d.size()) {
        if (pi < p.size() && p[pi] == '*') {
            star = pi++;
            mark = di;
        } else if (pi < p.size() && p[pi] == d[di]) {
            ++pi;
            ++di;
        } else if (star != std::string::npos) {
            pi = star + 1;
            di = ++mark;
        } else {
            return false;
        }
    }
    while (pi < p.size() && p[pi] == '*') {
        ++pi;
    }
    return pi == p.size();
}

std::shared_ptr<const std::vector<NetworkAccessPolicy>> NetworkPolicyEvaluator::policies() {
    auto now = current_time();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cache_ && now < cache_expires_) {
            return cache_;
        }
    }

    auto loaded = std::make_shared<std::vector<NetworkAccessPolicy>>(store_->load_network_policies());
    loaded->erase(std::remove_if(loaded->begin(), loaded->end(),
                                 [](const NetworkAccessPolicy& p) { return !p.enabled; }),
                  loaded->end());

    std::lock_guard<std::mutex> lock(mutex_);
    cache_ = loaded;
    cache_expires_ = now + config_.cache_ttl;
    return cache_;
}

void NetworkPolicyEvaluator::emit_event(const std::string& domain, const NetworkDecision& decision) {
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mon = monitor_;
    }

    if (!mon) {
        return;
    }

    MonitorEvent event;
    event.type = EventType::NetworkAccessChecked;
    event.timestamp = current_time();
    event.message = decision.allowed ? "Network access allowed" : "Network access denied";
    event.resource = domain;
    event.reason = decision.reason;
    event.success = decision.allowed;
    mon->on_event(event);
}

} // namespace agentcoord
