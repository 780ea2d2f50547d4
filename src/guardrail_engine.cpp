#include "agentcoord/guardrail_engine.hpp"
#include "agentcoord/defaults.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

namespace agentcoord {

GuardrailEngine::GuardrailEngine(std::shared_ptr<CoordinationStore> store,
                                 GuardrailConfig config,
                                 std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
{
    if (!store_) {
        throw InvalidRequestException("GuardrailEngine requires a store");
    }
}

void GuardrailEngine::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

GuardrailResult GuardrailEngine::check(const std::string& operation_text,
                                       TrustLevel trust_level,
                                       const std::vector<std::string>& file_paths,
                                       const AgentId& agent_id) {
    std::string text = operation_text;
    for (const auto& path : file_paths) {
        text += "\n" + path;
    }

    auto set = pattern_set();
    GuardrailResult result;
    result.used_baseline = set->from_baseline;

    auto now = current_time();
    auto recorded_text = detail::truncate(text, MAX_OPERATION_TEXT);

    for (const auto& compiled : set->patterns) {
        std::smatch match;
        if (!std::regex_search(text, match, compiled.regex)) {
            continue;
        }

        GuardrailViolation v;
        v.agent_id = agent_id;
        v.pattern_name = compiled.pattern.name;
        v.category = compiled.pattern.category;
        v.severity = compiled.pattern.severity;
        v.operation_text = recorded_text;
        v.matched_text = detail::truncate(match.str(0), MAX_MATCHED_TEXT);
        v.trust_level = trust_level;
        v.created_at = now;

        if (trust_level < compiled.pattern.min_trust_to_bypass) {
            v.blocked = compiled.pattern.severity == Severity::Block;
            if (v.blocked) {
                result.safe = false;
            }
            result.violations.push_back(std::move(v));
        } else {
            v.bypassed = true;
            result.bypassed.push_back(std::move(v));
        }
    }

    if (config_.record_violations && (!result.violations.empty() || !result.bypassed.empty())) {
        std::vector<GuardrailViolation> records = result.violations;
        records.insert(records.end(), result.bypassed.begin(), result.bypassed.end());
        try {
            store_->record_violations(records);
        } catch (const StoreException& e) {
            // The verdict stands even if the forensic record cannot be written
            emit_event(EventType::AuditWriteFailed,
                       std::string("Violation records not written: ") + e.what(),
                       agent_id, std::nullopt, records.size());
        }
    }

    for (const auto& v : result.violations) {
        emit_event(EventType::GuardrailViolationDetected,
                   std::string(to_string(v.severity)) + " match on '" + v.matched_text + "'" +
                   (v.blocked ? " (blocked)" : ""),
                   agent_id, v.pattern_name, 1);
    }
    for (const auto& v : result.bypassed) {
        emit_event(EventType::GuardrailBypassed,
                   "Match on '" + v.matched_text + "' bypassed at trust level " +
                   std::to_string(trust_level),
                   agent_id, v.pattern_name);
    }

    return result;
}

std::vector<GuardrailPattern> GuardrailEngine::active_patterns() {
    auto set = pattern_set();
    std::vector<GuardrailPattern> patterns;
    patterns.reserve(set->patterns.size());
    for (const auto& compiled : set->patterns) {
        patterns.push_back(compiled.pattern);
    }
    return patterns;
}

void GuardrailEngine::invalidate_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.reset();
    cache_expires_ = Timestamp{};
}

std::shared_ptr<const GuardrailEngine::PatternSet> GuardrailEngine::pattern_set() {
    auto now = current_time();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cache_ && now < cache_expires_) {
            return cache_;
        }
    }

    std::vector<GuardrailPattern> loaded;
    bool fallback = false;
    std::string failure;

    try {
        loaded = store_->load_guardrail_patterns();
    } catch (const StoreException& e) {
        if (!config_.fallback_to_baseline) {
            throw;
        }
        fallback = true;
        failure = e.what();
    }

    // An empty registry would mean zero protection
    if (!fallback && loaded.empty() && config_.fallback_to_baseline) {
        fallback = true;
        failure = "pattern registry is empty";
    }
    if (fallback) {
        loaded = baseline_guardrail_patterns();
    }

    auto set = compile(loaded, fallback);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_ = set;
        cache_expires_ = now + (fallback ? config_.fallback_cache_ttl : config_.cache_ttl);
    }

    if (fallback) {
        emit_event(EventType::GuardrailFallbackActivated,
                   "Using embedded baseline patterns: " + failure,
                   std::nullopt, std::nullopt, set->patterns.size());
    }
    return set;
}

std::shared_ptr<const GuardrailEngine::PatternSet> GuardrailEngine::compile(
    const std::vector<GuardrailPattern>& patterns, bool from_baseline) {
    auto set = std::make_shared<PatternSet>();
    set->from_baseline = from_baseline;

    for (const auto& p : patterns) {
        if (!p.enabled) {
            continue;
        }
        try {
            set->patterns.push_back(
                {p, std::regex(p.regex, std::regex::ECMAScript | std::regex::icase)});
        } catch (const std::regex_error& e) {
            emit_event(EventType::GuardrailPatternInvalid,
                       "Skipping pattern with invalid regex '" + p.regex + "': " + e.what(),
                       std::nullopt, p.name);
        }
    }
    return set;
}

void GuardrailEngine::emit_event(EventType type, const std::string& message,
                                 std::optional<AgentId> agent_id,
                                 std::optional<std::string> resource,
                                 std::optional<std::size_t> count) {
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
    event.agent_id = std::move(agent_id);
    event.resource = std::move(resource);
    event.count = count;
    mon->on_event(event);
}

} // namespace agentcoord
