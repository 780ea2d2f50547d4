#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace agentcoord {

struct GuardrailResult {
    bool safe{true};

    // Matches the requester's trust level could not bypass
    std::vector<GuardrailViolation> violations;

    // Matches bypassed by trust; recorded, never blocking
    std::vector<GuardrailViolation> bypassed;

    // The embedded baseline was used instead of the store registry
    bool used_baseline{false};
};

// Deterministic destructive-operation detector. The verdict depends only on
// the active pattern set, the trust level and the text.
class GuardrailEngine {
public:
    explicit GuardrailEngine(std::shared_ptr<CoordinationStore> store,
                             GuardrailConfig config = {},
                             std::shared_ptr<Monitor> monitor = nullptr);
    ~GuardrailEngine() = default;

    // Non-copyable
    GuardrailEngine(const GuardrailEngine&) = delete;
    GuardrailEngine& operator=(const GuardrailEngine&) = delete;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Scan `operation_text` (plus each file path on its own line)
    GuardrailResult check(const std::string& operation_text,
                          TrustLevel trust_level,
                          const std::vector<std::string>& file_paths = {},
                          const AgentId& agent_id = "unknown");

    // Active pattern set, loading it if the cache is cold
    std::vector<GuardrailPattern> active_patterns();

    // Force a reload on the next check
    void invalidate_cache();

    static constexpr std::size_t MAX_OPERATION_TEXT = 500;
    static constexpr std::size_t MAX_MATCHED_TEXT = 200;

private:
    struct CompiledPattern {
        GuardrailPattern pattern;
        std::regex regex;
    };

    struct PatternSet {
        std::vector<CompiledPattern> patterns;
        bool from_baseline{false};
    };

    std::shared_ptr<CoordinationStore> store_;
    GuardrailConfig config_;

    mutable std::mutex mutex_;
    std::shared_ptr<const PatternSet> cache_;
    Timestamp cache_expires_{};
    std::shared_ptr<Monitor> monitor_;

    std::shared_ptr<const PatternSet> pattern_set();
    std::shared_ptr<const PatternSet> compile(const std::vector<GuardrailPattern>& patterns,
                                              bool from_baseline);
    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<std::string> resource = std::nullopt,
                    std::optional<std::size_t> count = std::nullopt);
};

} // namespace agentcoord
