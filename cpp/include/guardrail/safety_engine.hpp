#ifndef GUARDRAIL_SAFETY_ENGINE_HPP
#define GUARDRAIL_SAFETY_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "guardrail/config.hpp"
#include "guardrail/logging.hpp"
#include "guardrail/rules.hpp"

namespace guardrail {

struct Violation {
    std::string rule_name;
    Severity severity = Severity::kLow;
    int penalty = 0;
    std::string description;
    double timestamp = 0.0;
};

enum class ActionKind {
    kAllow,
    kRestrict,
    kBlock,
    kShutdown,
};

std::string action_name(ActionKind kind);

struct Action {
    ActionKind kind = ActionKind::kAllow;
    std::string message;
    std::set<std::string> restrictions;
};

struct SafetyCheck {
    bool safe = true;
    std::vector<Violation> violations;
    long long total_penalty = 0;
    Action action;
    std::uint64_t checks_performed = 0;
    double safety_score = 100.0;
};

struct SafetyStatus {
    double safety_score = 100.0;
    long long cumulative_penalty = 0;
    std::uint64_t total_violations = 0;
    std::uint64_t critical_violations = 0;
    std::uint64_t high_violations = 0;
    std::uint64_t checks_performed = 0;
    SafetyConfig thresholds{};
    bool operational = true;
};

struct ResetReport {
    double old_score = 0.0;
    long long old_penalty = 0;
    std::size_t cleared_violations = 0;
    double new_score = 100.0;
    double reset_time = 0.0;
};

/// Penalty-scoring core shared by every request of one pipeline.
///
/// Each check matches the text against the rule table and the fixed
/// command-injection and system-call detectors, then, under one lock,
/// records the violations, decays the score by the call's penalty and
/// resolves the action from the call's severities and the cumulative state.
/// Checks never throw.
class SafetyEngine {
public:
    static constexpr double kInitialScore = 100.0;

    explicit SafetyEngine(std::shared_ptr<const RuleSet> rules = nullptr, SafetyConfig config = {},
                          Logger logger = get_logger("SafetyEngine"));

    SafetyCheck check_input(const std::string& text);
    // Same as check_input plus misleading-claim detection.
    SafetyCheck check_output(const std::string& text);

    // Privileged: callers must authorize before resetting.
    ResetReport reset_safety();

    SafetyStatus status() const;
    double safety_score() const;
    long long cumulative_penalty() const;
    std::vector<Violation> violations() const;
    const RuleSet& rules() const { return *rules_; }

    nlohmann::json export_log() const;
    // Writes export_log() to path; false (and an error log line) on I/O failure.
    bool export_log(const std::string& path) const;

private:
    enum class Mode { kInput, kOutput };

    std::vector<Violation> detect(const std::string& text, Mode mode) const;
    SafetyCheck apply(std::vector<Violation> found, Mode mode);
    Action resolve_action(const std::vector<Violation>& found) const;

    std::shared_ptr<const RuleSet> rules_;
    SafetyConfig config_;
    Logger logger_;

    mutable std::mutex mutex_;
    double score_ = kInitialScore;
    long long cumulative_penalty_ = 0;
    std::deque<Violation> log_;
    std::uint64_t total_violations_ = 0;
    std::uint64_t critical_violations_ = 0;
    std::uint64_t high_violations_ = 0;
    std::uint64_t checks_performed_ = 0;
};

nlohmann::json to_json(const Violation& violation);

}  // namespace guardrail

#endif  // GUARDRAIL_SAFETY_ENGINE_HPP
