#include "guardrail/safety_engine.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>

#include "guardrail/common.hpp"

namespace guardrail {

namespace {

const std::vector<Rule>& command_injection_detectors() {
    static const std::vector<Rule> detectors = [] {
        const std::string name = "command_injection";
        const std::string prefix = "Command injection attempt: ";
        auto chain = [&](const char* label, const char* op, const char* what) {
            return make_matcher_rule(name, std::make_shared<const OperatorMatcher>(label, op), Severity::kHigh, 200,
                                     prefix + what);
        };
        auto span = [&](const char* label, std::vector<std::string> opener, const char* closer, int penalty,
                        const char* what) {
            return make_matcher_rule(name, std::make_shared<const SpanMatcher>(label, std::move(opener), closer),
                                     Severity::kHigh, penalty, prefix + what);
        };
        // Scanned without std::regex: reasoner output reaches these detectors before any truncation.
        return std::vector<Rule>{
            chain(R"(;\s*\w+)", ";", "Command chaining"),
            chain(R"(\|\s*\w+)", "|", "Pipe command"),
            chain(R"(&&\s*\w+)", "&&", "AND command"),
            chain(R"(\|\|\s*\w+)", "||", "OR command"),
            span(R"(`.*`)", {"`"}, "`", 300, "Command substitution"),
            span(R"(\$\s*\(.*\))", {"$", "("}, ")", 300, "Command execution"),
            span(R"(eval\s*\(.*\))", {"eval", "("}, ")", 400, "Eval function"),
            span(R"(exec\s*\(.*\))", {"exec", "("}, ")", 400, "Exec function"),
            span(R"(system\s*\(.*\))", {"system", "("}, ")", 500, "System call"),
        };
    }();
    return detectors;
}

const std::vector<Rule>& system_call_detectors() {
    static const std::vector<Rule> detectors = [] {
        struct Call {
            const char* needle;
            const char* description;
            int penalty;
        };
        const Call calls[] = {
            {"sudo", "Privilege escalation", 600},
            {"chmod 777", "Permission change", 400},
            {"chown root", "Ownership change", 400},
            {"dd if=", "Disk operations", 500},
            {"mkfs", "Filesystem creation", 500},
            {"fdisk", "Partition operations", 500},
            {"shutdown", "System shutdown", 300},
            {"reboot", "System reboot", 300},
            {"kill -9", "Process termination", 300},
            {"rm -rf /", "Root deletion", 1000},
        };
        std::vector<Rule> output;
        for (const auto& call : calls) {
            const auto severity = call.penalty >= 500 ? Severity::kCritical : Severity::kHigh;
            output.push_back(make_substring_rule("system_call", call.needle, severity, call.penalty,
                                                 std::string("Dangerous system call: ") + call.description));
        }
        return output;
    }();
    return detectors;
}

const std::vector<Rule>& misleading_output_detectors() {
    static const std::vector<Rule> detectors = {
        make_regex_rule("misleading_output", R"(\b(100% guaranteed|no risk|completely safe)\b)", Severity::kLow, 100,
                        "Overconfidence"),
        make_regex_rule("misleading_output", R"(\b(trust me|believe me|i promise)\b)", Severity::kLow, 50,
                        "Unverifiable claims"),
        make_regex_rule("misleading_output", R"(\b(secret|hidden|confidential|not public)\b)", Severity::kMedium,
                        150, "Secretive behavior"),
    };
    return detectors;
}

void collect(const std::vector<Rule>& rules, const std::string& text, double timestamp,
             std::vector<Violation>& found) {
    for (const auto& rule : rules) {
        if (rule.matches(text)) {
            found.push_back(Violation{rule.name, rule.severity, rule.penalty, rule.description, timestamp});
        }
    }
}

nlohmann::json to_json(const Rule& rule) {
    return {
        {"name", rule.name},
        {"pattern", rule.pattern},
        {"level", static_cast<int>(rule.severity)},
        {"level_name", severity_name(rule.severity)},
        {"penalty", rule.penalty},
        {"description", rule.description},
    };
}

void add_restrictions(std::set<std::string>& target, std::initializer_list<const char*> tags) {
    for (const char* tag : tags) {
        target.emplace(tag);
    }
}

std::string format_score(double score) {
    std::ostringstream stream;
    stream.precision(4);
    stream << score;
    return stream.str();
}

}  // namespace

std::string action_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::kAllow:
            return "allow";
        case ActionKind::kRestrict:
            return "restrict";
        case ActionKind::kBlock:
            return "block";
        case ActionKind::kShutdown:
            return "shutdown";
    }
    return "allow";
}

nlohmann::json to_json(const Violation& violation) {
    return {
        {"type", violation.rule_name},
        {"level", static_cast<int>(violation.severity)},
        {"level_name", severity_name(violation.severity)},
        {"description", violation.description},
        {"penalty", violation.penalty},
        {"timestamp", violation.timestamp},
    };
}

SafetyEngine::SafetyEngine(std::shared_ptr<const RuleSet> rules, SafetyConfig config, Logger logger)
    : rules_(rules ? std::move(rules) : std::make_shared<const RuleSet>(RuleSet::defaults())),
      config_(std::move(config)),
      logger_(std::move(logger)) {}

SafetyCheck SafetyEngine::check_input(const std::string& text) {
    return apply(detect(text, Mode::kInput), Mode::kInput);
}

SafetyCheck SafetyEngine::check_output(const std::string& text) {
    return apply(detect(text, Mode::kOutput), Mode::kOutput);
}

std::vector<Violation> SafetyEngine::detect(const std::string& text, Mode mode) const {
    const auto lowered = to_lower(text);
    const double now = seconds_since_epoch();

    std::vector<Violation> found;
    collect(rules_->rules(), lowered, now, found);
    collect(command_injection_detectors(), lowered, now, found);
    collect(system_call_detectors(), lowered, now, found);
    if (mode == Mode::kOutput) {
        collect(misleading_output_detectors(), lowered, now, found);
    }
    return found;
}

SafetyCheck SafetyEngine::apply(std::vector<Violation> found, Mode mode) {
    SafetyCheck check;
    for (const auto& violation : found) {
        check.total_penalty += violation.penalty;
    }

    {
        std::lock_guard<std::mutex> guard(mutex_);
        checks_performed_ += 1;
        if (!found.empty()) {
            for (const auto& violation : found) {
                log_.push_back(violation);
                total_violations_ += 1;
                if (violation.severity == Severity::kCritical) {
                    critical_violations_ += 1;
                } else if (violation.severity == Severity::kHigh) {
                    high_violations_ += 1;
                }
            }
            if (config_.violation_log_limit > 0) {
                while (log_.size() > config_.violation_log_limit) {
                    log_.pop_front();
                }
            }
            cumulative_penalty_ += check.total_penalty;
            // Decay uses this call's penalty only; cumulative penalty gates a different action.
            score_ = std::max(0.0, score_ * std::exp(-static_cast<double>(check.total_penalty) / config_.decay_scale));
        }
        check.action = resolve_action(found);
        check.checks_performed = checks_performed_;
        check.safety_score = score_;
    }

    check.safe = found.empty();
    check.violations = std::move(found);

    if (!check.violations.empty()) {
        std::vector<std::string> names;
        for (const auto& violation : check.violations) {
            names.push_back(violation.rule_name + "/" + severity_name(violation.severity));
        }
        logger_.warn("safety_violations", {{"mode", mode == Mode::kInput ? "input" : "output"},
                                           {"violations", join(names, ",")},
                                           {"penalty", std::to_string(check.total_penalty)},
                                           {"score", format_score(check.safety_score)},
                                           {"action", action_name(check.action.kind)}});
    }
    if (check.action.kind == ActionKind::kShutdown) {
        logger_.error("safety_shutdown", {{"mode", mode == Mode::kInput ? "input" : "output"},
                                          {"message", check.action.message}});
    }
    return check;
}

Action SafetyEngine::resolve_action(const std::vector<Violation>& found) const {
    const auto critical = std::count_if(found.begin(), found.end(), [](const Violation& violation) {
        return violation.severity == Severity::kCritical;
    });
    if (critical >= config_.critical_violations) {
        return Action{ActionKind::kShutdown, "Critical safety violation detected",
                      {"system_shutdown", "memory_lock", "network_disconnect"}};
    }
    if (cumulative_penalty_ >= config_.penalty_threshold) {
        return Action{ActionKind::kBlock, "Cumulative penalty threshold exceeded",
                      {"input_blocked", "output_restricted", "learning_paused"}};
    }
    if (score_ <= config_.score_threshold) {
        return Action{ActionKind::kRestrict, "Safety score too low", {"limited_functionality", "supervision_required"}};
    }
    if (found.empty()) {
        return Action{ActionKind::kAllow, "No violations detected", {}};
    }

    Action action{ActionKind::kRestrict, std::to_string(found.size()) + " violations detected", {}};
    for (const auto& violation : found) {
        switch (violation.severity) {
            case Severity::kCritical:
            case Severity::kHigh:
                add_restrictions(action.restrictions, {"input_sanitized", "output_filtered", "log_intensive"});
                break;
            case Severity::kMedium:
                add_restrictions(action.restrictions, {"input_verified", "output_monitored"});
                break;
            case Severity::kLow:
                add_restrictions(action.restrictions, {"monitor_only"});
                break;
        }
    }
    return action;
}

ResetReport SafetyEngine::reset_safety() {
    ResetReport report;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        report.old_score = score_;
        report.old_penalty = cumulative_penalty_;
        report.cleared_violations = log_.size();

        score_ = kInitialScore;
        cumulative_penalty_ = 0;
        log_.clear();
        total_violations_ = 0;
        critical_violations_ = 0;
        high_violations_ = 0;
    }
    report.new_score = kInitialScore;
    report.reset_time = seconds_since_epoch();
    logger_.warn("safety_reset", {{"old_score", format_score(report.old_score)},
                                  {"old_penalty", std::to_string(report.old_penalty)},
                                  {"cleared_violations", std::to_string(report.cleared_violations)}});
    return report;
}

SafetyStatus SafetyEngine::status() const {
    std::lock_guard<std::mutex> guard(mutex_);
    SafetyStatus status;
    status.safety_score = score_;
    status.cumulative_penalty = cumulative_penalty_;
    status.total_violations = total_violations_;
    status.critical_violations = critical_violations_;
    status.high_violations = high_violations_;
    status.checks_performed = checks_performed_;
    status.thresholds = config_;
    status.operational = score_ > config_.score_threshold;
    return status;
}

double SafetyEngine::safety_score() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return score_;
}

long long SafetyEngine::cumulative_penalty() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return cumulative_penalty_;
}

std::vector<Violation> SafetyEngine::violations() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return {log_.begin(), log_.end()};
}

nlohmann::json SafetyEngine::export_log() const {
    const auto current = status();
    nlohmann::json violations_json = nlohmann::json::array();
    for (const auto& violation : violations()) {
        violations_json.push_back(to_json(violation));
    }
    nlohmann::json rules_json = nlohmann::json::array();
    for (const auto& rule : rules_->rules()) {
        rules_json.push_back(to_json(rule));
    }

    return {
        {"violations", violations_json},
        {"status",
         {
             {"safety_score", current.safety_score},
             {"total_penalty", current.cumulative_penalty},
             {"total_violations", current.total_violations},
             {"critical_violations", current.critical_violations},
             {"high_violations", current.high_violations},
             {"checks_performed", current.checks_performed},
             {"thresholds",
              {
                  {"critical_violations", current.thresholds.critical_violations},
                  {"total_penalty", current.thresholds.penalty_threshold},
                  {"safety_score", current.thresholds.score_threshold},
              }},
             {"system_status", current.operational ? "operational" : "restricted"},
         }},
        {"rules", rules_json},
        {"export_time", seconds_since_epoch()},
    };
}

bool SafetyEngine::export_log(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        logger_.error("safety_export_failed", {{"path", path}, {"error", "unable to open file"}});
        return false;
    }
    file << export_log().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!file) {
        logger_.error("safety_export_failed", {{"path", path}, {"error", "write failed"}});
        return false;
    }
    logger_.info("safety_exported", {{"path", path}});
    return true;
}

}  // namespace guardrail
