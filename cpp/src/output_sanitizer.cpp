#include "guardrail/output_sanitizer.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>

#include "guardrail/common.hpp"

namespace guardrail {

namespace {

std::vector<std::pair<std::string, std::string>> command_token_patterns() {
    // Word-bounded so "information" keeps its "format".
    return {
        {"sudo", R"(\bsudo\b)"},
        {"rm -rf", R"(\brm -rf\b)"},
        {"format", R"(\bformat\b)"},
        {"del ", R"(\bdel )"},
        {"shutdown", R"(\bshutdown\b)"},
    };
}

int count_present(const std::string& lowered, std::initializer_list<const char*> words) {
    int count = 0;
    for (const char* word : words) {
        if (lowered.find(word) != std::string::npos) {
            count += 1;
        }
    }
    return count;
}

}  // namespace

std::string tone_name(Tone tone) {
    switch (tone) {
        case Tone::kPositive:
            return "positive";
        case Tone::kNegative:
            return "negative";
        case Tone::kNeutral:
            return "neutral";
    }
    return "neutral";
}

OutputSanitizer::OutputSanitizer(std::shared_ptr<const RuleSet> rules, OutputConfig config, Logger logger)
    : rules_(rules ? std::move(rules) : std::make_shared<const RuleSet>(RuleSet::defaults())),
      config_(config),
      dangerous_phrases_(default_dangerous_phrases()),
      logger_(std::move(logger)) {
    for (const auto& [token, pattern] : command_token_patterns()) {
        command_tokens_.push_back(CommandToken{token, std::regex(pattern, std::regex::ECMAScript | std::regex::icase)});
    }
}

std::vector<std::string> OutputSanitizer::default_dangerous_phrases() {
    return {
        "kill yourself", "harm yourself", "hurt someone", "build a bomb", "make poison",
        "hack into",     "steal from",    "cheat on",     "bypass security",
    };
}

std::string OutputSanitizer::redact(const std::string& text) const {
    std::string redacted = text;
    for (const auto& rule : rules_->redactions()) {
        redacted = rule.apply(redacted);
    }
    return redacted;
}

SanitizationResult OutputSanitizer::validate(const std::string& output) {
    SanitizationResult result;
    result.timestamp = seconds_since_epoch();
    result.original_length = utf8_length(output);

    {
        std::lock_guard<std::mutex> guard(mutex_);
        stats_.total += 1;
    }

    std::string sanitized = redact(output);

    std::vector<std::string> phrases;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        phrases = dangerous_phrases_;
    }

    const auto lowered = to_lower(sanitized);
    for (const auto& phrase : phrases) {
        if (lowered.find(phrase) != std::string::npos) {
            result.dangerous_phrases.push_back(phrase);
        }
    }
    if (!result.dangerous_phrases.empty()) {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            stats_.blocked += 1;
        }
        result.safe = false;
        result.reason = "Dangerous phrases: " + join(result.dangerous_phrases, ", ");
        logger_.warn("output_blocked", {{"phrases", join(result.dangerous_phrases, ",")},
                                        {"preview", utf8_truncate(output, 100)}});
        return result;
    }

    for (const auto& command : command_tokens_) {
        const auto hits = std::distance(std::sregex_iterator(sanitized.begin(), sanitized.end(), command.regex),
                                        std::sregex_iterator());
        if (hits > 0) {
            sanitized = std::regex_replace(sanitized, command.regex, kCommandPlaceholder);
            result.modification_count += static_cast<int>(hits);
        }
    }

    if (utf8_length(sanitized) > config_.max_length) {
        sanitized = utf8_truncate(sanitized, config_.max_length) + kTruncationMarker;
        result.modification_count += 1;
    }

    result.safe = true;
    result.modifications = sanitized != output ? "redacted" : "none";
    result.final_length = utf8_length(sanitized);
    result.output = std::move(sanitized);

    {
        std::lock_guard<std::mutex> guard(mutex_);
        stats_.safe += 1;
        if (result.modifications == "redacted") {
            stats_.modified += 1;
        }
    }
    if (result.modification_count > 0) {
        logger_.info("output_modified", {{"modifications", std::to_string(result.modification_count)}});
    }
    return result;
}

std::vector<SanitizationResult> OutputSanitizer::batch_validate(const std::vector<std::string>& outputs) {
    std::vector<SanitizationResult> results;
    results.reserve(outputs.size());
    for (const auto& output : outputs) {
        results.push_back(validate(output));
    }
    return results;
}

ToneReport OutputSanitizer::check_tone(const std::string& text) const {
    const auto lowered = to_lower(text);
    ToneReport report;
    report.positive_score = count_present(lowered, {"good", "great", "excellent", "helpful", "positive"});
    report.negative_score = count_present(lowered, {"bad", "terrible", "awful", "harmful", "negative"});
    if (report.positive_score > report.negative_score) {
        report.tone = Tone::kPositive;
    } else if (report.negative_score > report.positive_score) {
        report.tone = Tone::kNegative;
    }
    return report;
}

bool OutputSanitizer::add_dangerous_phrase(const std::string& phrase) {
    const auto lowered = to_lower(phrase);
    if (lowered.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    if (std::find(dangerous_phrases_.begin(), dangerous_phrases_.end(), lowered) != dangerous_phrases_.end()) {
        return false;
    }
    dangerous_phrases_.push_back(lowered);
    return true;
}

OutputStats OutputSanitizer::get_stats() const {
    std::lock_guard<std::mutex> guard(mutex_);
    OutputStats stats = stats_;
    stats.safety_rate = static_cast<double>(stats.safe) / static_cast<double>(std::max<std::uint64_t>(stats.total, 1));
    stats.rules_active = rules_->redactions().size() + dangerous_phrases_.size() + command_tokens_.size();
    return stats;
}

}  // namespace guardrail
