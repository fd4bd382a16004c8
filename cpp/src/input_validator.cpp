#include "guardrail/input_validator.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "guardrail/common.hpp"

namespace guardrail {

namespace {

double alnum_ratio(const std::string& text, std::size_t length) {
    if (length == 0) {
        return 0.0;
    }
    std::size_t alnum = 0;
    for (unsigned char ch : text) {
        if ((ch & 0xC0) == 0x80) {
            continue;
        }
        // Multi-byte code points are letters far more often than not.
        if (ch >= 0x80 || std::isalnum(ch) != 0) {
            alnum += 1;
        }
    }
    return static_cast<double>(alnum) / static_cast<double>(length);
}

}  // namespace

std::string input_error_name(InputError error) {
    switch (error) {
        case InputError::kEmptyInput:
            return "EmptyInput";
        case InputError::kOversizedInput:
            return "OversizedInput";
        case InputError::kSuspiciousPattern:
            return "SuspiciousPattern";
        case InputError::kMalformedStructure:
            return "MalformedStructure";
        case InputError::kGibberishInput:
            return "GibberishInput";
    }
    return "InputRejected";
}

InputValidator::InputValidator(InputConfig config, Logger logger)
    : config_(config), suspicious_patterns_(default_suspicious_patterns()), logger_(std::move(logger)) {}

std::vector<std::string> InputValidator::default_suspicious_patterns() {
    return {
        "<!--",  "-->",         // markup comments
        "<script", "</script>", "javascript:",
        "onerror=", "onclick=", "onload=",
        "../",   "..\\", "~/",  // path traversal
        "||",    "&&",          // command chaining
        "`",     "$(",          // command substitution
    };
}

ValidationResult InputValidator::validate(const std::string& raw) {
    ValidationResult result;
    result.timestamp = seconds_since_epoch();
    result.normalized = trim(raw);
    result.length = utf8_length(result.normalized);

    std::vector<std::string> patterns;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        stats_.total += 1;
        result.check_id = stats_.total;
        patterns = suspicious_patterns_;
    }

    if (result.length == 0) {
        return reject(std::move(result), InputError::kEmptyInput, "Input empty");
    }
    if (result.length > config_.max_length) {
        auto reason = "Input too large: " + std::to_string(result.length) + " > " +
                      std::to_string(config_.max_length) + " characters";
        return reject(std::move(result), InputError::kOversizedInput, std::move(reason));
    }

    const auto lowered = to_lower(result.normalized);
    for (const auto& pattern : patterns) {
        if (lowered.find(pattern) != std::string::npos) {
            result.matched_patterns.push_back(pattern);
        }
    }
    if (!result.matched_patterns.empty()) {
        auto reason = "Suspicious patterns: " + join(result.matched_patterns, ", ");
        return reject(std::move(result), InputError::kSuspiciousPattern, std::move(reason));
    }

    const char first = result.normalized.front();
    if ((first == '{' || first == '[') && !nlohmann::json::accept(result.normalized)) {
        return reject(std::move(result), InputError::kMalformedStructure, "Invalid JSON structure");
    }

    if (result.length >= config_.gibberish_min_length &&
        alnum_ratio(result.normalized, result.length) < config_.min_alnum_ratio) {
        return reject(std::move(result), InputError::kGibberishInput, "Input appears to be gibberish");
    }

    {
        std::lock_guard<std::mutex> guard(mutex_);
        stats_.valid += 1;
    }
    result.valid = true;
    return result;
}

ValidationResult InputValidator::reject(ValidationResult result, InputError error, std::string reason) {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        stats_.invalid += 1;
        if (error == InputError::kSuspiciousPattern) {
            stats_.suspicious += 1;
        }
    }
    result.valid = false;
    result.error = error;
    result.reason = std::move(reason);
    logger_.warn("input_rejected", {{"check_id", std::to_string(result.check_id)},
                                    {"error", input_error_name(error)},
                                    {"reason", result.reason}});
    return result;
}

std::vector<ValidationResult> InputValidator::batch_validate(const std::vector<std::string>& inputs) {
    std::vector<ValidationResult> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        results.push_back(validate(input));
    }
    return results;
}

bool InputValidator::add_custom_pattern(const std::string& pattern) {
    const auto lowered = to_lower(pattern);
    if (lowered.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    if (std::find(suspicious_patterns_.begin(), suspicious_patterns_.end(), lowered) != suspicious_patterns_.end()) {
        return false;
    }
    suspicious_patterns_.push_back(lowered);
    return true;
}

InputStats InputValidator::get_stats() const {
    std::lock_guard<std::mutex> guard(mutex_);
    InputStats stats = stats_;
    stats.validity_rate = static_cast<double>(stats.valid) / static_cast<double>(std::max<std::uint64_t>(stats.total, 1));
    stats.patterns_checked = suspicious_patterns_.size();
    return stats;
}

}  // namespace guardrail
