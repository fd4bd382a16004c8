#ifndef GUARDRAIL_OUTPUT_SANITIZER_HPP
#define GUARDRAIL_OUTPUT_SANITIZER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

#include "guardrail/config.hpp"
#include "guardrail/logging.hpp"
#include "guardrail/rules.hpp"

namespace guardrail {

struct SanitizationResult {
    bool safe = false;
    std::string output;
    std::string reason;
    std::vector<std::string> dangerous_phrases;
    std::size_t original_length = 0;
    std::size_t final_length = 0;
    // "redacted" when the released text differs from the input, otherwise "none".
    std::string modifications = "none";
    int modification_count = 0;
    double timestamp = 0.0;
};

struct OutputStats {
    std::uint64_t total = 0;
    std::uint64_t safe = 0;
    std::uint64_t modified = 0;
    std::uint64_t blocked = 0;
    double safety_rate = 0.0;
    std::size_t rules_active = 0;
};

enum class Tone {
    kPositive,
    kNegative,
    kNeutral,
};

std::string tone_name(Tone tone);

// Word-list tone estimate; each listed word counts once however often it occurs.
struct ToneReport {
    Tone tone = Tone::kNeutral;
    int positive_score = 0;
    int negative_score = 0;
};

class OutputSanitizer {
public:
    static constexpr const char* kCommandPlaceholder = "[COMMAND_REDACTED]";
    static constexpr const char* kTruncationMarker = "... [TRUNCATED]";

    explicit OutputSanitizer(std::shared_ptr<const RuleSet> rules = nullptr, OutputConfig config = {},
                             Logger logger = get_logger("OutputSanitizer"));

    SanitizationResult validate(const std::string& output);
    std::vector<SanitizationResult> batch_validate(const std::vector<std::string>& outputs);

    // Applies the redaction rules only. Idempotent.
    std::string redact(const std::string& text) const;

    OutputStats get_stats() const;

    ToneReport check_tone(const std::string& text) const;

    // Returns false when the phrase is empty or already blocked.
    bool add_dangerous_phrase(const std::string& phrase);

    static std::vector<std::string> default_dangerous_phrases();

private:
    struct CommandToken {
        std::string token;
        std::regex regex;
    };

    std::shared_ptr<const RuleSet> rules_;
    OutputConfig config_;
    std::vector<std::string> dangerous_phrases_;
    std::vector<CommandToken> command_tokens_;
    Logger logger_;
    mutable std::mutex mutex_;
    OutputStats stats_;
};

}  // namespace guardrail

#endif  // GUARDRAIL_OUTPUT_SANITIZER_HPP
