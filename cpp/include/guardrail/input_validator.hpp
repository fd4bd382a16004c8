#ifndef GUARDRAIL_INPUT_VALIDATOR_HPP
#define GUARDRAIL_INPUT_VALIDATOR_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "guardrail/config.hpp"
#include "guardrail/logging.hpp"

namespace guardrail {

enum class InputError {
    kEmptyInput,
    kOversizedInput,
    kSuspiciousPattern,
    kMalformedStructure,
    kGibberishInput,
};

std::string input_error_name(InputError error);

struct ValidationResult {
    bool valid = false;
    std::optional<InputError> error;
    std::string reason;
    std::string normalized;
    std::vector<std::string> matched_patterns;
    std::size_t length = 0;
    std::uint64_t check_id = 0;
    double timestamp = 0.0;
};

struct InputStats {
    std::uint64_t total = 0;
    std::uint64_t valid = 0;
    std::uint64_t invalid = 0;
    std::uint64_t suspicious = 0;
    double validity_rate = 0.0;
    std::size_t patterns_checked = 0;
};

class InputValidator {
public:
    explicit InputValidator(InputConfig config = {}, Logger logger = get_logger("InputValidator"));

    ValidationResult validate(const std::string& raw);
    std::vector<ValidationResult> batch_validate(const std::vector<std::string>& inputs);

    // Returns false when the pattern is empty or already screened.
    bool add_custom_pattern(const std::string& pattern);

    InputStats get_stats() const;

    static std::vector<std::string> default_suspicious_patterns();

private:
    ValidationResult reject(ValidationResult result, InputError error, std::string reason);

    InputConfig config_;
    std::vector<std::string> suspicious_patterns_;
    Logger logger_;
    mutable std::mutex mutex_;
    InputStats stats_;
};

}  // namespace guardrail

#endif  // GUARDRAIL_INPUT_VALIDATOR_HPP
