#ifndef GUARDRAIL_CONFIG_HPP
#define GUARDRAIL_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace guardrail {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct MetricsConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 8000;
};

struct InputConfig {
    std::size_t max_length = 10'000;
    double min_alnum_ratio = 0.3;
    std::size_t gibberish_min_length = 10;
};

struct ContentConfig {
    // 0 keeps every audit entry.
    std::size_t audit_log_limit = 0;
};

struct SafetyConfig {
    int critical_violations = 1;
    long long penalty_threshold = 2000;
    double score_threshold = 20.0;
    double decay_scale = 1000.0;
    // 0 keeps every violation until reset.
    std::size_t violation_log_limit = 0;
    std::optional<std::string> export_path = std::nullopt;
};

struct OutputConfig {
    std::size_t max_length = 5000;
};

struct PipelineSettings {
    LoggingConfig logging{};
    MetricsConfig metrics{};
    InputConfig input{};
    ContentConfig content{};
    SafetyConfig safety{};
    OutputConfig output{};
    std::size_t coordination_log_limit = 1000;

    static PipelineSettings from_toml(const std::string& path);
};

}  // namespace guardrail

#endif  // GUARDRAIL_CONFIG_HPP
