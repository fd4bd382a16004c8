#include "guardrail/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "guardrail/common.hpp"

namespace guardrail {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

std::size_t parse_size(const std::string& value) {
    const long long parsed = std::stoll(value);
    if (parsed < 0) {
        throw std::runtime_error("expected a non-negative integer: " + value);
    }
    return static_cast<std::size_t>(parsed);
}

}  // namespace

PipelineSettings PipelineSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    PipelineSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        try {
            if (current_section == "logging") {
                if (key == "level") {
                    settings.logging.level = strip_quotes(value);
                } else if (key == "json") {
                    settings.logging.json = parse_bool(value);
                } else if (key == "log_file") {
                    settings.logging.log_file = parse_optional_string(value);
                } else if (key == "max_bytes") {
                    settings.logging.max_bytes = std::stoi(value);
                } else if (key == "backup_count") {
                    settings.logging.backup_count = std::stoi(value);
                }
            } else if (current_section == "metrics") {
                if (key == "enabled") {
                    settings.metrics.enabled = parse_bool(value);
                } else if (key == "host") {
                    settings.metrics.host = strip_quotes(value);
                } else if (key == "port") {
                    settings.metrics.port = std::stoi(value);
                }
            } else if (current_section == "input") {
                if (key == "max_length") {
                    settings.input.max_length = parse_size(value);
                } else if (key == "min_alnum_ratio") {
                    settings.input.min_alnum_ratio = std::stod(value);
                } else if (key == "gibberish_min_length") {
                    settings.input.gibberish_min_length = parse_size(value);
                }
            } else if (current_section == "content") {
                if (key == "audit_log_limit") {
                    settings.content.audit_log_limit = parse_size(value);
                }
            } else if (current_section == "safety") {
                if (key == "critical_violations") {
                    settings.safety.critical_violations = std::stoi(value);
                } else if (key == "penalty_threshold") {
                    settings.safety.penalty_threshold = std::stoll(value);
                } else if (key == "score_threshold") {
                    settings.safety.score_threshold = std::stod(value);
                } else if (key == "decay_scale") {
                    settings.safety.decay_scale = std::stod(value);
                } else if (key == "violation_log_limit") {
                    settings.safety.violation_log_limit = parse_size(value);
                } else if (key == "export_path") {
                    settings.safety.export_path = parse_optional_string(value);
                }
            } else if (current_section == "output") {
                if (key == "max_length") {
                    settings.output.max_length = parse_size(value);
                }
            } else if (current_section.empty()) {
                if (key == "coordination_log_limit") {
                    settings.coordination_log_limit = parse_size(value);
                }
            }
        } catch (const std::logic_error&) {
            // std::stoi and friends report bad numbers as invalid_argument/out_of_range.
            throw std::runtime_error("invalid value for " + current_section + "." + key + ": " + value);
        }
    }

    if (settings.safety.decay_scale <= 0.0) {
        throw std::runtime_error("safety.decay_scale must be positive");
    }
    if (settings.safety.critical_violations < 1) {
        throw std::runtime_error("safety.critical_violations must be at least 1");
    }

    return settings;
}

}  // namespace guardrail
