#include "guardrail/logging.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "guardrail/common.hpp"

namespace guardrail {

namespace {

constexpr std::array<std::pair<LogLevel, const char*>, 4> kLevelNames = {{
    {LogLevel::kDebug, "DEBUG"},
    {LogLevel::kInfo, "INFO"},
    {LogLevel::kWarn, "WARN"},
    {LogLevel::kError, "ERROR"},
}};

const char* level_name(LogLevel level) {
    for (const auto& [value, name] : kLevelNames) {
        if (value == level) {
            return name;
        }
    }
    return "INFO";
}

// Unknown names fall back to INFO; "warning" is accepted for WARN.
LogLevel parse_level(const std::string& level) {
    const auto lowered = to_lower(level);
    if (lowered == "warning") {
        return LogLevel::kWarn;
    }
    for (const auto& [value, name] : kLevelNames) {
        if (lowered == to_lower(name)) {
            return value;
        }
    }
    return LogLevel::kInfo;
}

// Append-only file with "<path>.1" .. "<path>.<backups>" rollover once it reaches max_bytes.
class RotatingFile {
public:
    RotatingFile(std::filesystem::path path, int max_bytes, int backups)
        : path_(std::move(path)), max_bytes_(max_bytes), backups_(backups) {
        open();
    }

    bool is_open() const { return stream_ && stream_->is_open(); }

    void write(const std::string& line) {
        if (should_roll()) {
            roll();
        }
        *stream_ << line << '\n';
        stream_->flush();
    }

private:
    void open() { stream_ = std::make_unique<std::ofstream>(path_, std::ios::app); }

    bool should_roll() const {
        if (max_bytes_ <= 0 || backups_ <= 0) {
            return false;
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(path_, ec);
        return !ec && size >= static_cast<std::uintmax_t>(max_bytes_);
    }

    std::filesystem::path numbered(int index) const {
        auto rolled = path_;
        rolled += "." + std::to_string(index);
        return rolled;
    }

    void roll() {
        stream_.reset();
        std::error_code ec;
        for (int index = backups_ - 1; index >= 1; --index) {
            if (std::filesystem::exists(numbered(index), ec)) {
                std::filesystem::rename(numbered(index), numbered(index + 1), ec);
            }
        }
        std::filesystem::rename(path_, numbered(1), ec);
        open();
    }

    std::filesystem::path path_;
    int max_bytes_;
    int backups_;
    std::unique_ptr<std::ofstream> stream_;
};

struct LoggingState {
    LogLevel level = LogLevel::kInfo;
    bool json = true;
    std::unique_ptr<RotatingFile> file;
    std::mutex mutex;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

std::string format_json(LogLevel level, const std::string& name, const std::string& message,
                        const LogFields& extra) {
    nlohmann::json payload = {
        {"ts", seconds_since_epoch()},
        {"level", level_name(level)},
        {"name", name},
        {"message", message},
    };
    for (const auto& [key, value] : extra) {
        payload[key] = value;
    }
    // Extras may hold previews of caller text that is not valid UTF-8.
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string format_plain(LogLevel level, const std::string& name, const std::string& message,
                         const LogFields& extra) {
    std::ostringstream line;
    line << level_name(level) << " " << name << " " << message;
    if (!extra.empty()) {
        line << " |";
        for (const auto& [key, value] : extra) {
            line << " " << key << "=" << value;
        }
    }
    return line.str();
}

}  // namespace

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::log(LogLevel level, const std::string& message, const LogFields& extra) const {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    if (static_cast<int>(level) < static_cast<int>(log_state.level)) {
        return;
    }
    const auto line = log_state.json ? format_json(level, name_, message, extra)
                                     : format_plain(level, name_, message, extra);
    if (log_state.file) {
        log_state.file->write(line);
    } else {
        std::clog << line << '\n';
        std::clog.flush();
    }
}

void Logger::debug(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kDebug, message, extra);
}

void Logger::info(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kInfo, message, extra);
}

void Logger::warn(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kWarn, message, extra);
}

void Logger::error(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kError, message, extra);
}

void configure_logging(const LoggingConfig& config) {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    log_state.level = parse_level(config.level);
    log_state.json = config.json;
    log_state.file.reset();

    if (config.log_file.has_value()) {
        auto file = std::make_unique<RotatingFile>(*config.log_file, config.max_bytes, config.backup_count);
        if (file->is_open()) {
            log_state.file = std::move(file);
        } else {
            std::clog << "guardrail: unable to open log file " << *config.log_file << ", using stderr\n";
        }
    }
}

Logger get_logger(const std::string& name) {
    return Logger(name);
}

}  // namespace guardrail
