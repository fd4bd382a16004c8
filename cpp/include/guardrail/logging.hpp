#ifndef GUARDRAIL_LOGGING_HPP
#define GUARDRAIL_LOGGING_HPP

#include <map>
#include <string>

#include "guardrail/config.hpp"

namespace guardrail {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

using LogFields = std::map<std::string, std::string>;

class Logger {
public:
    explicit Logger(std::string name);

    void log(LogLevel level, const std::string& message, const LogFields& extra = {}) const;

    void debug(const std::string& message, const LogFields& extra = {}) const;
    void info(const std::string& message, const LogFields& extra = {}) const;
    void warn(const std::string& message, const LogFields& extra = {}) const;
    void error(const std::string& message, const LogFields& extra = {}) const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Applies to every Logger in the process.
void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace guardrail

#endif  // GUARDRAIL_LOGGING_HPP
