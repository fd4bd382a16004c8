#ifndef GUARDRAIL_CONTENT_CHECKER_HPP
#define GUARDRAIL_CONTENT_CHECKER_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "guardrail/config.hpp"
#include "guardrail/logging.hpp"
#include "guardrail/rules.hpp"

namespace guardrail {

struct ContentVerdict {
    bool approved = true;
    std::vector<std::string> issues;
    std::uint64_t check_id = 0;
    std::uint64_t total_checks = 0;
    std::uint64_t blocks = 0;
};

struct AuditEntry {
    double timestamp = 0.0;
    std::string content_preview;
    bool approved = true;
    std::vector<std::string> issues;
    std::uint64_t check_id = 0;
};

struct ContentStats {
    std::uint64_t checks_performed = 0;
    std::uint64_t blocks = 0;
    double approval_rate = 0.0;
    std::optional<AuditEntry> last_check;
    std::vector<std::string> categories;
};

using KeywordCategory = std::pair<std::string, std::vector<std::string>>;

/// Coarse keyword and structural-pattern gate. No scoring: any hit fails the check.
class ContentChecker {
public:
    explicit ContentChecker(ContentConfig config = {}, Logger logger = get_logger("ContentChecker"));

    ContentVerdict verify(const std::string& content);
    ContentStats stats() const;
    std::vector<AuditEntry> audit_log() const;
    void reset_stats();

    static std::vector<KeywordCategory> default_categories();

private:
    struct DangerousPattern {
        std::string id;
        std::shared_ptr<const PatternMatcher> matcher;
    };

    static std::vector<DangerousPattern> default_patterns();

    ContentConfig config_;
    std::vector<KeywordCategory> categories_;
    std::vector<DangerousPattern> patterns_;
    Logger logger_;
    mutable std::mutex mutex_;
    std::uint64_t checks_performed_ = 0;
    std::uint64_t blocks_ = 0;
    std::deque<AuditEntry> audit_log_;
};

}  // namespace guardrail

#endif  // GUARDRAIL_CONTENT_CHECKER_HPP
