#include "guardrail/content_checker.hpp"

#include <algorithm>

#include "guardrail/common.hpp"

namespace guardrail {

namespace {

constexpr std::size_t kPreviewLength = 100;

}  // namespace

ContentChecker::ContentChecker(ContentConfig config, Logger logger)
    : config_(config),
      categories_(default_categories()),
      patterns_(default_patterns()),
      logger_(std::move(logger)) {}

std::vector<KeywordCategory> ContentChecker::default_categories() {
    return {
        {"safety", {"harm", "danger", "attack", "violate"}},
        {"ethics", {"unethical", "illegal", "immoral", "exploit"}},
        {"system", {"crash", "overload", "corrupt", "bypass"}},
        {"reality", {"impossible", "magic", "fantasy", "supernatural"}},
    };
}

std::vector<ContentChecker::DangerousPattern> ContentChecker::default_patterns() {
    return {
        {"system_call", std::make_shared<const RegexMatcher>(R"(system\s*\(\s*\))")},
        {"exec_call", std::make_shared<const RegexMatcher>(R"(exec\s*\()")},
        {"dunder_name", std::make_shared<const RegexMatcher>(R"(__\w+__)")},
        {"recursive_delete", std::make_shared<const RegexMatcher>(R"(rm\s+-rf)")},
        {"disk_format", std::make_shared<const RegexMatcher>(R"(format\s+c:)")},
    };
}

ContentVerdict ContentChecker::verify(const std::string& content) {
    const auto lowered = to_lower(content);

    std::vector<std::string> issues;
    for (const auto& [category, keywords] : categories_) {
        for (const auto& keyword : keywords) {
            if (lowered.find(keyword) != std::string::npos) {
                issues.push_back(category + ":" + keyword);
            }
        }
    }
    for (const auto& pattern : patterns_) {
        if (pattern.matcher->matches(lowered)) {
            issues.push_back("pattern:" + pattern.id);
        }
    }

    ContentVerdict verdict;
    verdict.approved = issues.empty();
    verdict.issues = issues;

    AuditEntry entry{seconds_since_epoch(), utf8_truncate(lowered, kPreviewLength), verdict.approved,
                     std::move(issues), 0};
    {
        std::lock_guard<std::mutex> guard(mutex_);
        checks_performed_ += 1;
        if (!verdict.approved) {
            blocks_ += 1;
        }
        entry.check_id = checks_performed_;
        verdict.check_id = checks_performed_;
        verdict.total_checks = checks_performed_;
        verdict.blocks = blocks_;

        audit_log_.push_back(std::move(entry));
        if (config_.audit_log_limit > 0 && audit_log_.size() > config_.audit_log_limit) {
            audit_log_.pop_front();
        }
    }

    if (!verdict.approved) {
        logger_.warn("content_blocked", {{"check_id", std::to_string(verdict.check_id)},
                                         {"issues", join(verdict.issues, ",")}});
    }
    return verdict;
}

ContentStats ContentChecker::stats() const {
    ContentStats stats;
    for (const auto& category : categories_) {
        stats.categories.push_back(category.first);
    }

    std::lock_guard<std::mutex> guard(mutex_);
    stats.checks_performed = checks_performed_;
    stats.blocks = blocks_;
    stats.approval_rate = static_cast<double>(checks_performed_ - blocks_) /
                          static_cast<double>(std::max<std::uint64_t>(checks_performed_, 1));
    if (!audit_log_.empty()) {
        stats.last_check = audit_log_.back();
    }
    return stats;
}

std::vector<AuditEntry> ContentChecker::audit_log() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return {audit_log_.begin(), audit_log_.end()};
}

void ContentChecker::reset_stats() {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        checks_performed_ = 0;
        blocks_ = 0;
        audit_log_.clear();
    }
    logger_.info("content_stats_reset");
}

}  // namespace guardrail
