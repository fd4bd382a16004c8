#include "guardrail/rules.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

#include "guardrail/common.hpp"

namespace guardrail {

std::string severity_name(Severity severity) {
    switch (severity) {
        case Severity::kLow:
            return "LOW";
        case Severity::kMedium:
            return "MEDIUM";
        case Severity::kHigh:
            return "HIGH";
        case Severity::kCritical:
            return "CRITICAL";
    }
    return "LOW";
}

namespace {

std::regex compile(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    } catch (const std::regex_error& exc) {
        throw std::invalid_argument("invalid pattern '" + pattern + "': " + exc.what());
    }
}

bool is_word_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

std::size_t skip_space(const std::string& text, std::size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        pos += 1;
    }
    return pos;
}

}  // namespace

RegexMatcher::RegexMatcher(std::string pattern) : pattern_(std::move(pattern)), regex_(compile(pattern_)) {}

bool RegexMatcher::matches(const std::string& text) const {
    return std::regex_search(text, regex_);
}

SubstringMatcher::SubstringMatcher(std::string needle) : needle_(to_lower(std::move(needle))) {}

bool SubstringMatcher::matches(const std::string& text) const {
    return to_lower(text).find(needle_) != std::string::npos;
}

OperatorMatcher::OperatorMatcher(std::string label, std::string op)
    : label_(std::move(label)), op_(to_lower(std::move(op))) {
    if (op_.empty()) {
        throw std::invalid_argument("operator matcher needs an operator: " + label_);
    }
}

bool OperatorMatcher::matches(const std::string& text) const {
    const auto lowered = to_lower(text);
    for (auto pos = lowered.find(op_); pos != std::string::npos; pos = lowered.find(op_, pos + 1)) {
        const auto next = skip_space(lowered, pos + op_.size());
        if (next < lowered.size() && is_word_char(lowered[next])) {
            return true;
        }
    }
    return false;
}

SpanMatcher::SpanMatcher(std::string label, std::vector<std::string> opener, std::string closer)
    : label_(std::move(label)), opener_(std::move(opener)), closer_(to_lower(std::move(closer))) {
    if (opener_.empty() || opener_.front().empty()) {
        throw std::invalid_argument("span matcher needs an opening token: " + label_);
    }
    for (auto& token : opener_) {
        token = to_lower(token);
    }
}

bool SpanMatcher::matches(const std::string& text) const {
    const auto lowered = to_lower(text);
    const auto& head = opener_.front();

    auto pos = lowered.find(head);
    while (pos != std::string::npos) {
        auto cursor = pos + head.size();
        bool opened = true;
        for (std::size_t i = 1; i < opener_.size(); ++i) {
            cursor = skip_space(lowered, cursor);
            if (lowered.compare(cursor, opener_[i].size(), opener_[i]) != 0) {
                opened = false;
                break;
            }
            cursor += opener_[i].size();
        }
        if (!opened) {
            pos = lowered.find(head, pos + 1);
            continue;
        }
        if (closer_.empty()) {
            return true;
        }

        const auto line_end = lowered.find_first_of("\r\n", cursor);
        const auto limit = line_end == std::string::npos ? lowered.end() : lowered.begin() + line_end;
        if (std::search(lowered.begin() + cursor, limit, closer_.begin(), closer_.end()) != limit) {
            return true;
        }
        // A later opening on the same line can only see less of it.
        if (line_end == std::string::npos) {
            return false;
        }
        pos = lowered.find(head, line_end);
    }
    return false;
}

Rule make_regex_rule(std::string name, std::string pattern, Severity severity, int penalty,
                     std::string description) {
    auto matcher = std::make_shared<const RegexMatcher>(pattern);
    return Rule{std::move(name), std::move(pattern), severity, penalty, std::move(description), std::move(matcher)};
}

Rule make_substring_rule(std::string name, std::string needle, Severity severity, int penalty,
                         std::string description) {
    auto matcher = std::make_shared<const SubstringMatcher>(needle);
    return Rule{std::move(name), std::move(needle), severity, penalty, std::move(description), std::move(matcher)};
}

Rule make_matcher_rule(std::string name, std::shared_ptr<const PatternMatcher> matcher, Severity severity,
                       int penalty, std::string description) {
    auto pattern = matcher ? matcher->pattern() : std::string();
    return Rule{std::move(name), std::move(pattern), severity, penalty, std::move(description), std::move(matcher)};
}

std::string RedactionRule::apply(const std::string& text) const {
    return std::regex_replace(text, regex, replacement);
}

RedactionRule make_redaction_rule(std::string name, std::string pattern, std::string replacement) {
    auto regex = compile(pattern);
    return RedactionRule{std::move(name), std::move(pattern), std::move(replacement), std::move(regex)};
}

RuleSet::RuleSet(std::vector<Rule> rules, std::vector<RedactionRule> redactions)
    : rules_(std::move(rules)), redactions_(std::move(redactions)) {
    std::set<std::string> names;
    for (const auto& rule : rules_) {
        if (rule.name.empty()) {
            throw std::invalid_argument("rule name must not be empty");
        }
        if (!names.insert(rule.name).second) {
            throw std::invalid_argument("duplicate rule name: " + rule.name);
        }
        if (rule.penalty <= 0) {
            throw std::invalid_argument("rule " + rule.name + " must carry a positive penalty");
        }
        if (!rule.matcher) {
            throw std::invalid_argument("rule " + rule.name + " has no matcher");
        }
    }
}

RuleSet RuleSet::defaults() {
    return RuleSet(default_rules(), default_redactions());
}

std::vector<Rule> RuleSet::default_rules() {
    return {
        make_regex_rule("no_harm", R"(\b(kill|harm|hurt|injure|attack|destroy)\b)", Severity::kCritical, 1000,
                        "Prevention of physical harm"),
        make_regex_rule("no_exploit", R"(\b(hack|exploit|breach|bypass|unauthorized)\b)", Severity::kHigh, 500,
                        "System security protection"),
        make_regex_rule("no_privacy_violation", R"(\b(spy|snoop|eavesdrop|private|personal data)\b)",
                        Severity::kHigh, 400, "Data privacy protection"),
        make_regex_rule("no_dangerous_instructions", R"(\b(bomb|weapon|poison|dangerous chemical)\b)",
                        Severity::kCritical, 1500, "Prevention of dangerous creations"),
        make_regex_rule("no_system_damage", R"(\b(rm -rf|format|delete all|erase|corrupt)\b)", Severity::kHigh, 600,
                        "System integrity protection"),
        make_regex_rule("no_unethical", R"(\b(cheat|steal|lie|deceive|manipulate)\b)", Severity::kMedium, 300,
                        "Ethical behavior enforcement"),
        make_regex_rule("reality_check", R"(\b(time travel|teleport|magic|supernatural|infinite energy)\b)",
                        Severity::kLow, 100, "Reality consistency check"),
    };
}

std::vector<RedactionRule> RuleSet::default_redactions() {
    // Order matters: the SSN shape must be replaced before the bare digit runs.
    return {
        make_redaction_rule("ssn", R"(\b\d{3}-\d{2}-\d{4}\b)", "[SSN_REDACTED]"),
        make_redaction_rule("credit_card", R"(\b\d{16}\b)", "[CREDIT_CARD_REDACTED]"),
        make_redaction_rule("phone", R"(\b\d{10}\b)", "[PHONE_REDACTED]"),
        // Bounded repeats (RFC 5321 part lengths) keep std::regex's backtracking depth fixed on long words.
        make_redaction_rule("email", R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)",
                            "[EMAIL_REDACTED]"),
    };
}

const Rule* RuleSet::find(const std::string& name) const {
    for (const auto& rule : rules_) {
        if (rule.name == name) {
            return &rule;
        }
    }
    return nullptr;
}

}  // namespace guardrail
