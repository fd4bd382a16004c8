#ifndef GUARDRAIL_RULES_HPP
#define GUARDRAIL_RULES_HPP

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace guardrail {

// Totally ordered: kCritical > kHigh > kMedium > kLow.
enum class Severity {
    kLow = 1,
    kMedium = 2,
    kHigh = 3,
    kCritical = 4,
};

std::string severity_name(Severity severity);

// Strategy for "does this pattern occur in this text, ignoring case".
class PatternMatcher {
public:
    virtual ~PatternMatcher() = default;
    virtual bool matches(const std::string& text) const = 0;
    virtual const std::string& pattern() const = 0;
};

class RegexMatcher : public PatternMatcher {
public:
    // Throws std::invalid_argument if the expression does not compile.
    explicit RegexMatcher(std::string pattern);

    bool matches(const std::string& text) const override;
    const std::string& pattern() const override { return pattern_; }

private:
    std::string pattern_;
    std::regex regex_;
};

class SubstringMatcher : public PatternMatcher {
public:
    explicit SubstringMatcher(std::string needle);

    bool matches(const std::string& text) const override;
    const std::string& pattern() const override { return needle_; }

private:
    std::string needle_;
};

// `op`, optional whitespace, then a word character: the shape of `;\s*\w+`.
// Linear scan; no backtracking on long text.
class OperatorMatcher : public PatternMatcher {
public:
    OperatorMatcher(std::string label, std::string op);

    bool matches(const std::string& text) const override;
    const std::string& pattern() const override { return label_; }

private:
    std::string label_;
    std::string op_;
};

// Opening tokens separated by optional whitespace, then `closer` later on the
// same line: the shape of `eval\s*\(.*\)` or `` `.*` ``. An empty closer only
// requires the opening tokens.
class SpanMatcher : public PatternMatcher {
public:
    SpanMatcher(std::string label, std::vector<std::string> opener, std::string closer);

    bool matches(const std::string& text) const override;
    const std::string& pattern() const override { return label_; }

private:
    std::string label_;
    std::vector<std::string> opener_;
    std::string closer_;
};

struct Rule {
    std::string name;
    std::string pattern;
    Severity severity = Severity::kLow;
    int penalty = 0;
    std::string description;
    std::shared_ptr<const PatternMatcher> matcher;

    bool matches(const std::string& text) const { return matcher && matcher->matches(text); }
};

Rule make_regex_rule(std::string name, std::string pattern, Severity severity, int penalty,
                     std::string description);
Rule make_substring_rule(std::string name, std::string needle, Severity severity, int penalty,
                         std::string description);
Rule make_matcher_rule(std::string name, std::shared_ptr<const PatternMatcher> matcher, Severity severity,
                       int penalty, std::string description);

struct RedactionRule {
    std::string name;
    std::string pattern;
    std::string replacement;
    std::regex regex;

    std::string apply(const std::string& text) const;
};

RedactionRule make_redaction_rule(std::string name, std::string pattern, std::string replacement);

class RuleSet {
public:
    // Throws std::invalid_argument on duplicate names, non-positive penalties or missing matchers.
    RuleSet(std::vector<Rule> rules, std::vector<RedactionRule> redactions);

    static RuleSet defaults();
    static std::vector<Rule> default_rules();
    static std::vector<RedactionRule> default_redactions();

    const std::vector<Rule>& rules() const { return rules_; }
    const std::vector<RedactionRule>& redactions() const { return redactions_; }
    const Rule* find(const std::string& name) const;

private:
    std::vector<Rule> rules_;
    std::vector<RedactionRule> redactions_;
};

}  // namespace guardrail

#endif  // GUARDRAIL_RULES_HPP
