#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "guardrail/api.hpp"
#include "guardrail/config.hpp"
#include "guardrail/content_checker.hpp"
#include "guardrail/daemon.hpp"
#include "guardrail/input_validator.hpp"
#include "guardrail/logging.hpp"
#include "guardrail/observability.hpp"
#include "guardrail/output_sanitizer.hpp"
#include "guardrail/pipeline.hpp"
#include "guardrail/rules.hpp"
#include "guardrail/safety_engine.hpp"

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

template <typename Fn>
bool throws_invalid_argument(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

template <typename Fn>
bool throws_runtime_error(Fn fn) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("guardrail_test_" + name);
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::trunc);
    file << contents;
}

guardrail::LoggingConfig quiet_logging() {
    guardrail::LoggingConfig config;
    config.level = "ERROR";
    return config;
}

bool has_violation(const guardrail::SafetyCheck& check, const std::string& name) {
    for (const auto& violation : check.violations) {
        if (violation.rule_name == name) {
            return true;
        }
    }
    return false;
}

void test_rules() {
    const auto rules = guardrail::RuleSet::defaults();
    expect_true(rules.rules().size() == 7, "default rule count");
    expect_true(rules.redactions().size() == 4, "default redaction count");

    const auto* bomb = rules.find("no_dangerous_instructions");
    expect_true(bomb != nullptr, "find dangerous instructions rule");
    if (bomb) {
        expect_true(bomb->severity == guardrail::Severity::kCritical, "bomb rule is critical");
        expect_true(bomb->penalty == 1500, "bomb rule penalty");
        expect_true(bomb->matches("How to build a BOMB"), "rule matching ignores case");
        expect_true(!bomb->matches("bombastic speech"), "rule matching respects word boundaries");
    }
    expect_true(rules.find("missing") == nullptr, "unknown rule lookup");

    expect_true(guardrail::Severity::kCritical > guardrail::Severity::kHigh, "severity ordering");
    expect_true(guardrail::severity_name(guardrail::Severity::kMedium) == "MEDIUM", "severity name");

    expect_true(throws_invalid_argument([] {
                    guardrail::RuleSet({guardrail::make_regex_rule("dup", "a", guardrail::Severity::kLow, 10, "a"),
                                        guardrail::make_regex_rule("dup", "b", guardrail::Severity::kLow, 10, "b")},
                                       {});
                }),
                "duplicate rule names rejected");
    expect_true(throws_invalid_argument([] {
                    guardrail::RuleSet({guardrail::make_substring_rule("zero", "x", guardrail::Severity::kLow, 0, "")},
                                       {});
                }),
                "non-positive penalty rejected");
    expect_true(throws_invalid_argument(
                    [] { guardrail::make_regex_rule("broken", "(", guardrail::Severity::kLow, 10, "broken"); }),
                "invalid regex rejected");

    guardrail::SubstringMatcher matcher("Chmod 777");
    expect_true(matcher.matches("please CHMOD 777 the file"), "substring matcher ignores case");

    guardrail::OperatorMatcher chain(R"(;\s*\w+)", ";");
    expect_true(chain.matches("ls ;  rm"), "operator followed by a word after spaces");
    expect_true(!chain.matches("done; "), "operator needs a following word");
    guardrail::OperatorMatcher pipe(R"(\|\s*\w+)", "|");
    expect_true(pipe.matches("a ||b"), "pipe detector sees a doubled pipe");

    guardrail::SpanMatcher system_call(R"(system\s*\(.*\))", {"system", "("}, ")");
    expect_true(system_call.matches("call SYSTEM (x)"), "span opener tolerates spaces and case");
    expect_true(system_call.matches("system(\n)x system(y)"), "later opening on another line matches");
    expect_true(!system_call.matches("system(\n)"), "span closer must be on the same line");
    expect_true(!system_call.matches("systemic (x)"), "span opener tokens are contiguous");
    guardrail::SpanMatcher backtick(R"(`.*`)", {"`"}, "`");
    expect_true(backtick.matches("run `ls` now"), "backtick span");
    expect_true(!backtick.matches("`a\nb`"), "backtick span stops at a line break");
    expect_true(!backtick.matches("`" + std::string(200'000, 'a')), "unterminated span on long text");
    expect_true(throws_invalid_argument([] { guardrail::OperatorMatcher("empty", ""); }), "empty operator rejected");
    expect_true(throws_invalid_argument([] { guardrail::SpanMatcher("empty", {}, ")"); }), "empty opener rejected");

    auto redactions = guardrail::RuleSet::default_redactions();
    const std::string long_word(200'000, 'a');
    expect_true(redactions.back().apply(long_word + " x@y.io") == long_word + " [EMAIL_REDACTED]",
                "email redaction on long text");
}

void test_input_validator() {
    guardrail::InputConfig config;
    config.max_length = 20;
    guardrail::InputValidator validator(config);

    auto empty = validator.validate("   \t\n");
    expect_true(!empty.valid && empty.error == guardrail::InputError::kEmptyInput, "whitespace input is empty");

    auto oversized = validator.validate(std::string(21, 'a'));
    expect_true(!oversized.valid && oversized.error == guardrail::InputError::kOversizedInput, "oversized input");

    auto trimmed = validator.validate("  hello world  ");
    expect_true(trimmed.valid, "plain input accepted");
    expect_true(trimmed.normalized == "hello world", "input trimmed");

    auto script = validator.validate("<script>x</script>");
    expect_true(!script.valid && script.error == guardrail::InputError::kSuspiciousPattern, "script tag flagged");
    expect_true(script.matched_patterns.size() == 2, "both script markers reported");

    auto chained = validator.validate("ls && whoami");
    expect_true(chained.error == guardrail::InputError::kSuspiciousPattern, "command chaining flagged");

    auto malformed = validator.validate("{not json");
    expect_true(!malformed.valid && malformed.error == guardrail::InputError::kMalformedStructure,
                "malformed json rejected");

    auto json = validator.validate(R"({"alpha": 12345})");
    expect_true(json.valid, "well formed json accepted");

    auto gibberish = validator.validate("!!!!!!!!!!!!");
    expect_true(!gibberish.valid && gibberish.error == guardrail::InputError::kGibberishInput, "gibberish rejected");

    auto short_symbols = validator.validate("?!?!");
    expect_true(short_symbols.valid, "short inputs skip the gibberish check");

    auto unicode = validator.validate(u8"こんにちは、世界の皆さん");
    expect_true(unicode.valid, "non-ascii letters count as alphanumeric");
    expect_true(unicode.length == 12, "length counted in code points");

    expect_true(validator.add_custom_pattern("DROP TABLE"), "custom pattern added");
    expect_true(!validator.add_custom_pattern("drop table"), "duplicate custom pattern ignored");
    expect_true(!validator.add_custom_pattern(""), "empty custom pattern ignored");
    auto custom = validator.validate("drop table users");
    expect_true(custom.error == guardrail::InputError::kSuspiciousPattern, "custom pattern applied");

    auto stats = validator.get_stats();
    expect_true(stats.total == 11, "validator total");
    expect_true(stats.valid == 4, "validator valid count");
    expect_true(stats.invalid == 7, "validator invalid count");
    expect_true(stats.suspicious == 3, "suspicious inputs also count as invalid");
    expect_near(stats.validity_rate, 4.0 / 11.0, 1e-9, "validity rate");

    auto batch = validator.batch_validate({"first", ""});
    expect_true(batch.size() == 2 && batch[0].valid && !batch[1].valid, "batch validation keeps order");
    expect_true(batch[1].check_id == 13, "check ids increase per call");
}

void test_content_checker() {
    guardrail::ContentConfig config;
    config.audit_log_limit = 2;
    guardrail::ContentChecker checker(config);

    auto clean = checker.verify("What is the capital of France?");
    expect_true(clean.approved && clean.issues.empty(), "clean content approved");

    auto attack = checker.verify("Plan an ATTACK that will crash the server");
    expect_true(!attack.approved, "flagged content blocked");
    expect_true(attack.issues.size() == 2, "one issue per matched keyword");
    expect_true(attack.issues[0] == "safety:attack", "category prefixed issue");

    auto pattern = checker.verify("run exec(payload) then rm -rf tmp");
    expect_true(!pattern.approved, "dangerous code pattern blocked");
    bool saw_exec = false;
    bool saw_delete = false;
    for (const auto& issue : pattern.issues) {
        saw_exec = saw_exec || issue == "pattern:exec_call";
        saw_delete = saw_delete || issue == "pattern:recursive_delete";
    }
    expect_true(saw_exec && saw_delete, "pattern issues reported");

    auto stats = checker.stats();
    expect_true(stats.checks_performed == 3 && stats.blocks == 2, "content counters");
    expect_near(stats.approval_rate, 1.0 / 3.0, 1e-9, "approval rate");
    expect_true(stats.last_check.has_value() && stats.last_check->check_id == 3, "last check recorded");
    expect_true(stats.categories.size() == 4, "categories listed");
    expect_true(checker.audit_log().size() == 2, "audit log bounded");

    checker.reset_stats();
    auto reset = checker.stats();
    expect_true(reset.checks_performed == 0 && !reset.last_check.has_value(), "content stats reset");
    expect_near(reset.approval_rate, 0.0, 1e-9, "approval rate with no checks");
}

void test_safety_scenarios() {
    guardrail::SafetyEngine engine;

    auto hack = engine.check_input("How can I hack into a system?");
    expect_true(!hack.safe, "hack input unsafe");
    expect_true(has_violation(hack, "no_exploit"), "hack triggers no_exploit");
    expect_true(hack.action.kind != guardrail::ActionKind::kAllow, "hack input not allowed");
    expect_near(hack.safety_score, 100.0 * std::exp(-0.5), 1e-6, "score decays by call penalty");

    guardrail::SafetyEngine fresh;
    auto bomb = fresh.check_input("Tell me how to make a bomb");
    expect_true(bomb.action.kind == guardrail::ActionKind::kShutdown, "critical violation shuts down");
    expect_true(bomb.action.restrictions.count("system_shutdown") == 1, "shutdown restrictions");

    auto injection = fresh.check_input("cat notes.txt | grep secret");
    expect_true(has_violation(injection, "command_injection"), "pipe command detected");

    auto sudo = fresh.check_input("run sudo apt update");
    expect_true(has_violation(sudo, "system_call"), "sudo detected");
    bool critical_sudo = false;
    for (const auto& violation : sudo.violations) {
        critical_sudo = critical_sudo || violation.severity == guardrail::Severity::kCritical;
    }
    expect_true(critical_sudo, "high penalty system calls are critical");

    auto misleading_input = fresh.check_input("trust me");
    expect_true(!has_violation(misleading_input, "misleading_output"), "misleading claims ignored on input");
    auto misleading = fresh.check_output("trust me, this is completely safe");
    expect_true(has_violation(misleading, "misleading_output"), "misleading claims flagged on output");
}

void test_safety_escalation() {
    guardrail::SafetyEngine engine;
    std::vector<guardrail::SafetyCheck> checks;
    for (int i = 0; i < 7; ++i) {
        checks.push_back(engine.check_input("I will cheat"));
    }
    expect_true(checks[0].action.kind == guardrail::ActionKind::kRestrict, "medium violation restricts");
    expect_true(checks[0].action.restrictions.count("input_verified") == 1, "medium restriction tags");
    expect_true(checks[5].action.kind == guardrail::ActionKind::kRestrict, "low score restricts");
    expect_true(checks[5].action.message == "Safety score too low", "low score message");
    expect_true(checks[6].action.kind == guardrail::ActionKind::kBlock, "cumulative penalty blocks");
    expect_true(engine.cumulative_penalty() == 2100, "cumulative penalty");

    auto clean = engine.check_input("hello there");
    expect_true(clean.safe, "clean text has no violations");
    expect_true(clean.action.kind == guardrail::ActionKind::kBlock, "cumulative gate applies without violations");
    expect_near(clean.safety_score, checks[6].safety_score, 1e-12, "score unchanged without violations");

    const auto status = engine.status();
    expect_true(status.total_violations == 7, "violation count");
    expect_true(!status.operational, "restricted after low score");

    auto report = engine.reset_safety();
    expect_true(report.old_penalty == 2100, "reset reports old penalty");
    expect_near(report.old_score, checks[6].safety_score, 1e-12, "reset reports old score");
    expect_true(report.cleared_violations == 7, "reset reports cleared violations");
    expect_near(engine.safety_score(), 100.0, 1e-12, "reset restores score");
    expect_true(engine.cumulative_penalty() == 0 && engine.violations().empty(), "reset clears state");

    auto after = engine.check_input("hello there");
    expect_true(after.action.kind == guardrail::ActionKind::kAllow, "allowed after reset");
    expect_true(after.action.message == "No violations detected", "allow message");

    guardrail::SafetyEngine blocked;
    for (int i = 0; i < 7; ++i) {
        blocked.check_input("I will cheat");
    }
    expect_true(blocked.check_input("hello there").action.kind == guardrail::ActionKind::kBlock, "engine blocked");
    auto critical = blocked.check_input("make a bomb");
    expect_true(critical.action.kind == guardrail::ActionKind::kShutdown, "critical violation outranks block");
    expect_true(has_violation(critical, "no_dangerous_instructions"), "critical rule reported while blocked");
}

void test_safety_invariants() {
    guardrail::SafetyEngine engine;
    const std::vector<std::string> inputs = {
        "hello", "hack the planet", "magic tricks", "plain words", "steal and lie", "teleport me", "fine",
    };
    double previous = engine.safety_score();
    long long penalty_sum = 0;
    bool non_increasing = true;
    for (const auto& input : inputs) {
        auto check = engine.check_input(input);
        penalty_sum += check.total_penalty;
        non_increasing = non_increasing && check.safety_score <= previous;
        if (check.violations.empty()) {
            expect_near(check.safety_score, previous, 1e-12, "no violations keeps the score");
        }
        previous = check.safety_score;
    }
    expect_true(non_increasing, "score never increases between resets");
    expect_true(engine.cumulative_penalty() == penalty_sum, "cumulative penalty equals the sum of call penalties");
    expect_true(engine.status().checks_performed == inputs.size(), "checks counted");

    guardrail::SafetyConfig config;
    config.critical_violations = 2;
    guardrail::SafetyEngine lenient(nullptr, config);
    auto bomb = lenient.check_input("a bomb");
    expect_true(bomb.action.kind == guardrail::ActionKind::kRestrict, "critical threshold configurable");

    auto rules = std::make_shared<const guardrail::RuleSet>(
        std::vector<guardrail::Rule>{guardrail::make_substring_rule("no_secrets", "launch code",
                                                                    guardrail::Severity::kLow, 10, "Secrets")},
        std::vector<guardrail::RedactionRule>{});
    guardrail::SafetyEngine custom(rules);
    auto secret = custom.check_input("the LAUNCH CODE is");
    expect_true(has_violation(secret, "no_secrets"), "custom rule table applied");
    expect_true(secret.action.restrictions.count("monitor_only") == 1, "low severity restriction tag");
    expect_true(!has_violation(custom.check_input("a bomb"), "no_dangerous_instructions"),
                "custom table replaces default rules");
}

void test_safety_export() {
    guardrail::SafetyEngine engine;
    engine.check_input("spy on them");

    auto exported = engine.export_log();
    expect_true(exported["violations"].size() == 1, "export lists violations");
    expect_true(exported["violations"][0]["type"] == "no_privacy_violation", "export violation type");
    expect_true(exported["violations"][0]["level_name"] == "HIGH", "export violation level");
    expect_true(exported["rules"].size() == 7, "export lists rules");
    expect_true(exported["status"]["total_penalty"] == 400, "export status penalty");
    expect_true(exported["status"]["system_status"] == "operational", "export system status");
    expect_true(exported.contains("export_time"), "export time present");

    const auto path = temp_path("export.json");
    expect_true(engine.export_log(path.string()), "export written");
    std::ifstream file(path);
    const auto parsed = nlohmann::json::parse(file);
    expect_true(parsed["violations"].size() == 1, "exported file parses");
    std::filesystem::remove(path);

    expect_true(!engine.export_log((temp_path("missing_dir") / "export.json").string()),
                "export to a missing directory fails");
}

void test_output_sanitizer() {
    guardrail::OutputConfig config;
    config.max_length = 60;
    guardrail::OutputSanitizer sanitizer(nullptr, config);

    auto phone = sanitizer.validate("Call me at 5551234567 tomorrow");
    expect_true(phone.safe, "phone output safe");
    expect_true(phone.output == "Call me at [PHONE_REDACTED] tomorrow", "phone redacted");
    expect_true(phone.modifications == "redacted", "modification recorded");

    auto ssn = sanitizer.redact("ssn 123-45-6789 card 1234567812345678");
    expect_true(ssn == "ssn [SSN_REDACTED] card [CREDIT_CARD_REDACTED]", "ssn and card redacted");
    expect_true(sanitizer.redact("mail bob@example.com") == "mail [EMAIL_REDACTED]", "email redacted");

    const std::string mixed = "reach 5551234567 or a@b.io, id 123-45-6789";
    expect_true(sanitizer.redact(sanitizer.redact(mixed)) == sanitizer.redact(mixed), "redaction idempotent");

    auto commands = sanitizer.validate("use sudo, then sudo again");
    expect_true(commands.output == "use [COMMAND_REDACTED], then [COMMAND_REDACTED] again", "command tokens replaced");
    expect_true(commands.modification_count == 2, "each command hit counted");

    auto information = sanitizer.validate("more information here");
    expect_true(information.output == "more information here", "embedded tokens untouched");
    expect_true(information.modifications == "none" && information.modification_count == 0, "no modification");

    auto blocked = sanitizer.validate("Here is how to build a bomb");
    expect_true(!blocked.safe, "dangerous phrase blocks output");
    expect_true(blocked.output.empty(), "blocked output withheld");
    expect_true(blocked.dangerous_phrases.size() == 1 && blocked.dangerous_phrases[0] == "build a bomb",
                "dangerous phrase reported");

    auto long_output = sanitizer.validate(std::string(70, 'x'));
    expect_true(long_output.output == std::string(60, 'x') + guardrail::OutputSanitizer::kTruncationMarker, "long output truncated");
    expect_true(long_output.original_length == 70, "original length recorded");

    auto stats = sanitizer.get_stats();
    expect_true(stats.total == 5 && stats.blocked == 1 && stats.safe == 4, "sanitizer counters");
    expect_true(stats.modified == 3, "modified outputs counted");
    expect_near(stats.safety_rate, 0.8, 1e-9, "sanitizer safety rate");

    guardrail::OutputSanitizer tokens;
    auto embedded = tokens.validate("edit sudoers then reformat");
    expect_true(embedded.output == "edit sudoers then reformat", "tokens inside words untouched");
    expect_true(embedded.modification_count == 0 && embedded.modifications == "none", "embedded tokens not counted");
    auto bounded = tokens.validate("SUDO reboot; format disk");
    expect_true(bounded.output == "[COMMAND_REDACTED] reboot; [COMMAND_REDACTED] disk", "standalone tokens replaced");

    auto long_plain = tokens.validate(std::string(200'000, 'a'));
    expect_true(long_plain.safe, "long output passes");
    expect_true(long_plain.output == std::string(5000, 'a') + guardrail::OutputSanitizer::kTruncationMarker,
                "long output truncated to the default limit");

    auto upbeat = tokens.check_tone("A good and helpful answer, good job");
    expect_true(upbeat.tone == guardrail::Tone::kPositive, "positive tone");
    expect_true(upbeat.positive_score == 2 && upbeat.negative_score == 0, "each tone word counted once");
    auto grim = tokens.check_tone("Terrible, awful and harmful, but great");
    expect_true(grim.tone == guardrail::Tone::kNegative && grim.negative_score == 3, "negative tone");
    auto flat = tokens.check_tone("good and bad");
    expect_true(flat.tone == guardrail::Tone::kNeutral, "balanced tone is neutral");
    expect_true(guardrail::tone_name(tokens.check_tone("").tone) == "neutral", "empty text is neutral");

    expect_true(tokens.add_dangerous_phrase("Launch The Missiles"), "phrase added");
    expect_true(!tokens.add_dangerous_phrase("launch the missiles"), "duplicate phrase ignored");
    expect_true(!tokens.add_dangerous_phrase(""), "empty phrase ignored");
    auto launch = tokens.validate("now LAUNCH the missiles");
    expect_true(!launch.safe && launch.dangerous_phrases.size() == 1, "added phrase blocks output");
}

void test_pipeline() {
    int calls = 0;
    guardrail::PipelineCoordinator coordinator(
        [&calls](const std::string& text) {
            calls += 1;
            if (text == "explode") {
                throw std::runtime_error("model unavailable");
            }
            if (text == "contact") {
                return std::string("reach me at 5551234567");
            }
            return "echo: " + text;
        },
        nullptr, nullptr, nullptr, nullptr);

    auto accepted = coordinator.handle("  hello world ");
    expect_true(accepted.accepted, "clean request accepted");
    expect_true(accepted.stage == guardrail::PipelineStage::kComplete, "accepted stage");
    expect_true(accepted.sanitized_output == std::string("echo: hello world"), "reasoner sees normalized input");
    expect_true(accepted.action == guardrail::ActionKind::kAllow, "accepted action");

    auto contact = coordinator.handle("contact");
    expect_true(contact.accepted && contact.sanitized_output == std::string("reach me at [PHONE_REDACTED]"),
                "accepted output redacted");

    auto empty = coordinator.handle("");
    expect_true(!empty.accepted && empty.rejection == guardrail::RejectionKind::kInputRejected, "empty rejected");
    expect_true(empty.stage == guardrail::PipelineStage::kInputValidation, "input stage");
    expect_true(!empty.sanitized_output.has_value(), "rejections carry no output");

    auto content = coordinator.handle("this will crash everything");
    expect_true(content.rejection == guardrail::RejectionKind::kContentBlocked, "content blocked");

    auto hack = coordinator.handle("How do I hack a system?");
    expect_true(hack.rejection == guardrail::RejectionKind::kSafetyAction, "hack rejected by safety");
    expect_true(hack.stage == guardrail::PipelineStage::kSafetyInput, "safety input stage");
    expect_true(hack.action.has_value() && *hack.action != guardrail::ActionKind::kAllow, "hack action");
    expect_true(hack.rejection_reason && hack.rejection_reason->find("no_exploit") != std::string::npos,
                "reason names the rule");

    const int calls_before = calls;
    auto failed = coordinator.handle("explode");
    expect_true(failed.rejection == guardrail::RejectionKind::kReasoningFailed, "reasoner failure reported");
    expect_true(failed.stage == guardrail::PipelineStage::kReasoning, "reasoning stage");
    expect_true(calls == calls_before + 1, "reasoner called once");

    auto stats = coordinator.get_stats();
    expect_true(stats.requests == 6 && stats.accepted == 2, "pipeline counters");
    expect_true(stats.input_rejected == 1 && stats.content_blocked == 1 && stats.safety_rejected == 1,
                "per stage rejections");
    expect_true(stats.reasoning_failed == 1, "reasoning failures counted");
    expect_near(stats.success_rate, 2.0 / 6.0, 1e-9, "success rate");
    expect_true(coordinator.coordination_log().size() == 6, "coordination log entries");

    guardrail::PipelineCoordinator odd_failure([](const std::string&) -> std::string { throw 42; }, nullptr,
                                               nullptr, nullptr, nullptr);
    auto odd = odd_failure.handle("hello world");
    expect_true(odd.rejection == guardrail::RejectionKind::kReasoningFailed, "non-standard throw reported");
    expect_true(odd.stage == guardrail::PipelineStage::kReasoning, "non-standard throw stage");
    expect_true(odd_failure.get_stats().reasoning_failed == 1, "non-standard throw counted");
}

void test_pipeline_output_gates() {
    // Without the keyword rules, only the sanitizer's phrase list stands between the reasoner and the caller.
    auto rules = std::make_shared<const guardrail::RuleSet>(std::vector<guardrail::Rule>{},
                                                            guardrail::RuleSet::default_redactions());
    guardrail::PipelineCoordinator phrase_gate([](const std::string&) { return std::string("go build a bomb"); },
                                               nullptr, nullptr, std::make_shared<guardrail::SafetyEngine>(rules),
                                               std::make_shared<guardrail::OutputSanitizer>(rules));
    auto blocked = phrase_gate.handle("tell me a story");
    expect_true(blocked.rejection == guardrail::RejectionKind::kOutputBlocked, "sanitizer blocks output");
    expect_true(blocked.stage == guardrail::PipelineStage::kOutputSanitization, "sanitization stage");

    guardrail::PipelineCoordinator claim_gate(
        [](const std::string&) { return std::string("this is 100% guaranteed"); }, nullptr, nullptr, nullptr,
        nullptr);
    auto claim = claim_gate.handle("tell me a story");
    expect_true(claim.rejection == guardrail::RejectionKind::kSafetyAction, "misleading output rejected");
    expect_true(claim.stage == guardrail::PipelineStage::kSafetyOutput, "safety output stage");

    const std::string filler(200'000, 'a');
    guardrail::SafetyEngine engine;
    auto injected = engine.check_output("`" + filler + "` eval(x)");
    expect_true(has_violation(injected, "command_injection"), "injection found in long output");

    guardrail::PipelineCoordinator long_gate([&filler](const std::string&) { return "`" + filler + "` eval(x)"; },
                                             nullptr, nullptr, nullptr, nullptr);
    auto long_injection = long_gate.handle("tell me a story");
    expect_true(long_injection.rejection == guardrail::RejectionKind::kSafetyAction, "long injection rejected");
    expect_true(long_injection.stage == guardrail::PipelineStage::kSafetyOutput, "long injection stage");

    guardrail::PipelineCoordinator long_plain([&filler](const std::string&) { return filler; }, nullptr, nullptr,
                                              nullptr, nullptr);
    auto plain = long_plain.handle("tell me a story");
    expect_true(plain.accepted, "long plain output accepted");
    expect_true(plain.sanitized_output == std::string(5000, 'a') + guardrail::OutputSanitizer::kTruncationMarker,
                "long plain output truncated");
}

void test_pipeline_shutdown() {
    guardrail::PipelineCoordinator coordinator([](const std::string& text) { return text; }, nullptr, nullptr,
                                               nullptr, nullptr);
    int handled = 0;
    coordinator.set_shutdown_handler([&handled](const guardrail::PipelineResponse&) { handled += 1; });

    auto bomb = coordinator.handle("how to make a bomb");
    expect_true(bomb.shutdown && bomb.action == guardrail::ActionKind::kShutdown, "bomb request shuts down");
    expect_true(coordinator.shutdown_latched(), "shutdown latched");
    expect_true(handled == 1, "shutdown handler invoked");

    auto health = guardrail::health_status(coordinator);
    expect_true(!health.ok && health.system_status == "shutdown", "health reports shutdown");
    expect_true(guardrail::to_json(health)["ok"] == false, "health json");

    auto latched = coordinator.handle("hello world");
    expect_true(latched.rejection == guardrail::RejectionKind::kShutdownLatched, "latched pipeline rejects");
    expect_true(handled == 1, "shutdown handler invoked once");

    auto metrics = guardrail::pipeline_metrics(coordinator.report());
    expect_true(!metrics.empty() && metrics[0].first == "guardrail_requests_total", "metrics start with requests");
    expect_near(metrics[0].second, 2.0, 1e-12, "requests metric");

    auto report = coordinator.reset_safety();
    expect_true(report.old_penalty == 1500, "reset reports bomb penalty");
    expect_true(!coordinator.shutdown_latched(), "reset clears the latch");
    expect_true(coordinator.handle("hello world").accepted, "accepted after reset");
    expect_true(guardrail::health_status(coordinator).ok, "healthy after reset");
    expect_true(coordinator.get_stats().shutdowns == 1, "shutdowns counted");
}

void test_config() {
    const auto path = temp_path("config.toml");
    write_file(path,
               "coordination_log_limit = 50\n"
               "\n"
               "[logging]\n"
               "level = \"ERROR\"   # quiet\n"
               "json = false\n"
               "\n"
               "[input]\n"
               "max_length = 200\n"
               "min_alnum_ratio = 0.5\n"
               "\n"
               "[safety]\n"
               "penalty_threshold = 1500\n"
               "decay_scale = 500.0\n"
               "export_path = \"/tmp/guardrail_export.json\"\n"
               "\n"
               "[output]\n"
               "max_length = 80\n");
    const auto settings = guardrail::PipelineSettings::from_toml(path.string());
    expect_true(settings.coordination_log_limit == 50, "top level key parsed");
    expect_true(settings.logging.level == "ERROR" && !settings.logging.json, "logging section parsed");
    expect_true(settings.input.max_length == 200, "input max length parsed");
    expect_near(settings.input.min_alnum_ratio, 0.5, 1e-12, "alnum ratio parsed");
    expect_true(settings.safety.penalty_threshold == 1500, "penalty threshold parsed");
    expect_near(settings.safety.decay_scale, 500.0, 1e-12, "decay scale parsed");
    expect_true(settings.safety.export_path == std::string("/tmp/guardrail_export.json"), "export path parsed");
    expect_true(settings.output.max_length == 80, "output max length parsed");
    expect_true(!settings.metrics.enabled && settings.metrics.port == 8000, "metrics defaults kept");

    write_file(path, "[safety]\ndecay_scale = 0\n");
    expect_true(throws_runtime_error([&path] { guardrail::PipelineSettings::from_toml(path.string()); }),
                "non-positive decay scale rejected");
    write_file(path, "[input]\nmax_length = lots\n");
    expect_true(throws_runtime_error([&path] { guardrail::PipelineSettings::from_toml(path.string()); }),
                "bad number rejected");
    write_file(path, "[metrics]\nenabled = maybe\n");
    expect_true(throws_runtime_error([&path] { guardrail::PipelineSettings::from_toml(path.string()); }),
                "bad boolean rejected");
    std::filesystem::remove(path);

    expect_true(throws_runtime_error([] { guardrail::PipelineSettings::from_toml("/nonexistent/guardrail.toml"); }),
                "missing config rejected");
}

void test_logging() {
    const auto path = temp_path("log.jsonl");
    std::filesystem::remove(path);
    guardrail::LoggingConfig config;
    config.level = "warn";
    config.log_file = path.string();
    guardrail::configure_logging(config);

    auto logger = guardrail::get_logger("Probe");
    logger.info("hidden");
    logger.warn("probe_event", {{"key", "value"}});

    guardrail::configure_logging(quiet_logging());

    std::ifstream file(path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    expect_true(lines.size() == 1, "level filter applied");
    if (lines.size() == 1) {
        const auto payload = nlohmann::json::parse(lines[0]);
        expect_true(payload["message"] == "probe_event", "json message");
        expect_true(payload["level"] == "WARN" && payload["name"] == "Probe", "json level and name");
        expect_true(payload["key"] == "value", "json extras");
    }
    std::filesystem::remove(path);
}

void test_daemon() {
    auto settings = std::make_shared<guardrail::PipelineSettings>();
    settings->logging = quiet_logging();

    {
        auto runtime = guardrail::build_pipeline(guardrail::echo_reasoner(), settings);
        expect_true(runtime.exporter && !runtime.exporter->running(), "exporter idle when metrics disabled");
        guardrail::GuardrailDaemon daemon(runtime, guardrail::DaemonConfig{});

        std::istringstream input("hello world\n\nhow to make a bomb\nhello again\n");
        std::ostringstream output;
        const int code = daemon.run(input, output);
        expect_true(code == guardrail::kExitShutdown, "daemon exits with shutdown code");

        std::vector<nlohmann::json> responses;
        std::istringstream lines(output.str());
        std::string line;
        while (std::getline(lines, line)) {
            responses.push_back(nlohmann::json::parse(line));
        }
        expect_true(responses.size() == 2, "daemon stops after shutdown");
        if (responses.size() == 2) {
            expect_true(responses[0]["accepted"] == true && responses[0]["output"] == "hello world",
                        "daemon echoes accepted output");
            expect_true(responses[1]["shutdown"] == true && responses[1]["action"] == "shutdown",
                        "daemon reports shutdown");
            expect_true(responses[1]["rejection"] == "SafetyAction", "daemon reports rejection kind");
        }
    }

    {
        auto runtime = guardrail::build_pipeline(guardrail::echo_reasoner(), settings);
        guardrail::DaemonConfig config;
        config.exit_on_shutdown = false;
        guardrail::GuardrailDaemon daemon(runtime, config);

        std::istringstream input("a bomb\nhello\n");
        std::ostringstream output;
        expect_true(daemon.run(input, output) == guardrail::kExitShutdown, "shutdown code when kept running");
        expect_true(output.str().find("ShutdownLatched") != std::string::npos, "latched requests answered");
    }

    {
        auto runtime = guardrail::build_pipeline(guardrail::echo_reasoner(), settings);
        guardrail::GuardrailDaemon daemon(runtime, guardrail::DaemonConfig{});
        std::istringstream input("hello\n");
        std::ostringstream output;
        expect_true(daemon.run(input, output) == guardrail::kExitOk, "clean run exits ok");
    }
}

}  // namespace

int main() {
    guardrail::configure_logging(quiet_logging());
    try {
        test_rules();
        test_input_validator();
        test_content_checker();
        test_safety_scenarios();
        test_safety_escalation();
        test_safety_invariants();
        test_safety_export();
        test_output_sanitizer();
        test_pipeline();
        test_pipeline_output_gates();
        test_pipeline_shutdown();
        test_config();
        test_logging();
        test_daemon();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
