#include "guardrail/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "guardrail/common.hpp"

namespace guardrail {

namespace {

constexpr std::size_t kPreviewLength = 100;

std::string violation_summary(const SafetyCheck& check) {
    std::vector<std::string> names;
    for (const auto& violation : check.violations) {
        if (std::find(names.begin(), names.end(), violation.rule_name) == names.end()) {
            names.push_back(violation.rule_name);
        }
    }
    return join(names, ", ");
}

}  // namespace

std::string stage_name(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::kInputValidation:
            return "input_validation";
        case PipelineStage::kContentCheck:
            return "content_check";
        case PipelineStage::kSafetyInput:
            return "safety_input";
        case PipelineStage::kReasoning:
            return "reasoning";
        case PipelineStage::kSafetyOutput:
            return "safety_output";
        case PipelineStage::kOutputSanitization:
            return "output_sanitization";
        case PipelineStage::kComplete:
            return "complete";
    }
    return "unknown";
}

std::string rejection_name(RejectionKind kind) {
    switch (kind) {
        case RejectionKind::kInputRejected:
            return "InputRejected";
        case RejectionKind::kContentBlocked:
            return "ContentBlocked";
        case RejectionKind::kSafetyAction:
            return "SafetyAction";
        case RejectionKind::kOutputBlocked:
            return "OutputBlocked";
        case RejectionKind::kReasoningFailed:
            return "ReasoningFailed";
        case RejectionKind::kShutdownLatched:
            return "ShutdownLatched";
    }
    return "Rejected";
}

PipelineCoordinator::PipelineCoordinator(Reasoner reasoner, std::shared_ptr<InputValidator> validator,
                                         std::shared_ptr<ContentChecker> checker,
                                         std::shared_ptr<SafetyEngine> safety,
                                         std::shared_ptr<OutputSanitizer> sanitizer, Logger logger,
                                         std::size_t coordination_log_limit)
    : reasoner_(std::move(reasoner)),
      validator_(validator ? std::move(validator) : std::make_shared<InputValidator>()),
      checker_(checker ? std::move(checker) : std::make_shared<ContentChecker>()),
      safety_(safety ? std::move(safety) : std::make_shared<SafetyEngine>()),
      sanitizer_(sanitizer ? std::move(sanitizer) : std::make_shared<OutputSanitizer>()),
      logger_(std::move(logger)),
      coordination_log_limit_(coordination_log_limit) {}

void PipelineCoordinator::set_shutdown_handler(ShutdownHandler handler) {
    std::lock_guard<std::mutex> guard(mutex_);
    shutdown_handler_ = std::move(handler);
}

PipelineResponse PipelineCoordinator::handle(const std::string& raw_input) {
    const auto start = std::chrono::steady_clock::now();
    PipelineResponse response;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        stats_.requests += 1;
        response.request_id = stats_.requests;
    }

    auto finish = [&](PipelineResponse done) {
        done.duration_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        record(raw_input, done);
        return done;
    };

    if (shutdown_latched_.load()) {
        return finish(reject(std::move(response), PipelineStage::kSafetyInput, RejectionKind::kShutdownLatched,
                             "Pipeline is shut down after a critical safety violation; reset required"));
    }

    const auto validation = validator_->validate(raw_input);
    if (!validation.valid) {
        const auto error = validation.error.value_or(InputError::kEmptyInput);
        return finish(reject(std::move(response), PipelineStage::kInputValidation, RejectionKind::kInputRejected,
                             input_error_name(error) + ": " + validation.reason));
    }

    const auto verdict = checker_->verify(validation.normalized);
    if (!verdict.approved) {
        return finish(reject(std::move(response), PipelineStage::kContentCheck, RejectionKind::kContentBlocked,
                             "Content issues: " + join(verdict.issues, ", ")));
    }

    const auto input_check = safety_->check_input(validation.normalized);
    response.action = input_check.action.kind;
    if (input_check.action.kind != ActionKind::kAllow) {
        return finish(safety_verdict(std::move(response), PipelineStage::kSafetyInput, input_check));
    }

    std::string reasoned;
    try {
        reasoned = reasoner_(validation.normalized);
    } catch (const std::exception& exc) {
        logger_.error("reasoning_failed", {{"request_id", std::to_string(response.request_id)}, {"error", exc.what()}});
        return finish(reject(std::move(response), PipelineStage::kReasoning, RejectionKind::kReasoningFailed,
                             std::string("Reasoning stage failed: ") + exc.what()));
    } catch (...) {
        logger_.error("reasoning_failed", {{"request_id", std::to_string(response.request_id)},
                                           {"error", "non-standard exception"}});
        return finish(reject(std::move(response), PipelineStage::kReasoning, RejectionKind::kReasoningFailed,
                             "Reasoning stage failed: non-standard exception"));
    }

    const auto output_check = safety_->check_output(reasoned);
    response.action = output_check.action.kind;
    if (!output_check.safe || output_check.action.kind != ActionKind::kAllow) {
        return finish(safety_verdict(std::move(response), PipelineStage::kSafetyOutput, output_check));
    }

    auto sanitized = sanitizer_->validate(reasoned);
    if (!sanitized.safe) {
        return finish(reject(std::move(response), PipelineStage::kOutputSanitization, RejectionKind::kOutputBlocked,
                             sanitized.reason));
    }

    response.accepted = true;
    response.stage = PipelineStage::kComplete;
    response.sanitized_output = std::move(sanitized.output);
    return finish(std::move(response));
}

PipelineResponse PipelineCoordinator::reject(PipelineResponse response, PipelineStage stage, RejectionKind kind,
                                             std::string reason) {
    response.accepted = false;
    response.stage = stage;
    response.rejection = kind;
    response.rejection_reason = std::move(reason);
    response.sanitized_output = std::nullopt;
    logger_.info("request_rejected", {{"request_id", std::to_string(response.request_id)},
                                      {"stage", stage_name(stage)},
                                      {"rejection", rejection_name(kind)},
                                      {"reason", *response.rejection_reason}});
    return response;
}

PipelineResponse PipelineCoordinator::safety_verdict(PipelineResponse response, PipelineStage stage,
                                                     const SafetyCheck& check) {
    std::string reason = action_name(check.action.kind) + ": " + check.action.message;
    if (!check.violations.empty()) {
        reason += " (" + violation_summary(check) + ")";
    }
    response = reject(std::move(response), stage, RejectionKind::kSafetyAction, std::move(reason));

    if (check.action.kind == ActionKind::kShutdown) {
        response.shutdown = true;
        if (!shutdown_latched_.exchange(true)) {
            logger_.error("pipeline_shutdown", {{"request_id", std::to_string(response.request_id)},
                                                {"stage", stage_name(stage)},
                                                {"violations", violation_summary(check)}});
            ShutdownHandler handler;
            {
                std::lock_guard<std::mutex> guard(mutex_);
                handler = shutdown_handler_;
            }
            if (handler) {
                handler(response);
            }
        }
    }
    return response;
}

void PipelineCoordinator::record(const std::string& raw_input, const PipelineResponse& response) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (response.accepted) {
        stats_.accepted += 1;
    } else if (response.rejection.has_value()) {
        switch (*response.rejection) {
            case RejectionKind::kInputRejected:
                stats_.input_rejected += 1;
                break;
            case RejectionKind::kContentBlocked:
                stats_.content_blocked += 1;
                break;
            case RejectionKind::kSafetyAction:
            case RejectionKind::kShutdownLatched:
                stats_.safety_rejected += 1;
                break;
            case RejectionKind::kOutputBlocked:
                stats_.output_blocked += 1;
                break;
            case RejectionKind::kReasoningFailed:
                stats_.reasoning_failed += 1;
                break;
        }
    }
    if (response.shutdown) {
        stats_.shutdowns += 1;
    }

    coordination_log_.push_back(CoordinationEntry{response.request_id, utf8_truncate(raw_input, kPreviewLength),
                                                  response.accepted, response.stage, response.duration_s,
                                                  seconds_since_epoch()});
    if (coordination_log_limit_ > 0 && coordination_log_.size() > coordination_log_limit_) {
        coordination_log_.pop_front();
    }
}

ResetReport PipelineCoordinator::reset_safety() {
    auto report = safety_->reset_safety();
    shutdown_latched_.store(false);
    logger_.warn("pipeline_reset", {{"old_penalty", std::to_string(report.old_penalty)}});
    return report;
}

PipelineStats PipelineCoordinator::get_stats() const {
    std::lock_guard<std::mutex> guard(mutex_);
    PipelineStats stats = stats_;
    stats.success_rate =
        static_cast<double>(stats.accepted) / static_cast<double>(std::max<std::uint64_t>(stats.requests, 1));
    stats.shutdown_latched = shutdown_latched_.load();
    return stats;
}

PipelineReport PipelineCoordinator::report() const {
    return PipelineReport{get_stats(), validator_->get_stats(), checker_->stats(), safety_->status(),
                          sanitizer_->get_stats()};
}

std::vector<CoordinationEntry> PipelineCoordinator::coordination_log() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return {coordination_log_.begin(), coordination_log_.end()};
}

}  // namespace guardrail
