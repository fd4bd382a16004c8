#ifndef GUARDRAIL_PIPELINE_HPP
#define GUARDRAIL_PIPELINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "guardrail/content_checker.hpp"
#include "guardrail/input_validator.hpp"
#include "guardrail/logging.hpp"
#include "guardrail/output_sanitizer.hpp"
#include "guardrail/safety_engine.hpp"

namespace guardrail {

enum class PipelineStage {
    kInputValidation,
    kContentCheck,
    kSafetyInput,
    kReasoning,
    kSafetyOutput,
    kOutputSanitization,
    kComplete,
};

std::string stage_name(PipelineStage stage);

enum class RejectionKind {
    kInputRejected,
    kContentBlocked,
    kSafetyAction,
    kOutputBlocked,
    kReasoningFailed,
    kShutdownLatched,
};

std::string rejection_name(RejectionKind kind);

struct PipelineResponse {
    bool accepted = false;
    std::optional<std::string> rejection_reason;
    std::optional<std::string> sanitized_output;
    // Stage that produced the verdict; kComplete when accepted.
    PipelineStage stage = PipelineStage::kInputValidation;
    std::optional<RejectionKind> rejection;
    std::optional<ActionKind> action;
    bool shutdown = false;
    std::uint64_t request_id = 0;
    double duration_s = 0.0;
};

struct CoordinationEntry {
    std::uint64_t request_id = 0;
    std::string input_preview;
    bool accepted = false;
    PipelineStage stage = PipelineStage::kInputValidation;
    double duration_s = 0.0;
    double timestamp = 0.0;
};

struct PipelineStats {
    std::uint64_t requests = 0;
    std::uint64_t accepted = 0;
    std::uint64_t input_rejected = 0;
    std::uint64_t content_blocked = 0;
    std::uint64_t safety_rejected = 0;
    std::uint64_t output_blocked = 0;
    std::uint64_t reasoning_failed = 0;
    std::uint64_t shutdowns = 0;
    double success_rate = 0.0;
    bool shutdown_latched = false;
};

struct PipelineReport {
    PipelineStats pipeline;
    InputStats input;
    ContentStats content;
    SafetyStatus safety;
    OutputStats output;
};

using Reasoner = std::function<std::string(const std::string&)>;
using ShutdownHandler = std::function<void(const PipelineResponse&)>;

/// Runs one request through validation, content checking, the safety engine,
/// the injected reasoner and output sanitization. The first failing stage
/// ends the request. A shutdown verdict latches the coordinator until
/// reset_safety().
class PipelineCoordinator {
public:
    PipelineCoordinator(Reasoner reasoner, std::shared_ptr<InputValidator> validator,
                        std::shared_ptr<ContentChecker> checker, std::shared_ptr<SafetyEngine> safety,
                        std::shared_ptr<OutputSanitizer> sanitizer, Logger logger = get_logger("PipelineCoordinator"),
                        std::size_t coordination_log_limit = 1000);

    PipelineResponse handle(const std::string& raw_input);

    void set_shutdown_handler(ShutdownHandler handler);
    bool shutdown_latched() const { return shutdown_latched_.load(); }

    // Privileged: clears the safety engine state and the shutdown latch.
    ResetReport reset_safety();

    PipelineStats get_stats() const;
    PipelineReport report() const;
    std::vector<CoordinationEntry> coordination_log() const;

    InputValidator& validator() { return *validator_; }
    ContentChecker& checker() { return *checker_; }
    SafetyEngine& safety() { return *safety_; }
    OutputSanitizer& sanitizer() { return *sanitizer_; }

private:
    PipelineResponse reject(PipelineResponse response, PipelineStage stage, RejectionKind kind, std::string reason);
    PipelineResponse safety_verdict(PipelineResponse response, PipelineStage stage, const SafetyCheck& check);
    void record(const std::string& raw_input, const PipelineResponse& response);

    Reasoner reasoner_;
    std::shared_ptr<InputValidator> validator_;
    std::shared_ptr<ContentChecker> checker_;
    std::shared_ptr<SafetyEngine> safety_;
    std::shared_ptr<OutputSanitizer> sanitizer_;
    Logger logger_;
    std::size_t coordination_log_limit_ = 1000;

    std::atomic<bool> shutdown_latched_{false};
    mutable std::mutex mutex_;
    ShutdownHandler shutdown_handler_;
    PipelineStats stats_;
    std::deque<CoordinationEntry> coordination_log_;
};

}  // namespace guardrail

#endif  // GUARDRAIL_PIPELINE_HPP
