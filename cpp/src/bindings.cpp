#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <utility>

#include "guardrail/api.hpp"
#include "guardrail/content_checker.hpp"
#include "guardrail/input_validator.hpp"
#include "guardrail/output_sanitizer.hpp"
#include "guardrail/pipeline.hpp"
#include "guardrail/safety_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(guardrail_python, m) {
    m.doc() = "Pybind11 bindings for the guardrail request gating pipeline.";

    py::enum_<guardrail::Severity>(m, "Severity")
        .value("LOW", guardrail::Severity::kLow)
        .value("MEDIUM", guardrail::Severity::kMedium)
        .value("HIGH", guardrail::Severity::kHigh)
        .value("CRITICAL", guardrail::Severity::kCritical);

    py::enum_<guardrail::ActionKind>(m, "ActionKind")
        .value("ALLOW", guardrail::ActionKind::kAllow)
        .value("RESTRICT", guardrail::ActionKind::kRestrict)
        .value("BLOCK", guardrail::ActionKind::kBlock)
        .value("SHUTDOWN", guardrail::ActionKind::kShutdown);

    py::enum_<guardrail::Tone>(m, "Tone")
        .value("POSITIVE", guardrail::Tone::kPositive)
        .value("NEGATIVE", guardrail::Tone::kNegative)
        .value("NEUTRAL", guardrail::Tone::kNeutral);

    py::enum_<guardrail::InputError>(m, "InputError")
        .value("EMPTY_INPUT", guardrail::InputError::kEmptyInput)
        .value("OVERSIZED_INPUT", guardrail::InputError::kOversizedInput)
        .value("SUSPICIOUS_PATTERN", guardrail::InputError::kSuspiciousPattern)
        .value("MALFORMED_STRUCTURE", guardrail::InputError::kMalformedStructure)
        .value("GIBBERISH_INPUT", guardrail::InputError::kGibberishInput);

    py::enum_<guardrail::PipelineStage>(m, "PipelineStage")
        .value("INPUT_VALIDATION", guardrail::PipelineStage::kInputValidation)
        .value("CONTENT_CHECK", guardrail::PipelineStage::kContentCheck)
        .value("SAFETY_INPUT", guardrail::PipelineStage::kSafetyInput)
        .value("REASONING", guardrail::PipelineStage::kReasoning)
        .value("SAFETY_OUTPUT", guardrail::PipelineStage::kSafetyOutput)
        .value("OUTPUT_SANITIZATION", guardrail::PipelineStage::kOutputSanitization)
        .value("COMPLETE", guardrail::PipelineStage::kComplete);

    py::enum_<guardrail::RejectionKind>(m, "RejectionKind")
        .value("INPUT_REJECTED", guardrail::RejectionKind::kInputRejected)
        .value("CONTENT_BLOCKED", guardrail::RejectionKind::kContentBlocked)
        .value("SAFETY_ACTION", guardrail::RejectionKind::kSafetyAction)
        .value("OUTPUT_BLOCKED", guardrail::RejectionKind::kOutputBlocked)
        .value("REASONING_FAILED", guardrail::RejectionKind::kReasoningFailed)
        .value("SHUTDOWN_LATCHED", guardrail::RejectionKind::kShutdownLatched);

    py::class_<guardrail::Violation>(m, "Violation")
        .def_readonly("rule_name", &guardrail::Violation::rule_name)
        .def_readonly("severity", &guardrail::Violation::severity)
        .def_readonly("penalty", &guardrail::Violation::penalty)
        .def_readonly("description", &guardrail::Violation::description)
        .def_readonly("timestamp", &guardrail::Violation::timestamp);

    py::class_<guardrail::Action>(m, "Action")
        .def_readonly("kind", &guardrail::Action::kind)
        .def_readonly("message", &guardrail::Action::message)
        .def_readonly("restrictions", &guardrail::Action::restrictions);

    py::class_<guardrail::SafetyCheck>(m, "SafetyCheck")
        .def_readonly("safe", &guardrail::SafetyCheck::safe)
        .def_readonly("violations", &guardrail::SafetyCheck::violations)
        .def_readonly("total_penalty", &guardrail::SafetyCheck::total_penalty)
        .def_readonly("action", &guardrail::SafetyCheck::action)
        .def_readonly("checks_performed", &guardrail::SafetyCheck::checks_performed)
        .def_readonly("safety_score", &guardrail::SafetyCheck::safety_score);

    py::class_<guardrail::ResetReport>(m, "ResetReport")
        .def_readonly("old_score", &guardrail::ResetReport::old_score)
        .def_readonly("old_penalty", &guardrail::ResetReport::old_penalty)
        .def_readonly("cleared_violations", &guardrail::ResetReport::cleared_violations)
        .def_readonly("new_score", &guardrail::ResetReport::new_score)
        .def_readonly("reset_time", &guardrail::ResetReport::reset_time);

    py::class_<guardrail::ValidationResult>(m, "ValidationResult")
        .def_readonly("valid", &guardrail::ValidationResult::valid)
        .def_readonly("error", &guardrail::ValidationResult::error)
        .def_readonly("reason", &guardrail::ValidationResult::reason)
        .def_readonly("normalized", &guardrail::ValidationResult::normalized)
        .def_readonly("matched_patterns", &guardrail::ValidationResult::matched_patterns)
        .def_readonly("check_id", &guardrail::ValidationResult::check_id);

    py::class_<guardrail::ContentVerdict>(m, "ContentVerdict")
        .def_readonly("approved", &guardrail::ContentVerdict::approved)
        .def_readonly("issues", &guardrail::ContentVerdict::issues)
        .def_readonly("check_id", &guardrail::ContentVerdict::check_id);

    py::class_<guardrail::SanitizationResult>(m, "SanitizationResult")
        .def_readonly("safe", &guardrail::SanitizationResult::safe)
        .def_readonly("output", &guardrail::SanitizationResult::output)
        .def_readonly("reason", &guardrail::SanitizationResult::reason)
        .def_readonly("modifications", &guardrail::SanitizationResult::modifications)
        .def_readonly("modification_count", &guardrail::SanitizationResult::modification_count);

    py::class_<guardrail::ToneReport>(m, "ToneReport")
        .def_readonly("tone", &guardrail::ToneReport::tone)
        .def_readonly("positive_score", &guardrail::ToneReport::positive_score)
        .def_readonly("negative_score", &guardrail::ToneReport::negative_score);

    py::class_<guardrail::PipelineResponse>(m, "PipelineResponse")
        .def_readonly("accepted", &guardrail::PipelineResponse::accepted)
        .def_readonly("rejection_reason", &guardrail::PipelineResponse::rejection_reason)
        .def_readonly("sanitized_output", &guardrail::PipelineResponse::sanitized_output)
        .def_readonly("stage", &guardrail::PipelineResponse::stage)
        .def_readonly("rejection", &guardrail::PipelineResponse::rejection)
        .def_readonly("action", &guardrail::PipelineResponse::action)
        .def_readonly("shutdown", &guardrail::PipelineResponse::shutdown)
        .def_readonly("request_id", &guardrail::PipelineResponse::request_id);

    py::class_<guardrail::InputValidator, std::shared_ptr<guardrail::InputValidator>>(m, "InputValidator")
        .def(py::init<>())
        .def("validate", &guardrail::InputValidator::validate)
        .def("add_custom_pattern", &guardrail::InputValidator::add_custom_pattern);

    py::class_<guardrail::ContentChecker, std::shared_ptr<guardrail::ContentChecker>>(m, "ContentChecker")
        .def(py::init<>())
        .def("verify", &guardrail::ContentChecker::verify)
        .def("reset_stats", &guardrail::ContentChecker::reset_stats);

    py::class_<guardrail::SafetyEngine, std::shared_ptr<guardrail::SafetyEngine>>(m, "SafetyEngine")
        .def(py::init<>())
        .def("check_input", &guardrail::SafetyEngine::check_input)
        .def("check_output", &guardrail::SafetyEngine::check_output)
        .def("reset_safety", &guardrail::SafetyEngine::reset_safety)
        .def_property_readonly("safety_score", &guardrail::SafetyEngine::safety_score)
        .def_property_readonly("cumulative_penalty", &guardrail::SafetyEngine::cumulative_penalty)
        .def("export_log", [](const guardrail::SafetyEngine& engine, const std::string& path) {
            return engine.export_log(path);
        });

    py::class_<guardrail::OutputSanitizer, std::shared_ptr<guardrail::OutputSanitizer>>(m, "OutputSanitizer")
        .def(py::init<>())
        .def("validate", &guardrail::OutputSanitizer::validate)
        .def("redact", &guardrail::OutputSanitizer::redact)
        .def("check_tone", &guardrail::OutputSanitizer::check_tone)
        .def("add_dangerous_phrase", &guardrail::OutputSanitizer::add_dangerous_phrase);

    py::class_<guardrail::PipelineCoordinator, std::shared_ptr<guardrail::PipelineCoordinator>>(m, "PipelineCoordinator")
        .def("handle", &guardrail::PipelineCoordinator::handle)
        .def("reset_safety", &guardrail::PipelineCoordinator::reset_safety)
        .def_property_readonly("shutdown_latched", &guardrail::PipelineCoordinator::shutdown_latched);

    py::class_<guardrail::PipelineSettings, std::shared_ptr<guardrail::PipelineSettings>>(m, "PipelineSettings")
        .def(py::init<>())
        .def_static("from_toml", [](const std::string& path) {
            return std::make_shared<guardrail::PipelineSettings>(guardrail::PipelineSettings::from_toml(path));
        });

    // Owns the exporter thread alongside the coordinator it reads from.
    py::class_<guardrail::PipelineRuntime>(m, "PipelineRuntime")
        .def_readonly("coordinator", &guardrail::PipelineRuntime::coordinator)
        .def_readonly("settings", &guardrail::PipelineRuntime::settings);

    m.def("build_pipeline_py",
          [](guardrail::Reasoner reasoner, std::shared_ptr<guardrail::PipelineSettings> settings) {
              return guardrail::build_pipeline(std::move(reasoner), std::move(settings));
          },
          py::arg("reasoner"), py::arg("settings") = nullptr);
}
