#include "guardrail/api.hpp"

#include "guardrail/content_checker.hpp"
#include "guardrail/input_validator.hpp"
#include "guardrail/output_sanitizer.hpp"
#include "guardrail/safety_engine.hpp"

namespace guardrail {

PipelineRuntime build_pipeline(Reasoner reasoner, std::shared_ptr<PipelineSettings> settings, Logger logger,
                               std::shared_ptr<const RuleSet> rules) {
    auto effective_settings = settings ? std::move(settings) : std::make_shared<PipelineSettings>();
    configure_logging(effective_settings->logging);

    // One immutable table shared by the engine and the sanitizer.
    auto shared_rules = rules ? std::move(rules) : std::make_shared<const RuleSet>(RuleSet::defaults());

    auto validator = std::make_shared<InputValidator>(effective_settings->input);
    auto checker = std::make_shared<ContentChecker>(effective_settings->content);
    auto safety = std::make_shared<SafetyEngine>(shared_rules, effective_settings->safety);
    auto sanitizer = std::make_shared<OutputSanitizer>(shared_rules, effective_settings->output);

    auto coordinator = std::make_shared<PipelineCoordinator>(std::move(reasoner), validator, checker, safety,
                                                             sanitizer, logger,
                                                             effective_settings->coordination_log_limit);

    auto exporter = std::make_shared<MetricsExporter>(*coordinator);
    if (effective_settings->metrics.enabled) {
        exporter->start(effective_settings->metrics.host, effective_settings->metrics.port);
    }

    logger.info("pipeline_built", {{"rules", std::to_string(shared_rules->rules().size())},
                                   {"redactions", std::to_string(shared_rules->redactions().size())},
                                   {"metrics", effective_settings->metrics.enabled ? "on" : "off"}});

    return PipelineRuntime{shared_rules, coordinator, exporter, effective_settings};
}

}  // namespace guardrail
