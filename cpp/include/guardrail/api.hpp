#ifndef GUARDRAIL_API_HPP
#define GUARDRAIL_API_HPP

#include <memory>

#include "guardrail/config.hpp"
#include "guardrail/logging.hpp"
#include "guardrail/observability.hpp"
#include "guardrail/pipeline.hpp"
#include "guardrail/rules.hpp"

namespace guardrail {

struct PipelineRuntime {
    std::shared_ptr<const RuleSet> rules;
    std::shared_ptr<PipelineCoordinator> coordinator;
    std::shared_ptr<MetricsExporter> exporter;
    std::shared_ptr<PipelineSettings> settings;
};

PipelineRuntime build_pipeline(Reasoner reasoner, std::shared_ptr<PipelineSettings> settings = nullptr,
                               Logger logger = get_logger("guardrail"),
                               std::shared_ptr<const RuleSet> rules = nullptr);

}  // namespace guardrail

#endif  // GUARDRAIL_API_HPP
