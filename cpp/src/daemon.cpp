#include "guardrail/daemon.hpp"

#include <string>

namespace guardrail {

nlohmann::json to_json(const PipelineResponse& response) {
    nlohmann::json payload = {
        {"request_id", response.request_id},
        {"accepted", response.accepted},
        {"stage", stage_name(response.stage)},
        {"shutdown", response.shutdown},
        {"duration_s", response.duration_s},
    };
    if (response.sanitized_output.has_value()) {
        payload["output"] = *response.sanitized_output;
    }
    if (response.rejection.has_value()) {
        payload["rejection"] = rejection_name(*response.rejection);
    }
    if (response.rejection_reason.has_value()) {
        payload["reason"] = *response.rejection_reason;
    }
    if (response.action.has_value()) {
        payload["action"] = action_name(*response.action);
    }
    return payload;
}

Reasoner echo_reasoner() {
    return [](const std::string& text) { return text; };
}

GuardrailDaemon::GuardrailDaemon(PipelineRuntime runtime, DaemonConfig config)
    : runtime_(std::move(runtime)), config_(config), logger_(get_logger("GuardrailDaemon")) {
    runtime_.coordinator->set_shutdown_handler([this](const PipelineResponse& response) {
        logger_.error("daemon_shutdown_requested", {{"request_id", std::to_string(response.request_id)}});
        shutdown_ = true;
        if (config_.exit_on_shutdown) {
            stop();
        }
    });
}

GuardrailDaemon::~GuardrailDaemon() {
    runtime_.coordinator->set_shutdown_handler(nullptr);
}

int GuardrailDaemon::run(std::istream& input, std::ostream& output) {
    running_ = true;
    logger_.info("daemon_started", {{"exit_on_shutdown", config_.exit_on_shutdown ? "true" : "false"}});

    std::string line;
    while (running_ && std::getline(input, line)) {
        if (line.empty()) {
            continue;
        }
        const auto response = runtime_.coordinator->handle(line);
        output << to_json(response).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        output.flush();
    }

    finish();
    return shutdown_ ? kExitShutdown : kExitOk;
}

void GuardrailDaemon::stop() {
    running_ = false;
}

void GuardrailDaemon::finish() {
    if (runtime_.settings && runtime_.settings->safety.export_path.has_value()) {
        const auto& path = *runtime_.settings->safety.export_path;
        if (!runtime_.coordinator->safety().export_log(path)) {
            logger_.warn("daemon_export_skipped", {{"path", path}});
        }
    }
    const auto stats = runtime_.coordinator->get_stats();
    logger_.info("daemon_stopped", {{"requests", std::to_string(stats.requests)},
                                    {"accepted", std::to_string(stats.accepted)},
                                    {"shutdowns", std::to_string(stats.shutdowns)}});
    if (runtime_.exporter) {
        runtime_.exporter->stop();
    }
}

}  // namespace guardrail
