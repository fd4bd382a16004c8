#ifndef GUARDRAIL_OBSERVABILITY_HPP
#define GUARDRAIL_OBSERVABILITY_HPP

#include <atomic>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "guardrail/logging.hpp"
#include "guardrail/pipeline.hpp"

namespace guardrail {

struct HealthStatus {
    bool ok = false;
    bool shutdown = false;
    double safety_score = 0.0;
    long long cumulative_penalty = 0;
    std::string system_status;
};

HealthStatus health_status(const PipelineCoordinator& coordinator);
nlohmann::json to_json(const HealthStatus& status);

// Flattened counters in exposition order.
std::vector<std::pair<std::string, double>> pipeline_metrics(const PipelineReport& report);

class MetricsExporter {
public:
    explicit MetricsExporter(PipelineCoordinator& coordinator, Logger logger = get_logger("MetricsExporter"));
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start(const std::string& host, int port);
    void stop();
    bool running() const { return running_.load(); }

private:
    void serve(const std::string& host, int port);
    std::string respond(const std::string& path, std::string& status, std::string& content_type) const;

    PipelineCoordinator& coordinator_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::atomic<int> server_fd_{-1};
};

}  // namespace guardrail

#endif  // GUARDRAIL_OBSERVABILITY_HPP
