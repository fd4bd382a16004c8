#ifndef GUARDRAIL_DAEMON_HPP
#define GUARDRAIL_DAEMON_HPP

#include <atomic>
#include <istream>
#include <ostream>

#include <nlohmann/json.hpp>

#include "guardrail/api.hpp"

namespace guardrail {

struct DaemonConfig {
    bool exit_on_shutdown = true;
};

constexpr int kExitOk = 0;
constexpr int kExitShutdown = 2;

// Line-oriented front end: one request per input line, one JSON response per output line.
class GuardrailDaemon {
public:
    GuardrailDaemon(PipelineRuntime runtime, DaemonConfig config);
    ~GuardrailDaemon();

    GuardrailDaemon(const GuardrailDaemon&) = delete;
    GuardrailDaemon& operator=(const GuardrailDaemon&) = delete;

    int run(std::istream& input, std::ostream& output);
    void stop();

private:
    void finish();

    PipelineRuntime runtime_;
    DaemonConfig config_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
};

nlohmann::json to_json(const PipelineResponse& response);

// Reasoning stage for the standalone daemon; the real one is supplied by the embedding caller.
Reasoner echo_reasoner();

}  // namespace guardrail

#endif  // GUARDRAIL_DAEMON_HPP
