#include "guardrail/api.hpp"
#include "guardrail/config.hpp"
#include "guardrail/daemon.hpp"
#include "guardrail/logging.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

guardrail::GuardrailDaemon* g_daemon = nullptr;

void handle_signal(int) {
    if (g_daemon) {
        g_daemon->stop();
    }
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <path>] [--no-metrics] [--keep-running]\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    bool metrics_enabled = true;
    bool exit_on_shutdown = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--no-metrics") {
            metrics_enabled = false;
        } else if (arg == "--keep-running") {
            exit_on_shutdown = false;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        auto settings = config_path.empty() ? guardrail::PipelineSettings{}
                                            : guardrail::PipelineSettings::from_toml(config_path);
        if (!metrics_enabled) {
            settings.metrics.enabled = false;
        }
        auto runtime = guardrail::build_pipeline(guardrail::echo_reasoner(),
                                                 std::make_shared<guardrail::PipelineSettings>(settings));

        guardrail::DaemonConfig config;
        config.exit_on_shutdown = exit_on_shutdown;

        guardrail::GuardrailDaemon daemon(runtime, config);
        g_daemon = &daemon;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        const int code = daemon.run(std::cin, std::cout);
        g_daemon = nullptr;
        return code;
    } catch (const std::exception& exc) {
        std::cerr << "guardraild error: " << exc.what() << "\n";
        return 1;
    }
}
