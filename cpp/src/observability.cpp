#include "guardrail/observability.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "guardrail/common.hpp"

namespace guardrail {

HealthStatus health_status(const PipelineCoordinator& coordinator) {
    const auto safety = coordinator.report().safety;
    HealthStatus status;
    status.shutdown = coordinator.shutdown_latched();
    status.safety_score = safety.safety_score;
    status.cumulative_penalty = safety.cumulative_penalty;
    status.ok = !status.shutdown && safety.operational &&
                safety.cumulative_penalty < safety.thresholds.penalty_threshold;
    if (status.shutdown) {
        status.system_status = "shutdown";
    } else if (!safety.operational) {
        status.system_status = "restricted";
    } else if (!status.ok) {
        status.system_status = "blocked";
    } else {
        status.system_status = "operational";
    }
    return status;
}

nlohmann::json to_json(const HealthStatus& status) {
    return {
        {"ok", status.ok},
        {"shutdown", status.shutdown},
        {"safety_score", status.safety_score},
        {"total_penalty", status.cumulative_penalty},
        {"system_status", status.system_status},
    };
}

std::vector<std::pair<std::string, double>> pipeline_metrics(const PipelineReport& report) {
    auto count = [](std::uint64_t value) { return static_cast<double>(value); };
    return {
        {"guardrail_requests_total", count(report.pipeline.requests)},
        {"guardrail_requests_accepted_total", count(report.pipeline.accepted)},
        {"guardrail_requests_input_rejected_total", count(report.pipeline.input_rejected)},
        {"guardrail_requests_content_blocked_total", count(report.pipeline.content_blocked)},
        {"guardrail_requests_safety_rejected_total", count(report.pipeline.safety_rejected)},
        {"guardrail_requests_output_blocked_total", count(report.pipeline.output_blocked)},
        {"guardrail_requests_reasoning_failed_total", count(report.pipeline.reasoning_failed)},
        {"guardrail_shutdowns_total", count(report.pipeline.shutdowns)},
        {"guardrail_success_rate", report.pipeline.success_rate},
        {"guardrail_input_suspicious_total", count(report.input.suspicious)},
        {"guardrail_input_validity_rate", report.input.validity_rate},
        {"guardrail_content_approval_rate", report.content.approval_rate},
        {"guardrail_safety_score", report.safety.safety_score},
        {"guardrail_safety_penalty_total", static_cast<double>(report.safety.cumulative_penalty)},
        {"guardrail_safety_violations_total", count(report.safety.total_violations)},
        {"guardrail_safety_critical_violations_total", count(report.safety.critical_violations)},
        {"guardrail_output_modified_total", count(report.output.modified)},
        {"guardrail_output_blocked_total", count(report.output.blocked)},
    };
}

MetricsExporter::MetricsExporter(PipelineCoordinator& coordinator, Logger logger)
    : coordinator_(coordinator), logger_(std::move(logger)) {}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start(const std::string& host, int port) {
    if (running_.exchange(true)) {
        return;
    }
    // A previous serve() may have exited on a bind failure.
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::thread(&MetricsExporter::serve, this, host, port);
}

void MetricsExporter::stop() {
    running_ = false;
    const int fd = server_fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string MetricsExporter::respond(const std::string& path, std::string& status, std::string& content_type) const {
    if (path == "/metrics") {
        std::ostringstream response;
        for (const auto& [key, value] : pipeline_metrics(coordinator_.report())) {
            response << key << " " << value << "\n";
        }
        return response.str();
    }
    if (path == "/health") {
        const auto health = health_status(coordinator_);
        content_type = "application/json";
        if (!health.ok) {
            status = "503 Service Unavailable";
        }
        return to_json(health).dump();
    }
    status = "404 Not Found";
    return "";
}

void MetricsExporter::serve(const std::string& host, int port) {
    const int server_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        logger_.error("metrics_socket_failed", {{"error", std::strerror(errno)}});
        running_ = false;
        return;
    }
    server_fd_ = server_fd;

    int opt = 1;
    ::setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        logger_.error("metrics_bad_host", {{"host", host}});
        ::close(server_fd);
        server_fd_ = -1;
        running_ = false;
        return;
    }

    if (::bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(server_fd, 4) < 0) {
        logger_.error("metrics_bind_failed",
                      {{"host", host}, {"port", std::to_string(port)}, {"error", std::strerror(errno)}});
        ::close(server_fd);
        server_fd_ = -1;
        running_ = false;
        return;
    }
    logger_.info("metrics_listening", {{"host", host}, {"port", std::to_string(port)}});
    if (!running_) {
        ::close(server_fd);
        server_fd_ = -1;
        return;
    }

    while (running_) {
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        int client_fd = ::accept(server_fd, reinterpret_cast<sockaddr*>(&client), &len);
        if (client_fd < 0) {
            continue;
        }

        char buffer[1024] = {0};
        const ssize_t read_bytes = ::read(client_fd, buffer, sizeof(buffer) - 1);
        if (read_bytes <= 0) {
            ::close(client_fd);
            continue;
        }

        std::string request(buffer, static_cast<size_t>(read_bytes));
        auto first_line_end = request.find("\r\n");
        std::string first_line = first_line_end == std::string::npos ? request : request.substr(0, first_line_end);
        auto parts = split(first_line, ' ');
        std::string path = parts.size() >= 2 ? parts[1] : "/";

        std::string status = "200 OK";
        std::string content_type = "text/plain";
        const std::string body = respond(path, status, content_type);

        std::ostringstream header;
        header << "HTTP/1.1 " << status << "\r\n"
               << "Content-Type: " << content_type << "\r\n"
               << "Content-Length: " << body.size() << "\r\n"
               << "Connection: close\r\n\r\n";

        const std::string response = header.str() + body;
        if (::send(client_fd, response.c_str(), response.size(), MSG_NOSIGNAL) < 0) {
            logger_.debug("metrics_send_failed", {{"path", path}, {"error", std::strerror(errno)}});
        }
        ::close(client_fd);
    }

    ::close(server_fd);
    server_fd_ = -1;
}

}  // namespace guardrail
