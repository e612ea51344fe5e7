#include "clock.hpp"
#include "config.hpp"
#include "dispatch_gate.hpp"
#include "dispatcher.hpp"
#include "endpoint_set.hpp"
#include "proxy_server.hpp"
#include "rate_limiter.hpp"
#include "upstream_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

class AntiProxy {
public:
    explicit AntiProxy(const Config& config)
        : config_(config)
        , endpoints_(config_.upstream_endpoints)
        , rate_limiter_(std::chrono::milliseconds(config_.min_request_interval_ms), clock_)
        , upstream_client_(config_)
        , dispatcher_(endpoints_, gate_, rate_limiter_, upstream_client_)
        , server_(config_, dispatcher_)
        , running_(false) {}

    bool initialize() {
        for (const auto& endpoint : endpoints_) {
            spdlog::info("Upstream endpoint {}: {}", endpoint.ordinal + 1, endpoint.address);
        }
        spdlog::info("Minimum request interval: {}ms", rate_limiter_.min_interval().count());
        spdlog::info("429 handling: returned to caller (no retry)");

        return server_.start();
    }

    void run() {
        running_ = true;
        // Block until the listener stops or a signal arrives
        while (running_ && server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        server_.stop();
    }

    void shutdown() {
        running_ = false;
    }

private:
    Config config_;
    SteadyClock clock_;
    EndpointSet endpoints_;
    DispatchGate gate_;
    RateLimiter rate_limiter_;
    CprUpstreamClient upstream_client_;
    Dispatcher dispatcher_;
    ProxyServer server_;
    std::atomic<bool> running_;
};

std::unique_ptr<AntiProxy> service;

void signal_handler(int signum) {
    (void)signum;
    if (service) {
        service->shutdown();
    }
}

int main() {
    try {
        Config config = Config::from_env();
        config.validate();

        util::setup_logging(config.log_level, config.service_name);
        spdlog::info("Starting {}...", config.service_name);

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        service = std::make_unique<AntiProxy>(config);
        if (!service->initialize()) {
            spdlog::critical("Failed to start HTTP listener");
            return 1;
        }
        service->run();

        spdlog::info("{} has shut down.", config.service_name);
        service.reset();

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
