#include "config.hpp"
#include "util.hpp"
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace {

const char* kDefaultEndpoints =
    "https://cloudcode-pa.googleapis.com/v1internal:streamGenerateContent?alt=sse,"
    "https://daily-cloudcode-pa.sandbox.googleapis.com/v1internal:streamGenerateContent?alt=sse";

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != std::strlen(value)) {
        throw std::runtime_error(std::string(name) + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

bool has_http_scheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

}

Config Config::from_env() {
    Config config;

    config.listen_addr = env_or("LISTEN_ADDR", "127.0.0.1");
    config.listen_port = env_int_or("LISTEN_PORT", 8965);
    config.upstream_endpoints = util::split_list(env_or("UPSTREAM_ENDPOINTS", kDefaultEndpoints));
    config.user_agent = env_or("USER_AGENT", "antigravity/1.15.8 windows/amd64");
    config.min_request_interval_ms = env_int_or("MIN_REQUEST_INTERVAL_MS", 500);
    config.connect_timeout_ms = env_int_or("CONNECT_TIMEOUT_MS", 20000);
    config.request_timeout_ms = env_int_or("REQUEST_TIMEOUT_MS", 600000);
    config.worker_threads = env_int_or("WORKER_THREADS", 16);
    config.service_name = env_or("SERVICE_NAME", "anti_proxy");
    config.log_level = env_or("LOG_LEVEL", "info");

    return config;
}

void Config::validate() const {
    if (upstream_endpoints.empty()) {
        throw std::runtime_error("At least one upstream endpoint is required");
    }

    for (const auto& endpoint : upstream_endpoints) {
        if (!has_http_scheme(endpoint)) {
            throw std::runtime_error("Upstream endpoint must be an http(s) URL: " + endpoint);
        }
    }

    if (listen_port < 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 0 and 65535");
    }

    if (min_request_interval_ms < 0) {
        throw std::runtime_error("MIN_REQUEST_INTERVAL_MS must not be negative");
    }

    if (connect_timeout_ms <= 0 || request_timeout_ms <= 0) {
        throw std::runtime_error("Upstream timeouts must be positive");
    }

    // One worker is pinned by the in-flight dispatch, another keeps /health responsive
    if (worker_threads < 2) {
        throw std::runtime_error("WORKER_THREADS must be at least 2");
    }
}
