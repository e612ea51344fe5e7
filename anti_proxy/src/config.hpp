#pragma once
#include <string>
#include <vector>

struct Config {
    std::string listen_addr;
    int listen_port;
    std::vector<std::string> upstream_endpoints;
    std::string user_agent;
    int min_request_interval_ms;
    int connect_timeout_ms;
    int request_timeout_ms;
    int worker_threads;
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;
};
