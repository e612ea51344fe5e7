#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "json_schemas.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

// HTTP front end: POST /proxy, GET /health, permissive CORS
class ProxyServer {
public:
    ProxyServer(const Config& config, Dispatcher& dispatcher);
    ~ProxyServer();

    // Binds synchronously and serves on a background thread. Returns false if the bind fails.
    bool start();
    void stop();
    bool is_running() const;

    // Bound port, resolved when LISTEN_PORT is 0
    int port() const { return bound_port_; }

private:
    const Config& config_;
    Dispatcher& dispatcher_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    int bound_port_;

    void setup_routes();
    void handle_proxy(const httplib::Request& req, httplib::Response& res);
    static void write_response(httplib::Response& res, const ProxyResponse& reply);
};
