#include "proxy_server.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

ProxyServer::ProxyServer(const Config& config, Dispatcher& dispatcher)
    : config_(config), dispatcher_(dispatcher), running_(false), bound_port_(0) {
    server_ = std::make_unique<httplib::Server>();

    const auto worker_threads = static_cast<size_t>(config_.worker_threads);
    server_->new_task_queue = [worker_threads] { return new httplib::ThreadPool(worker_threads); };

    setup_routes();
}

ProxyServer::~ProxyServer() {
    stop();
}

bool ProxyServer::start() {
    if (config_.listen_port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.listen_addr.c_str());
    } else if (server_->bind_to_port(config_.listen_addr.c_str(), config_.listen_port)) {
        bound_port_ = config_.listen_port;
    } else {
        bound_port_ = -1;
    }

    if (bound_port_ < 0) {
        spdlog::error("Failed to bind {}:{}", config_.listen_addr, config_.listen_port);
        return false;
    }

    running_ = true;
    server_thread_ = std::thread([this]() {
        spdlog::info("Anti-Proxy listening on http://{}:{}", config_.listen_addr, bound_port_);
        if (!server_->listen_after_bind()) {
            spdlog::error("HTTP listener on port {} exited with an error", bound_port_);
        }
        running_ = false;
    });

    // stop() is a no-op until the accept loop is up
    while (running_ && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return running_;
}

void ProxyServer::stop() {
    if (server_thread_.joinable()) {
        server_->stop();
        server_thread_.join();
    }
    running_ = false;
}

bool ProxyServer::is_running() const {
    return running_;
}

void ProxyServer::setup_routes() {
    server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "*"},
        {"Access-Control-Allow-Headers", "*"}
    });

    // CORS preflight
    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });

    server_->Post("/proxy", [this](const httplib::Request& req, httplib::Response& res) {
        handle_proxy(req, res);
    });
}

void ProxyServer::handle_proxy(const httplib::Request& req, httplib::Response& res) {
    ProxyRequest request;
    try {
        request = ProxyRequest::from_json(nlohmann::json::parse(req.body));
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Rejected malformed proxy request: {}", e.what());
        write_response(res, ProxyResponse::rejected(e.what()));
        return;
    }

    spdlog::info("Proxy request for model {} (project {})", request.model, request.project);

    try {
        write_response(res, ProxyResponse::from_outcome(dispatcher_.dispatch(request)));
    } catch (const std::exception& e) {
        spdlog::error("Proxy dispatch failed: {}", e.what());
        ProxyResponse reply;
        reply.error = std::string("Internal proxy error: ") + e.what();
        reply.status_code = 500;
        write_response(res, reply);
    }
}

void ProxyServer::write_response(httplib::Response& res, const ProxyResponse& reply) {
    res.status = reply.http_status();
    // Invalid UTF-8 in an upstream body is replaced rather than failing the whole reply
    res.set_content(
        reply.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
        "application/json");
}
