#include "dispatcher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string make_request_id() {
    return "agent-" + util::generate_uuid();
}

Dispatcher::Dispatcher(const EndpointSet& endpoints,
                       DispatchGate& gate,
                       RateLimiter& rate_limiter,
                       UpstreamClient& client,
                       RequestIdGenerator generate_request_id)
    : endpoints_(endpoints)
    , gate_(gate)
    , rate_limiter_(rate_limiter)
    , client_(client)
    , generate_request_id_(std::move(generate_request_id)) {}

Outcome Dispatcher::dispatch(const ProxyRequest& request) {
    DispatchGate::Permit permit(gate_);
    spdlog::info("Request acquired permit");

    rate_limiter_.wait_turn();

    const std::string request_id = generate_request_id_();
    const std::string payload = build_upstream_payload(request, request_id).dump();

    for (const auto& endpoint : endpoints_) {
        spdlog::info("[Endpoint {}/{}] Trying: {}", endpoint.ordinal + 1, endpoints_.size(), endpoint.address);

        Outcome result = classify_response(client_.post(endpoint, payload, request.access_token));

        if (is_terminal(result)) {
            log_terminal(endpoint, result);
            return result;
        }

        if (endpoint.ordinal + 1 < endpoints_.size()) {
            spdlog::warn("[Endpoint {}/{}] {}, trying next endpoint",
                endpoint.ordinal + 1, endpoints_.size(), describe(result));
        } else {
            spdlog::warn("[Endpoint {}/{}] {}", endpoint.ordinal + 1, endpoints_.size(), describe(result));
        }
    }

    spdlog::error("All {} endpoints failed for {}", endpoints_.size(), request_id);
    return outcome::Exhausted{};
}

void Dispatcher::log_terminal(const Endpoint& endpoint, const Outcome& result) const {
    if (std::holds_alternative<outcome::Success>(result)) {
        spdlog::info("[Endpoint {}/{}] Request successful", endpoint.ordinal + 1, endpoints_.size());
    } else if (std::holds_alternative<outcome::RateLimited>(result)) {
        spdlog::warn("[Endpoint {}/{}] 429 rate limited, returning to caller for account rotation",
            endpoint.ordinal + 1, endpoints_.size());
    } else {
        spdlog::warn("[Endpoint {}/{}] {}, not retrying", endpoint.ordinal + 1, endpoints_.size(), describe(result));
    }
}
