#pragma once
#include "dispatch_gate.hpp"
#include "endpoint_set.hpp"
#include "json_schemas.hpp"
#include "outcome.hpp"
#include "rate_limiter.hpp"
#include "upstream_client.hpp"
#include <functional>
#include <string>

// "agent-<uuid>"
std::string make_request_id();

/*
 * Runs one dispatch sequence per call: takes the gate, spends one rate-limit
 * turn, then walks the endpoints in order until one attempt classifies as
 * terminal. Returns Exhausted when every endpoint failed transiently.
 * Sequences never overlap; later callers queue on the gate in arrival order.
 */
class Dispatcher {
public:
    using RequestIdGenerator = std::function<std::string()>;

    Dispatcher(const EndpointSet& endpoints,
               DispatchGate& gate,
               RateLimiter& rate_limiter,
               UpstreamClient& client,
               RequestIdGenerator generate_request_id = make_request_id);

    Outcome dispatch(const ProxyRequest& request);

private:
    const EndpointSet& endpoints_;
    DispatchGate& gate_;
    RateLimiter& rate_limiter_;
    UpstreamClient& client_;
    RequestIdGenerator generate_request_id_;

    void log_terminal(const Endpoint& endpoint, const Outcome& result) const;
};
