#include "upstream_client.hpp"
#include <spdlog/spdlog.h>

CprUpstreamClient::CprUpstreamClient(const Config& config) {
    session_.SetUserAgent(cpr::UserAgent{config.user_agent});
    session_.SetConnectTimeout(cpr::ConnectTimeout{config.connect_timeout_ms});
    session_.SetTimeout(cpr::Timeout{config.request_timeout_ms});
}

UpstreamResult CprUpstreamClient::post(const Endpoint& endpoint,
                                       const std::string& body,
                                       const std::string& access_token) {
    try {
        session_.SetUrl(cpr::Url{endpoint.address});
        session_.SetHeader(cpr::Header{
            {"Content-Type", "application/json"},
            {"Authorization", "Bearer " + access_token},
            {"Accept", "text/event-stream"}
        });
        session_.SetBody(cpr::Body{body});

        cpr::Response response = session_.Post();

        if (response.error) {
            return UpstreamResult::transport_failure(response.error.message);
        }

        spdlog::debug("Upstream {} answered {} ({} bytes)",
            endpoint.address, response.status_code, response.text.size());
        return UpstreamResult::response(static_cast<int>(response.status_code), std::move(response.text));
    } catch (const std::exception& e) {
        return UpstreamResult::transport_failure(e.what());
    }
}
