#pragma once
#include "config.hpp"
#include "endpoint_set.hpp"
#include "response_classifier.hpp"
#include <cpr/cpr.h>
#include <string>

class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // One POST attempt. Never throws; transport problems come back as a transport failure.
    virtual UpstreamResult post(const Endpoint& endpoint,
                                const std::string& body,
                                const std::string& access_token) = 0;
};

// Keeps one cpr session, and with it libcurl's connection cache, for the
// process lifetime so consecutive attempts reuse open TCP/TLS connections.
// post() is not reentrant; DispatchGate serializes every caller.
class CprUpstreamClient : public UpstreamClient {
public:
    explicit CprUpstreamClient(const Config& config);

    UpstreamResult post(const Endpoint& endpoint,
                        const std::string& body,
                        const std::string& access_token) override;

private:
    cpr::Session session_;
};
