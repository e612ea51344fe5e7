#pragma once
#include "outcome.hpp"
#include <string>

// What came back from one endpoint attempt
struct UpstreamResult {
    bool transport_failed = false;
    int status_code = 0;
    std::string body;
    std::string error_message;

    static UpstreamResult response(int status_code, std::string body);
    static UpstreamResult transport_failure(std::string message);
};

/*
 * Maps one attempt to an Outcome:
 *   2xx        -> Success       (terminal)
 *   429        -> RateLimited   (terminal, never retried here)
 *   400        -> BadRequest    (terminal)
 *   401, 403   -> AuthError     (terminal)
 *   5xx        -> ServerError   (try next endpoint)
 *   transport  -> TransportError (try next endpoint)
 *   other      -> OtherError    (terminal)
 */
Outcome classify_response(UpstreamResult result);
