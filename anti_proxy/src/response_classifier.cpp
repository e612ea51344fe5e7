#include "response_classifier.hpp"
#include <utility>

UpstreamResult UpstreamResult::response(int status_code, std::string body) {
    UpstreamResult result;
    result.status_code = status_code;
    result.body = std::move(body);
    return result;
}

UpstreamResult UpstreamResult::transport_failure(std::string message) {
    UpstreamResult result;
    result.transport_failed = true;
    result.error_message = std::move(message);
    return result;
}

Outcome classify_response(UpstreamResult result) {
    if (result.transport_failed) {
        return outcome::TransportError{std::move(result.error_message)};
    }

    const int code = result.status_code;

    if (code >= 200 && code < 300) {
        return outcome::Success{std::move(result.body)};
    }

    switch (code) {
        case 429:
            return outcome::RateLimited{std::move(result.body)};
        case 400:
            return outcome::BadRequest{std::move(result.body)};
        case 401:
        case 403:
            return outcome::AuthError{code, std::move(result.body)};
        default:
            break;
    }

    if (code >= 500 && code < 600) {
        return outcome::ServerError{code};
    }

    return outcome::OtherError{code, std::move(result.body)};
}
