#pragma once
#include <string>
#include <variant>

namespace outcome {

struct Success {
    std::string body;
};

struct RateLimited {
    std::string body;
};

struct BadRequest {
    std::string body;
};

struct AuthError {
    int code;
    std::string body;
};

// Non-terminal: the next endpoint is tried
struct ServerError {
    int code;
};

// Non-terminal: connect, DNS or timeout failure
struct TransportError {
    std::string message;
};

struct OtherError {
    int code;
    std::string body;
};

// Every endpoint failed with a non-terminal outcome
struct Exhausted {};

}

using Outcome = std::variant<
    outcome::Success,
    outcome::RateLimited,
    outcome::BadRequest,
    outcome::AuthError,
    outcome::ServerError,
    outcome::TransportError,
    outcome::OtherError,
    outcome::Exhausted>;

bool is_terminal(const Outcome& result);
std::string describe(const Outcome& result);
