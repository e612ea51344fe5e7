#include "outcome.hpp"
#include <fmt/format.h>

namespace {

struct Describer {
    std::string operator()(const outcome::Success& s) const {
        return fmt::format("success ({} bytes)", s.body.size());
    }
    std::string operator()(const outcome::RateLimited&) const { return "rate limited (429)"; }
    std::string operator()(const outcome::BadRequest&) const { return "bad request (400)"; }
    std::string operator()(const outcome::AuthError& e) const {
        return fmt::format("auth error ({})", e.code);
    }
    std::string operator()(const outcome::ServerError& e) const {
        return fmt::format("server error ({})", e.code);
    }
    std::string operator()(const outcome::TransportError& e) const {
        return fmt::format("network error: {}", e.message);
    }
    std::string operator()(const outcome::OtherError& e) const {
        return fmt::format("upstream error ({})", e.code);
    }
    std::string operator()(const outcome::Exhausted&) const { return "all endpoints failed"; }
};

}

bool is_terminal(const Outcome& result) {
    return !std::holds_alternative<outcome::ServerError>(result)
        && !std::holds_alternative<outcome::TransportError>(result);
}

std::string describe(const Outcome& result) {
    return std::visit(Describer{}, result);
}
