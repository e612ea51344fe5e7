#include "json_schemas.hpp"

namespace {

ProxyResponse failure(int status_code, std::string error) {
    ProxyResponse res;
    res.success = false;
    res.error = std::move(error);
    res.status_code = status_code;
    return res;
}

struct ResponseBuilder {
    ProxyResponse operator()(const outcome::Success& s) const {
        ProxyResponse res;
        res.success = true;
        res.data = s.body;
        return res;
    }
    ProxyResponse operator()(const outcome::RateLimited& e) const { return failure(429, e.body); }
    ProxyResponse operator()(const outcome::BadRequest& e) const { return failure(400, e.body); }
    ProxyResponse operator()(const outcome::AuthError& e) const { return failure(e.code, e.body); }
    ProxyResponse operator()(const outcome::OtherError& e) const { return failure(e.code, e.body); }
    ProxyResponse operator()(const outcome::Exhausted&) const {
        return failure(503, "All endpoints failed");
    }

    // Never handed to callers, the dispatcher turns these into Exhausted
    ProxyResponse operator()(const outcome::ServerError&) const {
        return failure(503, "All endpoints failed");
    }
    ProxyResponse operator()(const outcome::TransportError&) const {
        return failure(503, "All endpoints failed");
    }
};

}

ProxyRequest ProxyRequest::from_json(const nlohmann::json& j) {
    ProxyRequest req;
    req.model = j.at("model").get<std::string>();
    req.project = j.at("project").get<std::string>();
    req.access_token = j.at("access_token").get<std::string>();
    req.request = j.at("request");
    return req;
}

nlohmann::json build_upstream_payload(const ProxyRequest& req, const std::string& request_id) {
    return nlohmann::json{
        {"model", req.model},
        {"userAgent", "antigravity"},
        {"requestType", "agent"},
        {"project", req.project},
        {"requestId", request_id},
        {"request", req.request}
    };
}

ProxyResponse ProxyResponse::from_outcome(const Outcome& result) {
    return std::visit(ResponseBuilder{}, result);
}

ProxyResponse ProxyResponse::rejected(const std::string& reason) {
    return failure(400, "Invalid proxy request: " + reason);
}

int ProxyResponse::http_status() const {
    if (success) {
        return 200;
    }
    if (status_code && *status_code >= 200 && *status_code <= 599) {
        return *status_code;
    }
    return 500;
}

nlohmann::json ProxyResponse::to_json() const {
    nlohmann::json j = {
        {"success", success},
        {"data", data ? nlohmann::json(*data) : nlohmann::json(nullptr)},
        {"error", error ? nlohmann::json(*error) : nlohmann::json(nullptr)}
    };
    if (status_code) {
        j["status_code"] = *status_code;
    }
    return j;
}
