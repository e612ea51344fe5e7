#pragma once
#include "outcome.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Inbound POST /proxy body
struct ProxyRequest {
    std::string model;
    std::string project;
    std::string access_token;
    nlohmann::json request;

    // Throws nlohmann::json::exception on missing or mistyped fields
    static ProxyRequest from_json(const nlohmann::json& j);
};

// Body sent to each upstream endpoint; request_id is shared by all attempts of one call
nlohmann::json build_upstream_payload(const ProxyRequest& req, const std::string& request_id);

// Reply envelope returned to the caller
struct ProxyResponse {
    bool success = false;
    std::optional<std::string> data;
    std::optional<std::string> error;
    std::optional<int> status_code;

    static ProxyResponse from_outcome(const Outcome& result);
    static ProxyResponse rejected(const std::string& reason);

    int http_status() const;
    nlohmann::json to_json() const;
};
