#include "token_client.hpp"
#include "../utils/logging/log_helper.hpp"
#include <json/json.h>

namespace livekit {

using error_handling::Result;

TokenClient::TokenClient(std::shared_ptr<IHttpHandler> http_handler, std::string endpoint, int timeout_ms)
    : http_handler_(std::move(http_handler)), endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

Result<AccessToken> TokenClient::fetch_token(const std::string& room, const std::string& identity, int ttl_seconds) {
    if (endpoint_.empty()) {
        LOG_WARN_COMP("TOKEN_CLIENT", "LiveKit token endpoint not configured");
        return Result<AccessToken>::error("Token endpoint not configured");
    }
    if (!http_handler_) {
        return Result<AccessToken>::error("No HTTP handler");
    }

    HttpRequest request;
    request.method = "POST";
    request.url = endpoint_;
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";
    request.body = build_request_body(room, identity, ttl_seconds);
    request.timeout_ms = timeout_ms_;

    LOG_INFO_COMP("TOKEN_CLIENT", "Requesting token for room " + room + " as " + identity);
    HttpResponse response = http_handler_->make_request(request);

    if (response.status_code == 0) {
        std::string reason = response.error_message.empty() ? "no response" : response.error_message;
        LOG_ERROR_COMP("TOKEN_CLIENT", "Token request failed: " + reason);
        return Result<AccessToken>::error("Token request failed: " + reason);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        LOG_ERROR_COMP("TOKEN_CLIENT", "Token endpoint returned HTTP " + std::to_string(response.status_code));
        return Result<AccessToken>::error("Token endpoint returned HTTP " + std::to_string(response.status_code));
    }

    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(response.body, root) || !root.isObject()) {
        LOG_ERROR_COMP("TOKEN_CLIENT", "Failed to parse token response");
        return Result<AccessToken>::error("Token response is not valid JSON");
    }
    if (!root["token"].isString() || root["token"].asString().empty()) {
        return Result<AccessToken>::error("Token response empty");
    }

    AccessToken token;
    token.token = root["token"].asString();
    token.room = root["room"].isString() ? root["room"].asString() : room;
    token.identity = root["identity"].isString() ? root["identity"].asString() : identity;

    LOG_INFO_COMP("TOKEN_CLIENT", "Received token for room " + token.room);
    return Result<AccessToken>::success(std::move(token));
}

std::string TokenClient::build_request_body(const std::string& room, const std::string& identity,
                                            int ttl_seconds) const {
    Json::Value root;
    root["room"] = room;
    root["identity"] = identity;
    root["ttl"] = ttl_seconds;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

} // namespace livekit
