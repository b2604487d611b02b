#pragma once
#include "../utils/error_handling.hpp"
#include "../utils/http/i_http_handler.hpp"
#include <memory>
#include <string>

namespace livekit {

struct AccessToken {
    std::string token;
    std::string room;
    std::string identity;
};

/**
 * Exchanges a room and identity for a short-lived LiveKit access token.
 *
 * POST {"room", "identity", "ttl"} to the token endpoint; the response body
 * is {"token", "room", "identity"}.
 */
class TokenClient {
public:
    TokenClient(std::shared_ptr<IHttpHandler> http_handler, std::string endpoint, int timeout_ms = 10000);

    error_handling::Result<AccessToken> fetch_token(const std::string& room, const std::string& identity,
                                                    int ttl_seconds = 3600);

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string build_request_body(const std::string& room, const std::string& identity, int ttl_seconds) const;

    std::shared_ptr<IHttpHandler> http_handler_;
    std::string endpoint_;
    int timeout_ms_;
};

} // namespace livekit
