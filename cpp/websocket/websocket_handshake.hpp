#pragma once
#include <map>
#include <optional>
#include <string>

namespace websocket_transport {

struct WebSocketUrl {
    bool secure{false};
    std::string host;
    int port{80};
    std::string resource{"/"};   // path plus query

    bool has_default_port() const { return port == (secure ? 443 : 80); }
};

// ws:// and wss:// only; bracketed IPv6 hosts are accepted
std::optional<WebSocketUrl> parse_url(const std::string& url);

// 16 random bytes, base64 encoded
std::string generate_websocket_key();

// base64(SHA1(key + GUID))
std::string compute_accept_key(const std::string& key);

std::string build_handshake_request(const WebSocketUrl& url, const std::string& key,
                                    const std::map<std::string, std::string>& extra_headers);

struct HandshakeResponse {
    int status_code{0};
    std::string reason;
    std::map<std::string, std::string> headers;   // lower-cased names
};

// Parses the head of an HTTP response (up to and excluding the blank line)
std::optional<HandshakeResponse> parse_handshake_response(const std::string& head);

// Throws TransportError unless the response completes the upgrade for key
void validate_handshake_response(const HandshakeResponse& response, const std::string& key);

} // namespace websocket_transport
