#include "websocket_handshake.hpp"
#include "i_websocket_transport.hpp"
#include "../utils/constants.hpp"
#include "../utils/encoding/base64.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace websocket_transport {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

bool parse_port(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    port = std::stoi(text);
    return port > 0 && port <= 65535;
}

} // namespace

std::optional<WebSocketUrl> parse_url(const std::string& url) {
    WebSocketUrl result;
    std::string remaining;

    const std::string lowered = to_lower(url.substr(0, 6));
    if (lowered.rfind("ws://", 0) == 0) {
        result.secure = false;
        remaining = url.substr(5);
    } else if (lowered.rfind("wss://", 0) == 0) {
        result.secure = true;
        remaining = url.substr(6);
    } else {
        return std::nullopt;
    }

    size_t resource_pos = remaining.find_first_of("/?");
    std::string authority = remaining.substr(0, resource_pos);
    if (resource_pos != std::string::npos) {
        result.resource = remaining.substr(resource_pos);
        if (result.resource[0] == '?') {
            result.resource = "/" + result.resource;
        }
    }

    // Drop fragment
    size_t fragment = result.resource.find('#');
    if (fragment != std::string::npos) {
        result.resource.erase(fragment);
    }

    result.port = result.secure ? 443 : 80;

    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        result.host = authority.substr(1, close - 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':' || !parse_port(rest.substr(1), result.port)) {
                return std::nullopt;
            }
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            if (!parse_port(authority.substr(colon + 1), result.port)) {
                return std::nullopt;
            }
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string generate_websocket_key() {
    unsigned char key_bytes[16];
    if (RAND_bytes(key_bytes, sizeof(key_bytes)) != 1) {
        throw TransportError("Failed to generate Sec-WebSocket-Key");
    }
    return encoding::base64_encode(key_bytes, sizeof(key_bytes));
}

std::string compute_accept_key(const std::string& key) {
    const std::string input = key + constants::websocket::ACCEPT_GUID;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return encoding::base64_encode(digest, SHA_DIGEST_LENGTH);
}

std::string build_handshake_request(const WebSocketUrl& url, const std::string& key,
                                    const std::map<std::string, std::string>& extra_headers) {
    std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
    if (!url.has_default_port()) {
        host += ":" + std::to_string(url.port);
    }

    std::ostringstream request;
    request << "GET " << url.resource << " HTTP/1.1\r\n";
    request << "Host: " << host << "\r\n";
    request << "Upgrade: websocket\r\n";
    request << "Connection: Upgrade\r\n";
    request << "Sec-WebSocket-Key: " << key << "\r\n";
    request << "Sec-WebSocket-Version: 13\r\n";
    for (const auto& [name, value] : extra_headers) {
        request << name << ": " << value << "\r\n";
    }
    request << "\r\n";
    return request.str();
}

std::optional<HandshakeResponse> parse_handshake_response(const std::string& head) {
    std::istringstream stream(head);
    std::string line;

    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // HTTP/1.1 101 Switching Protocols
    if (line.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    size_t first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return std::nullopt;
    }
    size_t second_space = line.find(' ', first_space + 1);
    std::string code = line.substr(first_space + 1, second_space == std::string::npos
                                                        ? std::string::npos
                                                        : second_space - first_space - 1);
    if (code.size() != 3 || code.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    HandshakeResponse response;
    response.status_code = std::stoi(code);
    if (second_space != std::string::npos) {
        response.reason = line.substr(second_space + 1);
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        response.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return response;
}

void validate_handshake_response(const HandshakeResponse& response, const std::string& key) {
    if (response.status_code != 101) {
        throw TransportError("Server rejected WebSocket upgrade: " + std::to_string(response.status_code) +
                             (response.reason.empty() ? "" : " " + response.reason));
    }

    auto upgrade = response.headers.find("upgrade");
    if (upgrade == response.headers.end() || to_lower(upgrade->second) != "websocket") {
        throw TransportError("Handshake response missing 'Upgrade: websocket'");
    }

    auto connection = response.headers.find("connection");
    if (connection == response.headers.end() || to_lower(connection->second).find("upgrade") == std::string::npos) {
        throw TransportError("Handshake response missing 'Connection: Upgrade'");
    }

    auto accept = response.headers.find("sec-websocket-accept");
    if (accept == response.headers.end() || accept->second != compute_accept_key(key)) {
        throw TransportError("Invalid Sec-WebSocket-Accept in handshake response");
    }
}

} // namespace websocket_transport
