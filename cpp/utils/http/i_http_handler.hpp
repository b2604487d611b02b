#pragma once
#include <string>
#include <map>
#include <memory>

// HTTP request structure
struct HttpRequest {
    std::string method;           // GET, POST
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeout_ms{5000};
    bool verify_ssl{true};
};

// HTTP response structure
struct HttpResponse {
    int status_code{0};
    std::map<std::string, std::string> headers;
    std::string body;
    std::string error_message;
    bool success{false};
};

// Base interface for HTTP handlers
class IHttpHandler {
public:
    virtual ~IHttpHandler() = default;

    // Blocking request. Transport failures are reported in error_message with status_code 0.
    virtual HttpResponse make_request(const HttpRequest& request) = 0;

    // Lifecycle management
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    // Configuration
    virtual void set_default_timeout(int timeout_ms) = 0;
    virtual void set_default_headers(const std::map<std::string, std::string>& headers) = 0;
    virtual void set_verify_ssl(bool verify) = 0;
};

// HTTP handler factory
class HttpHandlerFactory {
public:
    static std::unique_ptr<IHttpHandler> create();
};
