#pragma once
#include "i_http_handler.hpp"
#include <curl/curl.h>
#include <map>
#include <mutex>
#include <string>

// CURL easy-handle based HTTP handler. Requests are serialized on one handle.
class CurlHttpHandler : public IHttpHandler {
public:
    CurlHttpHandler();
    ~CurlHttpHandler() override;

    CurlHttpHandler(const CurlHttpHandler&) = delete;
    CurlHttpHandler& operator=(const CurlHttpHandler&) = delete;

    HttpResponse make_request(const HttpRequest& request) override;

    bool initialize() override;
    void shutdown() override;
    bool is_initialized() const override { return initialized_; }

    void set_default_timeout(int timeout_ms) override { default_timeout_ms_ = timeout_ms; }
    void set_default_headers(const std::map<std::string, std::string>& headers) override { default_headers_ = headers; }
    void set_verify_ssl(bool verify) override { verify_ssl_ = verify; }

private:
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, HttpResponse* response);
    static size_t HeaderCallback(void* contents, size_t size, size_t nmemb, HttpResponse* response);

    curl_slist* build_header_list(const HttpRequest& request) const;
    void setup_curl_options(const HttpRequest& request, HttpResponse& response, curl_slist* headers);

    std::mutex mutex_;
    CURL* curl_{nullptr};
    bool initialized_{false};
    int default_timeout_ms_{5000};
    std::map<std::string, std::string> default_headers_;
    bool verify_ssl_{true};
};
