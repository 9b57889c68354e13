#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace anchorlog {

// ============================================================================
// HTTP client interface
// ============================================================================
//
// The library ships no transport. Applications inject one (libcurl,
// URLSession, OkHttp, ...) behind this interface.

struct http_response {
    int status_code = 0;   // 0 when no response was received
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }

    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    /// Blocks until the request completes. Transport failures are reported
    /// as a response with status_code 0.
    virtual http_response send(const http_request& request) = 0;
};

/// Client with no network: every request fails with status 0.
class null_http_client : public http_client {
public:
    http_response send(const http_request&) override { return {}; }
};

/// Adapts a callable into an http_client.
class function_http_client : public http_client {
public:
    using send_fn = std::function<http_response(const http_request&)>;

    explicit function_http_client(send_fn fn) : fn_(std::move(fn)) {}

    http_response send(const http_request& request) override {
        return fn_ ? fn_(request) : http_response{};
    }

private:
    send_fn fn_;
};

} // namespace anchorlog

#endif // __cplusplus
