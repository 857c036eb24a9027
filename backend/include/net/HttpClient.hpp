#pragma once
#include <chrono>
#include <string>

namespace tvlink::net {

struct HttpResult {
    long code = 0;          // HTTP status, 0 when no response arrived
    std::string body;
    std::string error;      // transport failure text, empty on a completed exchange

    bool completed() const { return error.empty(); }
    bool success() const { return completed() && code >= 200 && code < 300; }
};

/**
 * @brief Request/response transport used for fingerprints, HTTP/ECP commands and status queries.
 *
 * Implementations must be safe to call from several threads at once.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual HttpResult get(const std::string& url, std::chrono::milliseconds timeout) = 0;
    // An empty body sends a zero-length POST without a Content-Type.
    virtual HttpResult post(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) = 0;
};

// libcurl easy-handle client; one handle per request.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    HttpResult get(const std::string& url, std::chrono::milliseconds timeout) override;
    HttpResult post(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) override;
};

} // namespace tvlink::net
