#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace webtender {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct RequestTimings {
    double name_lookup_ms = 0.0;
    double connect_ms = 0.0;
    double app_connect_ms = 0.0;
    double pre_transfer_ms = 0.0;
    double start_transfer_ms = 0.0;
    double total_ms = 0.0;
};

struct HttpRequest {
    std::string method;
    std::string url;
    Headers headers;
    std::string body;

    // Header names compare case-insensitively. set_header replaces every
    // existing entry of that name.
    void set_header(const std::string& name, std::string value);
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    // Set when the status line arrived but the body could not be read in full.
    std::optional<std::string> read_error;
    RequestTimings timings;
};

// Milliseconds as libcurl's long, saturating at LONG_MAX. Non-positive
// values map to 0.
long clamp_timeout_ms(std::chrono::milliseconds timeout) noexcept;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Sends exactly one request. Throws TransportError when no response
    // status could be obtained. 4xx/5xx are returned, not thrown.
    virtual HttpResponse send(const HttpRequest& request,
                              std::chrono::milliseconds timeout) const = 0;
};

class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;
    CurlTransport(CurlTransport&&) noexcept = delete;
    CurlTransport& operator=(CurlTransport&&) noexcept = delete;

    HttpResponse send(const HttpRequest& request,
                      std::chrono::milliseconds timeout) const override;
};

} // namespace webtender
