#pragma once

#include "webtender/config.hpp"
#include "webtender/errors.hpp"
#include "webtender/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace webtender {

struct ApiResponse {
    long status = 0;
    nlohmann::json data = nlohmann::json::object();
    RequestTimings timings;
};

// Outcome of a request that reached the server. `error` carries a body read
// failure, a decode failure or a status > 299; `response` is always filled.
struct ApiResult {
    ApiResponse response;
    std::optional<Error> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

class Client {
public:
    // Throws ConfigError on missing or malformed settings. A null transport
    // selects CurlTransport.
    explicit Client(ClientConfig config,
                    std::shared_ptr<const HttpTransport> transport = nullptr);

    // Resolves WEBTENDER_API_KEY, WEBTENDER_API_SECRET and
    // WEBTENDER_API_BASE_URL from the environment.
    static Client from_env(std::shared_ptr<const HttpTransport> transport = nullptr);

    HttpRequest build_request(const std::string& method,
                              const std::string& path,
                              std::string body = {}) const;

    HttpRequest get_request(const std::string& path) const;
    HttpRequest post_request(const std::string& path, std::string body) const;
    HttpRequest patch_request(const std::string& path, std::string body) const;
    HttpRequest put_request(const std::string& path, std::string body) const;
    HttpRequest delete_request(const std::string& path) const;

    // Stamps X-API-Key, X-Timestamp and X-Signature using the current time.
    void sign_request(HttpRequest& request) const;

    // Throws TransportError when the request never produced a response.
    ApiResult execute(const HttpRequest& request) const;

    ApiResult get(const std::string& path) const;
    ApiResult post(const std::string& path, std::string body) const;
    ApiResult patch(const std::string& path, std::string body) const;
    ApiResult put(const std::string& path, std::string body) const;
    ApiResult del(const std::string& path) const;

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    Credentials credentials_;
    std::string base_url_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<const HttpTransport> transport_;
};

} // namespace webtender
