#include "webtender/client.hpp"

#include "webtender/signer.hpp"
#include "webtender/util.hpp"

#include <utility>

namespace webtender {
namespace {

long current_timestamp_s() {
    using namespace std::chrono;
    return static_cast<long>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

std::string status_message(long status, const nlohmann::json& data) {
    std::string message = "status: " + std::to_string(status);
    if (data.is_object()) {
        const auto it = data.find("message");
        if (it != data.end() && it->is_string()) {
            message += ": " + it->get<std::string>();
        }
    }
    return message;
}

} // namespace

Client::Client(ClientConfig config, std::shared_ptr<const HttpTransport> transport)
    : credentials_{},
      base_url_{},
      timeout_{config.timeout.count() == 0 ? kDefaultTimeout : config.timeout},
      transport_(std::move(transport)) {
    validate_config(config);
    credentials_ = Credentials{std::move(config.api_key), std::move(config.api_secret)};
    base_url_ = std::move(config.base_url);
    if (!transport_) {
        transport_ = std::make_shared<CurlTransport>();
    }
}

Client Client::from_env(std::shared_ptr<const HttpTransport> transport) {
    return Client(resolve_config(), std::move(transport));
}

HttpRequest Client::build_request(const std::string& method,
                                  const std::string& path,
                                  std::string body) const {
    if (!is_valid_method(method)) {
        throw RequestConstructionError("failed to create request: invalid method '" + method + "'");
    }

    HttpRequest request;
    request.method = method;
    request.url = join_url(base_url_, path);
    if (!is_valid_url(request.url)) {
        throw RequestConstructionError("failed to create request: invalid URL '" + request.url + "'");
    }
    request.body = std::move(body);

    request.set_header("Accept", "application/json");
    if (!request.body.empty()) {
        request.set_header("Content-Type", "application/json");
    }

    sign_request(request);
    return request;
}

HttpRequest Client::get_request(const std::string& path) const {
    return build_request("GET", path);
}

HttpRequest Client::post_request(const std::string& path, std::string body) const {
    return build_request("POST", path, std::move(body));
}

HttpRequest Client::patch_request(const std::string& path, std::string body) const {
    return build_request("PATCH", path, std::move(body));
}

HttpRequest Client::put_request(const std::string& path, std::string body) const {
    return build_request("PUT", path, std::move(body));
}

HttpRequest Client::delete_request(const std::string& path) const {
    return build_request("DELETE", path);
}

void Client::sign_request(HttpRequest& request) const {
    const auto timestamp = current_timestamp_s();
    auto signature = sign(credentials_.api_secret, request.method, request.url, request.body, timestamp);

    request.set_header("X-API-Key", credentials_.api_key);
    request.set_header("X-Timestamp", std::to_string(timestamp));
    request.set_header("X-Signature", std::move(signature));
}

ApiResult Client::execute(const HttpRequest& request) const {
    auto raw = transport_->send(request, timeout_);

    ApiResult result;
    result.response.status = raw.status_code;
    result.response.timings = raw.timings;

    if (raw.read_error) {
        result.error.emplace(ErrorKind::BodyRead, *raw.read_error, raw.status_code);
        return result;
    }

    try {
        result.response.data = nlohmann::json::parse(raw.body);
    } catch (const nlohmann::json::parse_error& ex) {
        result.error.emplace(ErrorKind::Decode,
                             "failed to decode response body: " + std::string(ex.what()),
                             raw.status_code);
        return result;
    }

    if (raw.status_code > 299) {
        result.error.emplace(ErrorKind::Status,
                             status_message(raw.status_code, result.response.data),
                             raw.status_code);
    }
    return result;
}

ApiResult Client::get(const std::string& path) const {
    return execute(get_request(path));
}

ApiResult Client::post(const std::string& path, std::string body) const {
    return execute(post_request(path, std::move(body)));
}

ApiResult Client::patch(const std::string& path, std::string body) const {
    return execute(patch_request(path, std::move(body)));
}

ApiResult Client::put(const std::string& path, std::string body) const {
    return execute(put_request(path, std::move(body)));
}

ApiResult Client::del(const std::string& path) const {
    return execute(delete_request(path));
}

} // namespace webtender
