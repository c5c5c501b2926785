#include "webtender/config.hpp"

#include "webtender/errors.hpp"
#include "webtender/util.hpp"

#include <utility>

namespace webtender {
namespace {

void fill_from_env(std::string& field, const char* name) {
    if (!field.empty()) {
        return;
    }
    if (auto value = get_env(name)) {
        field = std::move(*value);
    }
}

} // namespace

ClientConfig resolve_config(ClientConfig config) {
    fill_from_env(config.base_url, kEnvBaseUrl);
    fill_from_env(config.api_key, kEnvApiKey);
    fill_from_env(config.api_secret, kEnvApiSecret);

    if (config.base_url.empty()) {
        config.base_url = kDefaultBaseUrl;
    }
    if (config.api_key.empty()) {
        throw ConfigError(std::string(kEnvApiKey) + " is required");
    }
    if (config.api_secret.empty()) {
        throw ConfigError(std::string(kEnvApiSecret) + " is required");
    }
    return config;
}

void validate_config(const ClientConfig& config) {
    if (config.api_key.empty()) {
        throw ConfigError("API key is required");
    }
    if (config.api_secret.empty()) {
        throw ConfigError("API secret is required");
    }
    if (config.base_url.empty()) {
        throw ConfigError("Base URL is required");
    }
    if (!is_valid_url(config.base_url)) {
        throw ConfigError("Base URL is not a valid http(s) URL: " + config.base_url);
    }
    if (config.timeout.count() < 0) {
        throw ConfigError("Timeout must not be negative");
    }
}

} // namespace webtender
