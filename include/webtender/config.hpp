#pragma once

#include <chrono>
#include <string>

namespace webtender {

inline constexpr const char* kDefaultBaseUrl = "https://api.webtender.host/api";
inline constexpr std::chrono::milliseconds kDefaultTimeout{30000};

inline constexpr const char* kEnvBaseUrl = "WEBTENDER_API_BASE_URL";
inline constexpr const char* kEnvApiKey = "WEBTENDER_API_KEY";
inline constexpr const char* kEnvApiSecret = "WEBTENDER_API_SECRET";

struct Credentials {
    std::string api_key;
    std::string api_secret;
};

struct ClientConfig {
    std::string api_key;
    std::string api_secret;
    std::string base_url;
    // Zero selects kDefaultTimeout.
    std::chrono::milliseconds timeout{0};
};

// Fills empty fields from WEBTENDER_* environment variables, then defaults.
// Values already present in `config` win. Throws ConfigError when the key or
// secret is still missing.
ClientConfig resolve_config(ClientConfig config = {});

// Throws ConfigError unless key, secret and base URL are usable.
void validate_config(const ClientConfig& config);

} // namespace webtender
