#include "webtender/client.hpp"
#include "webtender/config.hpp"
#include "webtender/errors.hpp"
#include "webtender/signer.hpp"

#include "fake_transport.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace {

// Sets or clears a variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(std::string name, std::optional<std::string> value) : name_(std::move(name)) {
        if (const char* previous = std::getenv(name_.c_str())) {
            previous_ = previous;
        }
        if (value) {
            setenv(name_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST_CASE("resolve_config reads credentials from the environment") {
    ScopedEnv key(webtender::kEnvApiKey, std::string("env-key"));
    ScopedEnv secret(webtender::kEnvApiSecret, std::string("env-secret"));
    ScopedEnv base(webtender::kEnvBaseUrl, std::nullopt);

    const auto config = webtender::resolve_config();
    CHECK(config.api_key == "env-key");
    CHECK(config.api_secret == "env-secret");
    CHECK(config.base_url == webtender::kDefaultBaseUrl);
}

TEST_CASE("resolve_config prefers explicit values") {
    ScopedEnv key(webtender::kEnvApiKey, std::string("env-key"));
    ScopedEnv secret(webtender::kEnvApiSecret, std::string("env-secret"));
    ScopedEnv base(webtender::kEnvBaseUrl, std::string("https://staging.webtender.host/api"));

    webtender::ClientConfig explicit_config;
    explicit_config.api_key = "explicit-key";
    const auto config = webtender::resolve_config(explicit_config);

    CHECK(config.api_key == "explicit-key");
    CHECK(config.api_secret == "env-secret");
    CHECK(config.base_url == "https://staging.webtender.host/api");
}

TEST_CASE("resolve_config requires key and secret") {
    ScopedEnv base(webtender::kEnvBaseUrl, std::nullopt);

    SECTION("missing key") {
        ScopedEnv key(webtender::kEnvApiKey, std::nullopt);
        ScopedEnv secret(webtender::kEnvApiSecret, std::string("env-secret"));
        CHECK_THROWS_AS(webtender::resolve_config(), webtender::ConfigError);
    }
    SECTION("empty secret") {
        ScopedEnv key(webtender::kEnvApiKey, std::string("env-key"));
        ScopedEnv secret(webtender::kEnvApiSecret, std::string(""));
        CHECK_THROWS_AS(webtender::resolve_config(), webtender::ConfigError);
    }
}

TEST_CASE("validate_config checks the base URL") {
    webtender::ClientConfig config;
    config.api_key = "key";
    config.api_secret = "secret";
    config.base_url = webtender::kDefaultBaseUrl;
    CHECK_NOTHROW(webtender::validate_config(config));

    config.base_url = "webtender";
    CHECK_THROWS_AS(webtender::validate_config(config), webtender::ConfigError);

    config.base_url = webtender::kDefaultBaseUrl;
    config.timeout = std::chrono::milliseconds(-1);
    CHECK_THROWS_AS(webtender::validate_config(config), webtender::ConfigError);
}

TEST_CASE("error kinds have stable names") {
    CHECK(std::string(webtender::to_string(webtender::ErrorKind::Config)) == "config");
    CHECK(std::string(webtender::to_string(webtender::ErrorKind::BodyRead)) == "body_read");
    CHECK(std::string(webtender::to_string(webtender::ErrorKind::Status)) == "status");

    const webtender::BodyReadError error("failed to read request body");
    CHECK(error.kind() == webtender::ErrorKind::BodyRead);
}

TEST_CASE("Client::from_env builds a working client from the environment") {
    ScopedEnv key(webtender::kEnvApiKey, std::string("env-key"));
    ScopedEnv secret(webtender::kEnvApiSecret, std::string("env-secret"));
    ScopedEnv base(webtender::kEnvBaseUrl, std::string("https://staging.webtender.host/api/"));

    auto transport = std::make_shared<webtender::testing::FakeTransport>(
        [](const webtender::HttpRequest&) { return webtender::testing::respond(200, R"({"id":"srv-1"})"); });

    const auto client = webtender::Client::from_env(transport);
    CHECK(client.base_url() == "https://staging.webtender.host/api/");
    CHECK(client.timeout() == webtender::kDefaultTimeout);

    const auto result = client.get("/v1/servers/srv-1");
    REQUIRE(result.ok());
    CHECK(result.response.data["id"] == "srv-1");

    const auto requests = transport->requests();
    REQUIRE(requests.size() == 1);
    const auto& sent = requests.front();
    CHECK(sent.url == "https://staging.webtender.host/api/v1/servers/srv-1");
    CHECK(sent.header("X-API-Key") == std::optional<std::string>("env-key"));

    const auto timestamp = sent.header("X-Timestamp");
    REQUIRE(timestamp.has_value());
    CHECK(sent.header("X-Signature") ==
          std::optional<std::string>(webtender::sign("env-secret", "GET", sent.url, "", std::stol(*timestamp))));
}

TEST_CASE("Client::from_env falls back to the default base URL") {
    ScopedEnv key(webtender::kEnvApiKey, std::string("env-key"));
    ScopedEnv secret(webtender::kEnvApiSecret, std::string("env-secret"));
    ScopedEnv base(webtender::kEnvBaseUrl, std::nullopt);

    auto transport = std::make_shared<webtender::testing::FakeTransport>(
        [](const webtender::HttpRequest&) { return webtender::testing::respond(200, "{}"); });

    const auto client = webtender::Client::from_env(transport);
    CHECK(client.base_url() == webtender::kDefaultBaseUrl);
}

TEST_CASE("Client::from_env fails without credentials") {
    ScopedEnv key(webtender::kEnvApiKey, std::nullopt);
    ScopedEnv secret(webtender::kEnvApiSecret, std::nullopt);

    auto transport = std::make_shared<webtender::testing::FakeTransport>(
        [](const webtender::HttpRequest&) { return webtender::testing::respond(200, "{}"); });

    CHECK_THROWS_AS(webtender::Client::from_env(transport), webtender::ConfigError);
    CHECK(transport->requests().empty());
}
