#include "webtender/util.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>

namespace webtender {
namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

struct CurlStringDeleter {
    void operator()(char* value) const { curl_free(value); }
};

using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    constexpr const char* extra = "!#$%&'*+-.^_`|~";
    return c != '\0' && std::strchr(extra, c) != nullptr;
}

std::optional<std::string> url_part(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return std::nullopt;
    }
    CurlStringPtr value(raw);
    return std::string(value.get());
}

} // namespace

std::string join_url(const std::string& base, const std::string& path) {
    std::string left = base;
    if (!left.empty() && left.back() == '/') {
        left.pop_back();
    }
    std::string right = path;
    if (!right.empty() && right.front() == '/') {
        right.erase(0, 1);
    }
    return left + '/' + right;
}

bool is_valid_method(const std::string& method) {
    if (method.empty()) {
        return false;
    }
    return std::all_of(method.begin(), method.end(), [](unsigned char c) {
        return is_token_char(c);
    });
}

bool is_valid_url(const std::string& url) {
    if (url.empty()) {
        return false;
    }
    if (std::any_of(url.begin(), url.end(), [](unsigned char c) {
            return std::isspace(c) || std::iscntrl(c);
        })) {
        return false;
    }

    CurlUrlPtr handle(curl_url());
    if (!handle) {
        return false;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return false;
    }

    const auto scheme = url_part(handle.get(), CURLUPART_SCHEME);
    if (!scheme || (*scheme != "http" && *scheme != "https")) {
        return false;
    }
    const auto host = url_part(handle.get(), CURLUPART_HOST);
    return host.has_value() && !host->empty();
}

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

bool load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    return true;
}

} // namespace webtender
