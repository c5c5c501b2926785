#include "webtender/http_client.hpp"

#include "webtender/errors.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>

namespace webtender {
namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// POST, PUT and PATCH always carry a Content-Length, even when it is zero.
bool sends_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

// curl_slist_append returns the existing head unless the list was empty.
void append_header(CurlSlistPtr& list, const std::string& line) {
    curl_slist* appended = curl_slist_append(list.get(), line.c_str());
    if (appended == nullptr) {
        throw TransportError("Failed to allocate request headers");
    }
    if (!list) {
        list.reset(appended);
    }
}

RequestTimings collect_timings(CURL* handle) {
    RequestTimings timings;
    double value = 0.0;

    if (curl_easy_getinfo(handle, CURLINFO_NAMELOOKUP_TIME, &value) == CURLE_OK) {
        timings.name_lookup_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &value) == CURLE_OK) {
        timings.connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_APPCONNECT_TIME, &value) == CURLE_OK) {
        timings.app_connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_PRETRANSFER_TIME, &value) == CURLE_OK) {
        timings.pre_transfer_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_STARTTRANSFER_TIME, &value) == CURLE_OK) {
        timings.start_transfer_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &value) == CURLE_OK) {
        timings.total_ms = value * 1000.0;
    }

    return timings;
}

} // namespace

long clamp_timeout_ms(std::chrono::milliseconds timeout) noexcept {
    constexpr auto max_ms = static_cast<std::chrono::milliseconds::rep>(std::numeric_limits<long>::max());
    if (timeout.count() <= 0) {
        return 0;
    }
    return static_cast<long>(std::min(timeout.count(), max_ms));
}

void HttpRequest::set_header(const std::string& name, std::string value) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&name](const auto& entry) { return iequals(entry.first, name); }),
                  headers.end());
    headers.emplace_back(name, std::move(value));
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

CurlTransport::CurlTransport() {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw TransportError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

HttpResponse CurlTransport::send(const HttpRequest& request,
                                 std::chrono::milliseconds timeout) const {
    CurlEasyPtr handle(curl_easy_init());
    if (!handle) {
        throw TransportError("Failed to create CURL easy handle");
    }

    std::string response_body;
    curl_easy_setopt(handle.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, clamp_timeout_ms(timeout));
    curl_easy_setopt(handle.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    CurlSlistPtr header_list;
    for (const auto& header : request.headers) {
        append_header(header_list, header.first + ": " + header.second);
    }
    // Suppress "Expect: 100-continue" on larger bodies.
    append_header(header_list, "Expect:");

    const bool with_body = !request.body.empty() || sends_body(request.method);
    if (with_body && !request.header("Content-Type")) {
        // Otherwise curl labels the body application/x-www-form-urlencoded.
        append_header(header_list, "Content-Type:");
    }
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());

    if (with_body) {
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    const auto perform_code = curl_easy_perform(handle.get());

    long status_code = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status_code);

    HttpResponse response;
    response.status_code = status_code;
    response.timings = collect_timings(handle.get());

    if (perform_code != CURLE_OK) {
        if (status_code == 0) {
            throw TransportError("libcurl request failed: " + std::string(curl_easy_strerror(perform_code)));
        }
        response.read_error = "failed to read response body: " + std::string(curl_easy_strerror(perform_code));
    }

    response.body = std::move(response_body);
    return response;
}

} // namespace webtender
