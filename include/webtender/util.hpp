#pragma once

#include <optional>
#include <string>

namespace webtender {

// Joins base and path with exactly one '/' between them. One trailing slash
// is stripped from base and one leading slash from path.
std::string join_url(const std::string& base, const std::string& path);

// RFC 7230 token: non-empty, no whitespace or separators.
bool is_valid_method(const std::string& method);

// Absolute http(s) URL with a host, as accepted by libcurl's URL parser.
bool is_valid_url(const std::string& url);

std::string trim(std::string value);

std::optional<std::string> get_env(const std::string& name);

// Loads KEY=VALUE lines into the process environment. Variables that are
// already set are left untouched. Returns false if the file can't be opened.
bool load_env_file(const std::string& path);

} // namespace webtender
