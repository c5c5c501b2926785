#pragma once

#include <string>

namespace webtender {

// method:url:timestamp for an empty body, method:url:body:timestamp otherwise.
std::string canonical_message(const std::string& method,
                              const std::string& url,
                              const std::string& body,
                              long timestamp);

// Lowercase hex HMAC-SHA256. Throws SigningError if OpenSSL fails.
std::string hmac_sha256_hex(const std::string& key, const std::string& message);

std::string sign(const std::string& secret,
                 const std::string& method,
                 const std::string& url,
                 const std::string& body,
                 long timestamp);

} // namespace webtender
