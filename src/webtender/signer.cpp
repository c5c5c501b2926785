#include "webtender/signer.hpp"

#include "webtender/errors.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iomanip>
#include <sstream>

namespace webtender {

std::string canonical_message(const std::string& method,
                              const std::string& url,
                              const std::string& body,
                              long timestamp) {
    std::string message = method + ':' + url;
    if (!body.empty()) {
        message += ':';
        message += body;
    }
    message += ':';
    message += std::to_string(timestamp);
    return message;
}

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
    unsigned int len = 0;
    unsigned char buffer[EVP_MAX_MD_SIZE];

    const unsigned char* digest = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        buffer,
        &len);

    if (digest == nullptr) {
        throw SigningError("Failed to create HMAC signature");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(buffer[i]);
    }

    return oss.str();
}

std::string sign(const std::string& secret,
                 const std::string& method,
                 const std::string& url,
                 const std::string& body,
                 long timestamp) {
    return hmac_sha256_hex(secret, canonical_message(method, url, body, timestamp));
}

} // namespace webtender
