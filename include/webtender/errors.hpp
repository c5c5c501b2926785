#pragma once

#include <stdexcept>
#include <string>

namespace webtender {

enum class ErrorKind {
    Config,
    RequestConstruction,
    Signing,
    BodyRead,
    Transport,
    Decode,
    Status
};

const char* to_string(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, long status_code = 0)
        : std::runtime_error(message), kind_(kind), status_code_(status_code) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] long status_code() const noexcept { return status_code_; }

private:
    ErrorKind kind_;
    long status_code_;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::Config, message) {}
};

class RequestConstructionError : public Error {
public:
    explicit RequestConstructionError(const std::string& message)
        : Error(ErrorKind::RequestConstruction, message) {}
};

class SigningError : public Error {
public:
    explicit SigningError(const std::string& message)
        : Error(ErrorKind::Signing, message) {}
};

// Reserved for unreadable request bodies. HttpRequest owns its body as a
// string, so signing never raises it.
class BodyReadError : public Error {
public:
    explicit BodyReadError(const std::string& message)
        : Error(ErrorKind::BodyRead, message) {}
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& message)
        : Error(ErrorKind::Transport, message) {}
};

} // namespace webtender
