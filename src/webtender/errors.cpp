#include "webtender/errors.hpp"

namespace webtender {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Config:
            return "config";
        case ErrorKind::RequestConstruction:
            return "request_construction";
        case ErrorKind::Signing:
            return "signing";
        case ErrorKind::BodyRead:
            return "body_read";
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Decode:
            return "decode";
        case ErrorKind::Status:
            return "status";
    }
    return "unknown";
}

} // namespace webtender
