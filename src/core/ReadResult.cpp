#include "ReadResult.hpp"

namespace WebAsset {

const char* ToString(ReadErrorKind kind) {
    switch (kind) {
        case ReadErrorKind::NotFound:         return "NotFound";
        case ReadErrorKind::RequestFailed:    return "RequestFailed";
        case ReadErrorKind::TransportFailure: return "TransportFailure";
        case ReadErrorKind::Cancelled:        return "Cancelled";
        case ReadErrorKind::LocalSourceError: return "LocalSourceError";
    }
    return "Unknown";
}

std::string ReadError::Describe() const {
    std::string out = ToString(kind);
    if (status_code != 0) {
        out += " (" + std::to_string(status_code) + ")";
    }
    if (!path.empty()) {
        out += ": " + path;
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

}
