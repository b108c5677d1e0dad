#include "RequestClassifier.hpp"
#include <cstring>

namespace WebAsset {

namespace {

bool StartsWith(const std::string& s, const char* prefix) {
    const size_t n = std::strlen(prefix);
    return s.size() >= n && std::memcmp(s.data(), prefix, n) == 0;
}

}

RequestKind Classify(const std::string& identifier) {
    if (StartsWith(identifier, "http://") || StartsWith(identifier, "https://")) {
        return RequestKind::Network;
    }
    return RequestKind::Local;
}

}
