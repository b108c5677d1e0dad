#pragma once
#include <string>

namespace WebAsset {

enum class RequestKind {
    Network,
    Local
};

// Network iff the identifier starts with exactly "http://" or "https://".
// Case-sensitive; nothing after the scheme is inspected.
RequestKind Classify(const std::string& identifier);

inline bool IsNetworkIdentifier(const std::string& identifier) {
    return Classify(identifier) == RequestKind::Network;
}

}
