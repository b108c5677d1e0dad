#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../core/Cancellation.hpp"
#include "../core/RequestAugmenter.hpp"

namespace WebAsset {

enum class FetchFailureKind {
    NotFound,       // HTTP 404
    RequestFailed,  // any other status outside 200-299
    Transport,      // DNS, connect, TLS, timeout, redirect loop, sandbox network error
    Cancelled
};

struct FetchFailure {
    FetchFailureKind kind = FetchFailureKind::Transport;
    long status_code = 0;
    std::string message;
};

struct FetchResult {
    std::string url;  // augmented URL the request went to
    long status_code = 0;
    std::vector<uint8_t> body;  // complete body; empty on failure
    std::optional<FetchFailure> failure;

    bool Ok() const { return !failure.has_value(); }
};

// One GET per call, no retries. The callback fires exactly once, only after
// the whole response has arrived or the request has failed.
class IFetchBackend {
public:
    using Callback = std::function<void(FetchResult)>;
    virtual ~IFetchBackend() = default;
    virtual void Fetch(const RequestMetadata& request, const CancellationToken& token, Callback cb) = 0;
};

}
