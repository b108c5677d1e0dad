#include "FetchResponse.hpp"

namespace WebAsset {

FetchResult MakeHttpResult(std::string url, long status_code, std::vector<uint8_t> body) {
    FetchResult result;
    result.url = std::move(url);
    result.status_code = status_code;
    if (status_code >= 200 && status_code <= 299) {
        result.body = std::move(body);
        return result;
    }

    FetchFailure failure;
    failure.status_code = status_code;
    if (status_code == 404) {
        failure.kind = FetchFailureKind::NotFound;
        failure.message = "not found";
    } else {
        failure.kind = FetchFailureKind::RequestFailed;
        failure.message = "HTTP status " + std::to_string(status_code);
    }
    result.failure = std::move(failure);
    return result;
}

FetchResult MakeTransportFailure(std::string url, std::string message) {
    FetchResult result;
    result.url = std::move(url);
    result.failure = FetchFailure{FetchFailureKind::Transport, 0, std::move(message)};
    return result;
}

FetchResult MakeCancelled(std::string url) {
    FetchResult result;
    result.url = std::move(url);
    result.failure = FetchFailure{FetchFailureKind::Cancelled, 0, "request cancelled"};
    return result;
}

}
