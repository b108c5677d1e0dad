#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../interfaces/IFetchBackend.hpp"

namespace WebAsset {

// Shared by both backends so that a given HTTP status classifies the same
// way whichever network primitive produced it.
// 2xx -> success, 404 -> NotFound, anything else -> RequestFailed(status).
FetchResult MakeHttpResult(std::string url, long status_code, std::vector<uint8_t> body);

FetchResult MakeTransportFailure(std::string url, std::string message);

FetchResult MakeCancelled(std::string url);

}
