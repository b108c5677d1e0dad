#pragma once
#include <memory>
#include "../interfaces/IFetchBackend.hpp"
#include "FetchBackendOptions.hpp"

namespace WebAsset {

// The backend for the target this library was built for: Emscripten Fetch in
// the browser, libcurl everywhere else.
std::shared_ptr<IFetchBackend> MakeDefaultFetchBackend(const FetchBackendOptions& options);

}
