#pragma once
#include "../interfaces/IFetchBackend.hpp"
#include "FetchBackendOptions.hpp"

namespace WebAsset {

// In-browser backend on top of the Emscripten Fetch API. Everything runs on
// the browser event loop: Fetch() returns at once and the callback fires from
// the fetch's success or error handler.
//
// Cancelling delivers Cancelled right away. The browser request itself is
// left to finish and is closed by its own completion handler.
class EmscriptenFetchBackend : public IFetchBackend {
public:
    explicit EmscriptenFetchBackend(FetchBackendOptions options = {});

    void Fetch(const RequestMetadata& request, const CancellationToken& token, Callback cb) override;

private:
    FetchBackendOptions options_;
};

}
