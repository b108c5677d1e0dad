#include "FetchBackendFactory.hpp"
#ifdef __EMSCRIPTEN__
#include "EmscriptenFetchBackend.hpp"
#else
#include "CurlFetchBackend.hpp"
#endif

namespace WebAsset {

std::shared_ptr<IFetchBackend> MakeDefaultFetchBackend(const FetchBackendOptions& options) {
#ifdef __EMSCRIPTEN__
    return std::make_shared<EmscriptenFetchBackend>(options);
#else
    return std::make_shared<CurlFetchBackend>(options);
#endif
}

}
