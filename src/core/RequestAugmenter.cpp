#include "RequestAugmenter.hpp"
#include "../utils/UrlUtil.hpp"

namespace WebAsset {

namespace {
const char* const kMetaSuffix = ".meta";
}

std::string BuildRequestUrl(const std::string& identifier, const FetchConfiguration& config,
                            const std::string& path_suffix) {
    std::string url = config.FakeExtensionsEnabled() ? UrlUtil::StripFinalExtension(identifier) : identifier;
    if (!path_suffix.empty()) {
        url = UrlUtil::AppendToPath(url, path_suffix);
    }
    return UrlUtil::AppendQuery(url, config.Query());
}

RequestMetadata Augment(const std::string& identifier, const FetchConfiguration& config) {
    return RequestMetadata{BuildRequestUrl(identifier, config), config.Headers()};
}

RequestMetadata AugmentMeta(const std::string& identifier, const FetchConfiguration& config) {
    return RequestMetadata{BuildRequestUrl(identifier, config, kMetaSuffix), config.Headers()};
}

}
