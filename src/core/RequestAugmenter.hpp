#pragma once
#include <string>
#include "FetchConfiguration.hpp"

namespace WebAsset {

// What actually goes on the wire for one network read. Built fresh per
// request and never cached.
struct RequestMetadata {
    std::string url;
    HeaderList headers;
};

// Augmented URL for `identifier`: fake extension stripped when enabled,
// then `path_suffix` appended to the path, then the configured query.
std::string BuildRequestUrl(const std::string& identifier, const FetchConfiguration& config,
                            const std::string& path_suffix = std::string());

RequestMetadata Augment(const std::string& identifier, const FetchConfiguration& config);

// Same as Augment() but targets the companion "<asset>.meta" file.
RequestMetadata AugmentMeta(const std::string& identifier, const FetchConfiguration& config);

}
