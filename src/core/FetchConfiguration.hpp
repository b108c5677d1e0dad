#pragma once
#include <string>
#include <utility>
#include <vector>

namespace WebAsset {

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using QueryList = std::vector<std::pair<std::string, std::string>>;

// Set once when the plugin is built; read-only afterwards, so concurrent
// readers need no locking.
class FetchConfiguration {
public:
    FetchConfiguration() = default;
    FetchConfiguration(HeaderList headers, QueryList query, bool fake_extensions_enabled)
        : headers_(std::move(headers)), query_(std::move(query)), fake_extensions_enabled_(fake_extensions_enabled) {}

    // Sent in insertion order. Repeated names are sent as repeated headers.
    const HeaderList& Headers() const { return headers_; }
    // Appended to every network URL in insertion order.
    const QueryList& Query() const { return query_; }
    bool FakeExtensionsEnabled() const { return fake_extensions_enabled_; }

    bool operator==(const FetchConfiguration& other) const {
        return headers_ == other.headers_ && query_ == other.query_ &&
               fake_extensions_enabled_ == other.fake_extensions_enabled_;
    }
    bool operator!=(const FetchConfiguration& other) const { return !(*this == other); }

private:
    HeaderList headers_;
    QueryList query_;
    bool fake_extensions_enabled_ = false;
};

}
