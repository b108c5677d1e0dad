#pragma once
#include <memory>
#include "../core/FetchConfiguration.hpp"
#include "../interfaces/IAssetReader.hpp"
#include "../interfaces/IFetchBackend.hpp"
#include "../network/FetchBackendOptions.hpp"

namespace WebAsset {

struct Config;

// Entry point for the host pipeline. Holds the immutable fetch configuration
// and one fetch backend shared by every reader it creates.
//
// The host must install the reader returned by CreateReader() before its
// default asset source is wired up; this class does not enforce that order.
class WebAssetPlugin {
public:
    // Without a backend, the build's default one is created here.
    explicit WebAssetPlugin(FetchConfiguration config,
                            std::shared_ptr<IFetchBackend> backend = nullptr,
                            const FetchBackendOptions& options = FetchBackendOptions());

    static WebAssetPlugin FromConfig(const Config& config);

    // Wraps `local`; identifiers that are not http(s) URLs go to it untouched.
    std::unique_ptr<IAssetReader> CreateReader(std::unique_ptr<IAssetReader> local) const;

    const FetchConfiguration& Configuration() const { return config_; }
    const std::shared_ptr<IFetchBackend>& Backend() const { return backend_; }

private:
    FetchConfiguration config_;
    std::shared_ptr<IFetchBackend> backend_;
};

}
