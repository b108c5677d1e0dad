#include "WebAssetPlugin.hpp"
#include "../../config/Config.hpp"
#include "../core/WebAssetReader.hpp"
#include "../network/FetchBackendFactory.hpp"
#include "../utils/Logger.hpp"

namespace WebAsset {

WebAssetPlugin::WebAssetPlugin(FetchConfiguration config, std::shared_ptr<IFetchBackend> backend, const FetchBackendOptions& options)
    : config_(std::move(config)), backend_(std::move(backend)) {
    if (!backend_) {
        backend_ = MakeDefaultFetchBackend(options);
    }
    Logger::Log(LogLevel::Debug, "WebAssetPlugin configured with " + std::to_string(config_.Headers().size()) + " header(s), " +
                                 std::to_string(config_.Query().size()) + " query parameter(s), fake extensions " +
                                 (config_.FakeExtensionsEnabled() ? "on" : "off"));
}

WebAssetPlugin WebAssetPlugin::FromConfig(const Config& config) {
    return WebAssetPlugin(config.ToFetchConfiguration(), nullptr, config.ToBackendOptions());
}

std::unique_ptr<IAssetReader> WebAssetPlugin::CreateReader(std::unique_ptr<IAssetReader> local) const {
    return std::make_unique<WebAssetReader>(config_, std::move(local), backend_);
}

}
