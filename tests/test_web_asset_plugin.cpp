#include <catch2/catch_all.hpp>
#include "plugin/WebAssetPlugin.hpp"
#include "config/Config.hpp"
#include "support/Fakes.hpp"

using namespace WebAsset;
using namespace WebAssetTest;

TEST_CASE("WebAssetPlugin builds readers that share its backend") {
    auto backend = std::make_shared<ScriptedFetchBackend>([](const RequestMetadata& request) {
        return MakeHttpResult(request.url, 200, Bytes("net"));
    });
    WebAssetPlugin plugin(FetchConfiguration({{"X-A", "1"}}, {{"q", "1"}}, false), backend);
    CHECK(plugin.Backend() == backend);

    auto first = plugin.CreateReader(std::make_unique<MemoryAssetReader>());
    auto second = plugin.CreateReader(std::make_unique<MemoryAssetReader>());

    ResultSink<ReadResult> sink;
    first->Read("https://x/a.png", CancellationToken(), sink.Callback());
    second->Read("https://x/b.png", CancellationToken(), sink.Callback());
    REQUIRE(sink.WaitFor(2));

    auto requests = backend->Requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].url == "https://x/a.png?q=1");
    CHECK(requests[1].url == "https://x/b.png?q=1");
    CHECK(requests[1].headers.size() == 1);
}

TEST_CASE("WebAssetPlugin creates a default backend when none is given") {
    Config config;
    config.fake_extensions = true;
    config.query = {{"k", "v"}};
    WebAssetPlugin plugin = WebAssetPlugin::FromConfig(config);
    REQUIRE(plugin.Backend() != nullptr);
    CHECK(plugin.Configuration().FakeExtensionsEnabled());
    CHECK(plugin.Configuration().Query().size() == 1);

    auto local = std::make_unique<MemoryAssetReader>();
    local->files["a.txt"] = Bytes("local");
    auto reader = plugin.CreateReader(std::move(local));

    ResultSink<ReadResult> sink;
    reader->Read("a.txt", CancellationToken(), sink.Callback());
    REQUIRE(sink.WaitFor(1));
    CHECK(sink.Values()[0].bytes == Bytes("local"));
}
