#include <catch2/catch_all.hpp>
#include <memory>
#include <thread>
#include "core/WebAssetReader.hpp"
#include "support/Fakes.hpp"

using namespace WebAsset;
using namespace WebAssetTest;

namespace {

FetchResult EchoUrl(const RequestMetadata& request) {
    return MakeHttpResult(request.url, 200, Bytes(request.url));
}

struct Fixture {
    MemoryAssetReader* local = nullptr;
    std::shared_ptr<ScriptedFetchBackend> backend;
    std::unique_ptr<WebAssetReader> reader;

    explicit Fixture(FetchConfiguration config = FetchConfiguration(),
                     ScriptedFetchBackend::Responder responder = EchoUrl,
                     ScriptedFetchBackend::Mode mode = ScriptedFetchBackend::Mode::Immediate) {
        auto owned_local = std::make_unique<MemoryAssetReader>();
        local = owned_local.get();
        local->files["textures/a.png"] = Bytes("local-a");
        local->files["textures/a.png.meta"] = Bytes("meta-a");
        local->directories.insert("textures");
        local->failures["broken.png"] = ReadError{ReadErrorKind::LocalSourceError, "broken.png", 0, "disk on fire"};
        backend = std::make_shared<ScriptedFetchBackend>(std::move(responder), mode);
        reader = std::make_unique<WebAssetReader>(std::move(config), std::move(owned_local), backend);
    }

    ReadResult Read(const std::string& path, const CancellationToken& token = CancellationToken()) {
        ResultSink<ReadResult> sink;
        reader->Read(path, token, sink.Callback());
        REQUIRE(sink.WaitFor(1));
        return sink.Values().front();
    }
};

}

TEST_CASE("WebAssetReader rejects missing collaborators") {
    auto backend = std::make_shared<ScriptedFetchBackend>(EchoUrl);
    CHECK_THROWS_AS(WebAssetReader(FetchConfiguration(), nullptr, backend), std::invalid_argument);
    CHECK_THROWS_AS(WebAssetReader(FetchConfiguration(), std::make_unique<MemoryAssetReader>(), nullptr), std::invalid_argument);
}

TEST_CASE("Local identifiers pass through to the wrapped source") {
    Fixture f;

    ReadResult ok = f.Read("textures/a.png");
    REQUIRE(ok.Ok());
    CHECK(ok.bytes == Bytes("local-a"));

    ReadResult missing = f.Read("textures/none.png");
    REQUIRE(missing.error.has_value());
    CHECK(missing.error->kind == ReadErrorKind::NotFound);
    CHECK(missing.error->message == "missing");

    ReadResult broken = f.Read("broken.png");
    REQUIRE(broken.error.has_value());
    CHECK(broken.error->kind == ReadErrorKind::LocalSourceError);
    CHECK(broken.error->message == "disk on fire");

    CHECK(f.local->calls.load() == 3);
    CHECK(f.backend->Requests().empty());
}

TEST_CASE("Local metadata, directory and existence queries are forwarded") {
    Fixture f;

    ResultSink<ReadResult> meta;
    f.reader->ReadMeta("textures/a.png", CancellationToken(), meta.Callback());
    REQUIRE(meta.WaitFor(1));
    CHECK(meta.Values()[0].bytes == Bytes("meta-a"));

    ResultSink<FlagResult> dir;
    f.reader->IsDirectory("textures", dir.Callback());
    f.reader->IsDirectory("textures/a.png", dir.Callback());
    REQUIRE(dir.WaitFor(2));
    CHECK(dir.Values()[0].value);
    CHECK_FALSE(dir.Values()[1].value);

    ResultSink<DirectoryResult> listing;
    f.reader->ReadDirectory("textures", listing.Callback());
    REQUIRE(listing.WaitFor(1));
    REQUIRE(listing.Values()[0].Ok());
    CHECK(listing.Values()[0].entries == std::vector<std::string>{"textures/a.png", "textures/a.png.meta"});

    ResultSink<FlagResult> exists;
    f.reader->Exists("textures/a.png", exists.Callback());
    f.reader->Exists("nope.png", exists.Callback());
    REQUIRE(exists.WaitFor(2));
    CHECK(exists.Values()[0].value);
    CHECK_FALSE(exists.Values()[1].value);

    CHECK(f.local->calls.load() == 6);
    CHECK(f.backend->Requests().empty());
}

TEST_CASE("Network reads issue exactly one augmented request") {
    FetchConfiguration config({{"Authorization", "Bearer t"}, {"X-A", "1"}, {"X-A", "2"}}, {{"v", "3"}}, true);
    Fixture f(config);

    ReadResult result = f.Read("https://cdn.example.com/img/hero.bin.png");
    REQUIRE(result.Ok());
    CHECK(result.bytes == Bytes("https://cdn.example.com/img/hero.bin?v=3"));

    auto requests = f.backend->Requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].url == "https://cdn.example.com/img/hero.bin?v=3");
    CHECK(requests[0].headers == config.Headers());
    CHECK(f.local->calls.load() == 0);
}

TEST_CASE("Network failures are mapped against the caller's identifier") {
    auto responder = [](const RequestMetadata& request) {
        if (request.url.find("missing") != std::string::npos) return MakeHttpResult(request.url, 404, {});
        if (request.url.find("broken") != std::string::npos) return MakeHttpResult(request.url, 500, Bytes("oops"));
        if (request.url.find("offline") != std::string::npos) return MakeTransportFailure(request.url, "Connection refused");
        return EchoUrl(request);
    };
    Fixture f(FetchConfiguration({}, {{"k", "v"}}, false), responder);

    ReadResult missing = f.Read("https://x/missing.png");
    REQUIRE(missing.error.has_value());
    CHECK(missing.error->kind == ReadErrorKind::NotFound);
    CHECK(missing.error->path == "https://x/missing.png");
    CHECK(missing.bytes.empty());

    ReadResult broken = f.Read("https://x/broken.png");
    REQUIRE(broken.error.has_value());
    CHECK(broken.error->kind == ReadErrorKind::RequestFailed);
    CHECK(broken.error->status_code == 500);
    CHECK(broken.bytes.empty());

    ReadResult offline = f.Read("http://offline/a.png");
    REQUIRE(offline.error.has_value());
    CHECK(offline.error->kind == ReadErrorKind::TransportFailure);

    ReadResult bare = f.Read("https://");
    CHECK(f.backend->Requests().back().url == "https://?k=v");
    CHECK(f.backend->Requests().size() == 4);
    (void)bare;
}

TEST_CASE("Network metadata reads fetch the .meta companion") {
    Fixture f(FetchConfiguration({}, {{"q", "1"}}, false));
    ResultSink<ReadResult> sink;
    f.reader->ReadMeta("https://x/y.png", CancellationToken(), sink.Callback());
    REQUIRE(sink.WaitFor(1));
    CHECK(sink.Values()[0].bytes == Bytes("https://x/y.png.meta?q=1"));
    REQUIRE(f.backend->Requests().size() == 1);
    CHECK(f.local->calls.load() == 0);
}

TEST_CASE("Network directory and existence queries are answered without I/O") {
    Fixture f;

    ResultSink<FlagResult> dir;
    f.reader->IsDirectory("https://x/folder", dir.Callback());
    REQUIRE(dir.WaitFor(1));
    CHECK(dir.Values()[0].Ok());
    CHECK_FALSE(dir.Values()[0].value);

    ResultSink<DirectoryResult> listing;
    f.reader->ReadDirectory("https://x/folder", listing.Callback());
    REQUIRE(listing.WaitFor(1));
    REQUIRE(listing.Values()[0].error.has_value());
    CHECK(listing.Values()[0].error->kind == ReadErrorKind::NotFound);
    CHECK(listing.Values()[0].error->path == "https://x/folder");

    ResultSink<FlagResult> exists;
    f.reader->Exists("https://x/whatever.png", exists.Callback());
    REQUIRE(exists.WaitFor(1));
    CHECK(exists.Values()[0].value);

    CHECK(f.backend->Requests().empty());
    CHECK(f.local->calls.load() == 0);
}

TEST_CASE("Cancelling an in-flight network read resolves it as Cancelled") {
    Fixture f(FetchConfiguration(), EchoUrl, ScriptedFetchBackend::Mode::Deferred);
    CancellationSource source;
    ResultSink<ReadResult> sink;

    f.reader->Read("https://x/slow.png", source.Token(), sink.Callback());
    CHECK(sink.Count() == 0);
    CHECK(f.backend->Outstanding() == 1);

    source.Cancel();
    REQUIRE(sink.WaitFor(1));
    ReadResult result = sink.Values()[0];
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ReadErrorKind::Cancelled);
    CHECK(f.backend->Outstanding() == 0);

    // A late completion is not delivered a second time.
    f.backend->Release();
    CHECK(sink.Count() == 1);
}

TEST_CASE("Repeated reads of one URL each hit the network") {
    Fixture f;
    f.Read("https://x/same.png");
    f.Read("https://x/same.png");
    f.Read("https://x/same.png");
    CHECK(f.backend->Requests().size() == 3);
}

TEST_CASE("100 concurrent network reads all complete with their own bytes") {
    FetchConfiguration config({{"X-Client", "test"}}, {{"v", "1"}}, false);
    const FetchConfiguration before = config;

    // Declared ahead of the fixture so they outlive the backend's threads.
    std::mutex results_mutex;
    std::map<std::string, ReadResult> results;
    ResultSink<int> done;

    Fixture f(config, EchoUrl, ScriptedFetchBackend::Mode::Threaded);

    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&, t] {
            for (int i = t * 25; i < (t + 1) * 25; ++i) {
                std::string id = "https://cdn.example.com/asset" + std::to_string(i) + ".png";
                auto cb = done.Callback();
                f.reader->Read(id, CancellationToken(), [&, id, cb](ReadResult r) {
                    {
                        std::lock_guard<std::mutex> lock(results_mutex);
                        results[id] = std::move(r);
                    }
                    cb(1);
                });
            }
        });
    }
    for (auto& c : callers) c.join();

    REQUIRE(done.WaitFor(100));
    std::lock_guard<std::mutex> lock(results_mutex);
    REQUIRE(results.size() == 100);
    for (const auto& entry : results) {
        INFO(entry.first);
        REQUIRE(entry.second.Ok());
        CHECK(entry.second.bytes == Bytes(entry.first + "?v=1"));
    }
    CHECK(f.backend->Requests().size() == 100);
    CHECK(f.reader->Configuration() == before);
}

TEST_CASE("Change watching is forwarded for local paths only") {
    Fixture f;
    std::vector<std::string> changed;

    FlagResult local = f.reader->WatchForChanges("textures", [&](const std::string& path) { changed.push_back(path); });
    REQUIRE(local.Ok());
    CHECK(local.value);
    REQUIRE(f.local->watches.count("textures") == 1);

    f.local->watches["textures"]("textures/a.png");
    CHECK(changed == std::vector<std::string>{"textures/a.png"});

    FlagResult remote = f.reader->WatchForChanges("https://x/textures", [&](const std::string& path) { changed.push_back(path); });
    REQUIRE(remote.Ok());
    CHECK_FALSE(remote.value);
    CHECK(f.local->watches.size() == 1);
    CHECK(f.backend->Requests().empty());
}
