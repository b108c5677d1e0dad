#include <catch2/catch_all.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>
#include "storage/FileAssetReader.hpp"
#include "utils/Logger.hpp"
#include "support/Fakes.hpp"
#include "support/TempDir.hpp"

using namespace WebAsset;
using namespace WebAssetTest;

namespace {

ReadResult ReadFrom(IAssetReader& reader, const std::string& path, const CancellationToken& token = CancellationToken()) {
    ResultSink<ReadResult> sink;
    reader.Read(path, token, sink.Callback());
    REQUIRE(sink.WaitFor(1));
    return sink.Values().front();
}

bool WaitForChange(const ResultSink<std::string>& sink, const std::string& path, size_t occurrences = 1) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto values = sink.Values();
        if (static_cast<size_t>(std::count(values.begin(), values.end(), path)) >= occurrences) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

}

TEST_CASE("FileAssetReader reads files relative to its root") {
    TempDir dir;
    dir.Write("textures/a.png", std::string("\x89PNG\0data", 9));
    ThreadPool pool(2);
    FileAssetReader reader(dir.Path(), pool);

    ReadResult result = ReadFrom(reader, "textures/a.png");
    REQUIRE(result.Ok());
    CHECK(result.Size() == 9);
    CHECK(result.bytes[0] == 0x89);
    CHECK(result.bytes[4] == 0);
}

TEST_CASE("FileAssetReader reports missing files and directories distinctly") {
    TempDir dir;
    dir.Write("textures/a.png", "a");
    ThreadPool pool(2);
    FileAssetReader reader(dir.Path(), pool);

    ReadResult missing = ReadFrom(reader, "textures/none.png");
    REQUIRE(missing.error.has_value());
    CHECK(missing.error->kind == ReadErrorKind::NotFound);
    CHECK(missing.error->path == "textures/none.png");

    ReadResult folder = ReadFrom(reader, "textures");
    REQUIRE(folder.error.has_value());
    CHECK(folder.error->kind == ReadErrorKind::LocalSourceError);
}

TEST_CASE("FileAssetReader refuses paths outside its root") {
    TempDir dir;
    ThreadPool pool(1);
    FileAssetReader reader(dir.Path() / "assets", pool);

    ReadResult escaped = ReadFrom(reader, "../secret.txt");
    REQUIRE(escaped.error.has_value());
    CHECK(escaped.error->kind == ReadErrorKind::LocalSourceError);

    ReadResult absolute = ReadFrom(reader, "/etc/hostname");
    REQUIRE(absolute.error.has_value());
    CHECK(absolute.error->kind == ReadErrorKind::LocalSourceError);
}

TEST_CASE("FileAssetReader reads companion metadata") {
    TempDir dir;
    dir.Write("a.png.meta", "(meta)");
    ThreadPool pool(1);
    FileAssetReader reader(dir.Path(), pool);

    ResultSink<ReadResult> sink;
    reader.ReadMeta("a.png", CancellationToken(), sink.Callback());
    REQUIRE(sink.WaitFor(1));
    REQUIRE(sink.Values()[0].Ok());
    CHECK(std::string(sink.Values()[0].bytes.begin(), sink.Values()[0].bytes.end()) == "(meta)");
}

TEST_CASE("FileAssetReader answers directory queries") {
    TempDir dir;
    dir.Write("textures/b.png", "b");
    dir.Write("textures/a.png", "a");
    dir.Write("textures/sub/c.png", "c");
    ThreadPool pool(2);
    FileAssetReader reader(dir.Path(), pool);

    ResultSink<FlagResult> is_dir;
    reader.IsDirectory("textures", is_dir.Callback());
    REQUIRE(is_dir.WaitFor(1));
    CHECK(is_dir.Values()[0].value);

    ResultSink<FlagResult> is_file_dir;
    reader.IsDirectory("textures/a.png", is_file_dir.Callback());
    REQUIRE(is_file_dir.WaitFor(1));
    CHECK_FALSE(is_file_dir.Values()[0].value);

    ResultSink<DirectoryResult> listing;
    reader.ReadDirectory("textures", listing.Callback());
    REQUIRE(listing.WaitFor(1));
    REQUIRE(listing.Values()[0].Ok());
    CHECK(listing.Values()[0].entries == std::vector<std::string>{"textures/a.png", "textures/b.png", "textures/sub"});

    ResultSink<DirectoryResult> missing;
    reader.ReadDirectory("nothing", missing.Callback());
    REQUIRE(missing.WaitFor(1));
    REQUIRE(missing.Values()[0].error.has_value());
    CHECK(missing.Values()[0].error->kind == ReadErrorKind::NotFound);

    ResultSink<FlagResult> exists;
    reader.Exists("textures/b.png", exists.Callback());
    REQUIRE(exists.WaitFor(1));
    CHECK(exists.Values()[0].value);

    ResultSink<FlagResult> absent;
    reader.Exists("textures/z.png", absent.Callback());
    REQUIRE(absent.WaitFor(1));
    CHECK_FALSE(absent.Values()[0].value);
}

TEST_CASE("FileAssetReader honours cancellation before reading") {
    TempDir dir;
    dir.Write("a.png", "a");
    ThreadPool pool(1);
    FileAssetReader reader(dir.Path(), pool);
    CancellationSource source;
    source.Cancel();

    ReadResult result = ReadFrom(reader, "a.png", source.Token());
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ReadErrorKind::Cancelled);
}

TEST_CASE("FileAssetReader reports added, modified and removed files below a watched folder") {
    TempDir dir;
    dir.Write("textures/a.png", "a");
    dir.Write("sounds/x.ogg", "x");
    ResultSink<std::string> changes;
    ThreadPool pool(2);
    FileAssetReader reader(dir.Path(), pool, std::chrono::milliseconds(20));

    FlagResult watched = reader.WatchForChanges("textures", changes.Callback());
    REQUIRE(watched.Ok());
    CHECK(watched.value);

    dir.Write("textures/nested/b.png", "bb");
    CHECK(WaitForChange(changes, "textures/nested/b.png"));

    dir.Write("textures/a.png", "aaaa");
    CHECK(WaitForChange(changes, "textures/a.png"));

    std::filesystem::remove(dir.Path() / "textures" / "a.png");
    CHECK(WaitForChange(changes, "textures/a.png", 2));

    // Outside the watched folder
    dir.Write("sounds/x.ogg", "xxxxxx");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto values = changes.Values();
    CHECK(std::find(values.begin(), values.end(), "sounds/x.ogg") == values.end());
}

TEST_CASE("FileAssetReader watches single files and refuses what it cannot watch") {
    TempDir dir;
    dir.Write("level.json", "{}");
    ResultSink<std::string> changes;
    ThreadPool pool(1);
    FileAssetReader reader(dir.Path(), pool, std::chrono::milliseconds(20));

    REQUIRE(reader.WatchForChanges("level.json", changes.Callback()).value);
    dir.Write("level.json", "{\"tiles\": 3}");
    CHECK(WaitForChange(changes, "level.json"));

    FlagResult missing = reader.WatchForChanges("nothing", changes.Callback());
    REQUIRE(missing.error.has_value());
    CHECK(missing.error->kind == ReadErrorKind::NotFound);
    CHECK_FALSE(missing.value);

    FlagResult escaped = reader.WatchForChanges("../elsewhere", changes.Callback());
    REQUIRE(escaped.error.has_value());
    CHECK(escaped.error->kind == ReadErrorKind::LocalSourceError);
}

TEST_CASE("Exceptions from local callbacks are logged and the pool keeps serving") {
    TempDir dir;
    TempDir log_dir;
    dir.Write("a.png", "a");
    const LogLevel previous = Logger::MinLevel();
    Logger::SetConsoleOutput(false);
    Logger::Init(log_dir.Path().string(), LogLevel::Error);

    {
        ThreadPool pool(1);
        FileAssetReader reader(dir.Path(), pool);
        reader.Read("a.png", CancellationToken(), [](ReadResult) { throw std::runtime_error("callback blew up"); });
        ReadResult after = ReadFrom(reader, "a.png");
        CHECK(after.Ok());
    }

    Logger::SetConsoleOutput(true);
    Logger::SetMinLevel(previous);

    std::string logged;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir.Path() / "logs")) {
        std::ifstream in(entry.path());
        logged.append(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    CHECK(logged.find("callback blew up") != std::string::npos);
}
