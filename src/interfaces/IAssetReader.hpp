#pragma once
#include <functional>
#include <string>
#include "../core/Cancellation.hpp"
#include "../core/ReadResult.hpp"

namespace WebAsset {

// Storage-source capability the content pipeline loads assets through.
// Every operation completes by invoking its callback exactly once, possibly
// on a different thread than the caller's.
class IAssetReader {
public:
    using ReadCallback = std::function<void(ReadResult)>;
    using FlagCallback = std::function<void(FlagResult)>;
    using DirectoryCallback = std::function<void(DirectoryResult)>;
    // Receives the path of an asset that was added, modified or removed.
    using ChangeCallback = std::function<void(const std::string& path)>;

    virtual ~IAssetReader() = default;

    virtual void Read(const std::string& path, const CancellationToken& token, ReadCallback cb) = 0;
    // Companion metadata of `path`, stored as "<path>.meta".
    virtual void ReadMeta(const std::string& path, const CancellationToken& token, ReadCallback cb) = 0;
    virtual void IsDirectory(const std::string& path, FlagCallback cb) = 0;
    virtual void ReadDirectory(const std::string& path, DirectoryCallback cb) = 0;
    virtual void Exists(const std::string& path, FlagCallback cb) = 0;

    // Starts reporting changes below `path` for the lifetime of the reader.
    // Answers right away: true when the path is now watched, false when
    // this source has nothing to watch there.
    virtual FlagResult WatchForChanges(const std::string& path, ChangeCallback on_change) = 0;
};

}
