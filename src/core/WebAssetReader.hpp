#pragma once
#include <memory>
#include <string>
#include "FetchConfiguration.hpp"
#include "../interfaces/IAssetReader.hpp"
#include "../interfaces/IFetchBackend.hpp"

namespace WebAsset {

// Asset source that serves "http://" and "https://" identifiers from the
// network and hands every other identifier to the wrapped local source.
//
// Local calls are forwarded untouched and their results returned verbatim.
// Network reads issue exactly one request each; backend failures are mapped
// onto ReadError against the caller's identifier. The reader keeps no
// per-call state, so independent reads may run concurrently.
class WebAssetReader : public IAssetReader {
public:
    WebAssetReader(FetchConfiguration config, std::unique_ptr<IAssetReader> local, std::shared_ptr<IFetchBackend> backend);

    void Read(const std::string& path, const CancellationToken& token, ReadCallback cb) override;
    void ReadMeta(const std::string& path, const CancellationToken& token, ReadCallback cb) override;
    // Network paths are never directories.
    void IsDirectory(const std::string& path, FlagCallback cb) override;
    // Network paths cannot be listed and answer NotFound.
    void ReadDirectory(const std::string& path, DirectoryCallback cb) override;
    // Network paths are not probed; a missing asset shows up as NotFound on Read.
    void Exists(const std::string& path, FlagCallback cb) override;
    // Remote assets are not watched.
    FlagResult WatchForChanges(const std::string& path, ChangeCallback on_change) override;

    const FetchConfiguration& Configuration() const { return config_; }

private:
    void FetchNetwork(const std::string& path, RequestMetadata request, const CancellationToken& token, ReadCallback cb);

    const FetchConfiguration config_;
    std::unique_ptr<IAssetReader> local_;
    std::shared_ptr<IFetchBackend> backend_;
};

// Maps a backend result onto the storage vocabulary for `path`.
ReadResult ToReadResult(const std::string& path, FetchResult fetched);

}
