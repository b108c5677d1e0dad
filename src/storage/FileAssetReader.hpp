#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "ChangeWatcher.hpp"
#include "../interfaces/IAssetReader.hpp"
#include "../utils/ThreadPool.hpp"

namespace WebAsset {

// Local source over a folder on disk. Identifiers are paths relative to the
// folder; all filesystem work runs on the supplied pool, which must outlive
// the reader. Change watching polls every `watch_interval` once the first
// watch is requested.
class FileAssetReader : public IAssetReader {
public:
    FileAssetReader(std::filesystem::path root, ThreadPool& pool,
                    std::chrono::milliseconds watch_interval = std::chrono::milliseconds(500));

    void Read(const std::string& path, const CancellationToken& token, ReadCallback cb) override;
    void ReadMeta(const std::string& path, const CancellationToken& token, ReadCallback cb) override;
    void IsDirectory(const std::string& path, FlagCallback cb) override;
    void ReadDirectory(const std::string& path, DirectoryCallback cb) override;
    void Exists(const std::string& path, FlagCallback cb) override;
    FlagResult WatchForChanges(const std::string& path, ChangeCallback on_change) override;

    const std::filesystem::path& Root() const { return root_; }

private:
    void ReadFileAsync(std::string path, std::string file, const CancellationToken& token, ReadCallback cb);
    // Runs `task` on the pool, logging anything a caller's callback throws.
    void Post(std::function<void()> task);

    std::filesystem::path root_;
    ThreadPool& thread_pool;
    std::chrono::milliseconds watch_interval_;
    std::mutex watcher_mutex_;
    std::unique_ptr<ChangeWatcher> watcher_;
};

}
