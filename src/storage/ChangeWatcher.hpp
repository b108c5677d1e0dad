#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../utils/ThreadPool.hpp"

namespace WebAsset {

// Polls watched files and folders below an asset root and reports every
// entry that appeared, changed size or modification time, or disappeared.
// Scans run on the watcher's own thread; callbacks are posted to the pool.
class ChangeWatcher {
public:
    using ChangeCallback = std::function<void(const std::string& path)>;

    ChangeWatcher(std::filesystem::path root, ThreadPool& pool, std::chrono::milliseconds interval);
    ~ChangeWatcher();

    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    // `full` is `relative` resolved under the root. Reported paths are
    // relative to the root, with forward slashes.
    void Watch(const std::string& relative, const std::filesystem::path& full, ChangeCallback on_change);
    size_t WatchCount() const;

private:
    struct EntryState {
        std::filesystem::file_time_type modified;
        uintmax_t size = 0;
    };
    using Snapshot = std::map<std::string, EntryState>;

    struct Watched {
        std::string relative;
        std::filesystem::path full;
        ChangeCallback callback;
        Snapshot snapshot;
    };

    struct Change {
        ChangeCallback callback;
        std::string path;
    };

    void Run();
    Snapshot Scan(const std::filesystem::path& full) const;
    void Dispatch(std::vector<Change>& changes);

    std::filesystem::path root_;
    ThreadPool& thread_pool;
    std::chrono::milliseconds interval_;
    std::vector<Watched> watches_;
    mutable std::mutex watch_mutex;
    std::condition_variable cv;
    std::thread poll_thread;
    bool stop_ = false;
};

}
