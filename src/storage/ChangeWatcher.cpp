#include "ChangeWatcher.hpp"
#include "../utils/Logger.hpp"

namespace fs = std::filesystem;

namespace WebAsset {

ChangeWatcher::ChangeWatcher(fs::path root, ThreadPool& pool, std::chrono::milliseconds interval)
    : root_(std::move(root)), thread_pool(pool), interval_(interval), stop_(false) {
    if (interval_.count() <= 0) interval_ = std::chrono::milliseconds(1);
    poll_thread = std::thread(&ChangeWatcher::Run, this);
}

ChangeWatcher::~ChangeWatcher() {
    {
        std::unique_lock<std::mutex> lock(watch_mutex);
        stop_ = true;
    }
    cv.notify_all();
    if (poll_thread.joinable()) {
        poll_thread.join();
    }
}

void ChangeWatcher::Watch(const std::string& relative, const fs::path& full, ChangeCallback on_change) {
    Snapshot initial = Scan(full);
    std::unique_lock<std::mutex> lock(watch_mutex);
    watches_.push_back({relative, full, std::move(on_change), std::move(initial)});
    Logger::Log(LogLevel::Info, "Watching for changes: " + (relative.empty() ? std::string(".") : relative));
}

size_t ChangeWatcher::WatchCount() const {
    std::unique_lock<std::mutex> lock(watch_mutex);
    return watches_.size();
}

ChangeWatcher::Snapshot ChangeWatcher::Scan(const fs::path& full) const {
    Snapshot snapshot;
    auto record = [&](const fs::path& file) {
        std::error_code ec;
        EntryState state;
        state.modified = fs::last_write_time(file, ec);
        if (ec) return;
        state.size = fs::file_size(file, ec);
        if (ec) return;
        snapshot[file.lexically_relative(root_).generic_string()] = state;
    };

    std::error_code ec;
    fs::file_status st = fs::status(full, ec);
    if (ec || st.type() == fs::file_type::not_found) {
        return snapshot;
    }
    if (fs::is_regular_file(st)) {
        record(full);
        return snapshot;
    }
    if (!fs::is_directory(st)) {
        return snapshot;
    }
    for (fs::recursive_directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            record(it->path());
        }
    }
    if (ec) {
        Logger::Log(LogLevel::Debug, "Change scan of " + full.string() + " stopped early: " + ec.message());
    }
    return snapshot;
}

void ChangeWatcher::Run() {
    std::unique_lock<std::mutex> lock(watch_mutex);
    while (!stop_) {
        cv.wait_for(lock, interval_, [this] { return stop_; });
        if (stop_) break;

        std::vector<Change> changes;
        for (auto& watched : watches_) {
            Snapshot current = Scan(watched.full);
            for (const auto& entry : current) {
                auto previous = watched.snapshot.find(entry.first);
                if (previous == watched.snapshot.end() ||
                    previous->second.modified != entry.second.modified ||
                    previous->second.size != entry.second.size) {
                    changes.push_back({watched.callback, entry.first});
                }
            }
            for (const auto& entry : watched.snapshot) {
                if (!current.count(entry.first)) {
                    changes.push_back({watched.callback, entry.first});
                }
            }
            watched.snapshot = std::move(current);
        }

        if (changes.empty()) continue;
        // Unlock while posting so Watch() is not held up by a busy pool
        lock.unlock();
        Dispatch(changes);
        lock.lock();
    }
}

void ChangeWatcher::Dispatch(std::vector<Change>& changes) {
    for (auto& change : changes) {
        Logger::Log(LogLevel::Debug, "Asset changed: " + change.path);
        try {
            thread_pool.enqueue([callback = std::move(change.callback), path = std::move(change.path)]() {
                try {
                    callback(path);
                } catch (const std::exception& e) {
                    Logger::Log(LogLevel::Error, "Exception in change callback for " + path + ": " + e.what());
                }
            });
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Warn, "Dropping change notification: " + std::string(e.what()));
        }
    }
}

}
