#include "FileAssetReader.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include "../utils/Logger.hpp"

namespace fs = std::filesystem;

namespace WebAsset {

namespace {

ReadError LocalError(ReadErrorKind kind, const std::string& path, std::string message) {
    return ReadError{kind, path, 0, std::move(message)};
}

// Resolves `relative` under `root`. Absolute paths and paths climbing out of
// the root are refused.
bool Resolve(const fs::path& root, const std::string& relative, fs::path& out) {
    fs::path rel = fs::path(relative).lexically_normal();
    if (rel.is_absolute() || rel.has_root_name()) return false;
    auto first = rel.begin();
    if (first != rel.end() && *first == "..") return false;
    out = root / rel;
    return true;
}

ReadResult ReadWholeFile(const fs::path& file, const std::string& path) {
    std::error_code ec;
    fs::file_status st = fs::status(file, ec);
    if (st.type() == fs::file_type::not_found) {
        return ReadResult::Failure(LocalError(ReadErrorKind::NotFound, path, "no such file"));
    }
    if (ec) {
        return ReadResult::Failure(LocalError(ReadErrorKind::LocalSourceError, path, ec.message()));
    }
    if (fs::is_directory(st)) {
        return ReadResult::Failure(LocalError(ReadErrorKind::LocalSourceError, path, "is a directory"));
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return ReadResult::Failure(LocalError(ReadErrorKind::LocalSourceError, path, "cannot open file"));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ReadResult::Failure(LocalError(ReadErrorKind::LocalSourceError, path, "read error"));
    }
    return ReadResult::Success(std::move(bytes));
}

}

FileAssetReader::FileAssetReader(fs::path root, ThreadPool& pool, std::chrono::milliseconds watch_interval)
    : root_(std::move(root)), thread_pool(pool), watch_interval_(watch_interval) {}

void FileAssetReader::Post(std::function<void()> task) {
    thread_pool.enqueue([task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Exception in local asset callback: " + std::string(e.what()));
        }
    });
}

void FileAssetReader::Read(const std::string& path, const CancellationToken& token, ReadCallback cb) {
    ReadFileAsync(path, path, token, std::move(cb));
}

void FileAssetReader::ReadMeta(const std::string& path, const CancellationToken& token, ReadCallback cb) {
    ReadFileAsync(path, path + ".meta", token, std::move(cb));
}

void FileAssetReader::ReadFileAsync(std::string path, std::string file, const CancellationToken& token, ReadCallback cb) {
    Post([root = root_, path = std::move(path), file = std::move(file), token, cb = std::move(cb)]() {
        if (token.IsCancelled()) {
            cb(ReadResult::Failure(LocalError(ReadErrorKind::Cancelled, path, "read cancelled")));
            return;
        }
        fs::path full;
        if (!Resolve(root, file, full)) {
            cb(ReadResult::Failure(LocalError(ReadErrorKind::LocalSourceError, path, "path escapes asset folder")));
            return;
        }
        ReadResult result;
        try {
            result = ReadWholeFile(full, path);
        } catch (const std::exception& e) {
            result = ReadResult::Failure(LocalError(ReadErrorKind::LocalSourceError, path, e.what()));
        }
        Logger::Log(LogLevel::Debug, "Local read " + full.string() + (result.Ok() ? " ok" : " failed"));
        cb(std::move(result));
    });
}

void FileAssetReader::IsDirectory(const std::string& path, FlagCallback cb) {
    Post([root = root_, path, cb = std::move(cb)]() {
        fs::path full;
        if (!Resolve(root, path, full)) {
            cb(FlagResult{false, LocalError(ReadErrorKind::LocalSourceError, path, "path escapes asset folder")});
            return;
        }
        std::error_code ec;
        cb(FlagResult{fs::is_directory(full, ec), std::nullopt});
    });
}

void FileAssetReader::ReadDirectory(const std::string& path, DirectoryCallback cb) {
    Post([root = root_, path, cb = std::move(cb)]() {
        DirectoryResult result;
        fs::path full;
        if (!Resolve(root, path, full)) {
            result.error = LocalError(ReadErrorKind::LocalSourceError, path, "path escapes asset folder");
            cb(std::move(result));
            return;
        }

        std::error_code ec;
        fs::file_status st = fs::status(full, ec);
        if (st.type() == fs::file_type::not_found) {
            result.error = LocalError(ReadErrorKind::NotFound, path, "no such directory");
        } else if (ec) {
            result.error = LocalError(ReadErrorKind::LocalSourceError, path, ec.message());
        } else if (!fs::is_directory(st)) {
            result.error = LocalError(ReadErrorKind::LocalSourceError, path, "not a directory");
        } else {
            for (fs::directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
                result.entries.push_back(it->path().lexically_relative(root).generic_string());
            }
            if (ec) {
                result.entries.clear();
                result.error = LocalError(ReadErrorKind::LocalSourceError, path, ec.message());
            } else {
                std::sort(result.entries.begin(), result.entries.end());
            }
        }
        cb(std::move(result));
    });
}

void FileAssetReader::Exists(const std::string& path, FlagCallback cb) {
    Post([root = root_, path, cb = std::move(cb)]() {
        fs::path full;
        if (!Resolve(root, path, full)) {
            cb(FlagResult{false, std::nullopt});
            return;
        }
        std::error_code ec;
        cb(FlagResult{fs::exists(full, ec), std::nullopt});
    });
}

FlagResult FileAssetReader::WatchForChanges(const std::string& path, ChangeCallback on_change) {
    fs::path full;
    if (!Resolve(root_, path, full)) {
        return FlagResult{false, LocalError(ReadErrorKind::LocalSourceError, path, "path escapes asset folder")};
    }
    std::error_code ec;
    fs::file_status st = fs::status(full, ec);
    if (st.type() == fs::file_type::not_found) {
        return FlagResult{false, LocalError(ReadErrorKind::NotFound, path, "nothing to watch")};
    }
    if (ec) {
        return FlagResult{false, LocalError(ReadErrorKind::LocalSourceError, path, ec.message())};
    }

    std::lock_guard<std::mutex> lock(watcher_mutex_);
    if (!watcher_) {
        watcher_ = std::make_unique<ChangeWatcher>(root_, thread_pool, watch_interval_);
    }
    watcher_->Watch(path, full, std::move(on_change));
    return FlagResult{true, std::nullopt};
}

}
