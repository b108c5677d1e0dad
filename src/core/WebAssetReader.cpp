#include "WebAssetReader.hpp"
#include <stdexcept>
#include "RequestClassifier.hpp"
#include "RequestAugmenter.hpp"
#include "../utils/Logger.hpp"

namespace WebAsset {

namespace {

ReadErrorKind ToReadErrorKind(FetchFailureKind kind) {
    switch (kind) {
        case FetchFailureKind::NotFound:      return ReadErrorKind::NotFound;
        case FetchFailureKind::RequestFailed: return ReadErrorKind::RequestFailed;
        case FetchFailureKind::Transport:     return ReadErrorKind::TransportFailure;
        case FetchFailureKind::Cancelled:     return ReadErrorKind::Cancelled;
    }
    return ReadErrorKind::TransportFailure;
}

}

ReadResult ToReadResult(const std::string& path, FetchResult fetched) {
    if (fetched.Ok()) {
        return ReadResult::Success(std::move(fetched.body));
    }
    const FetchFailure& failure = *fetched.failure;
    ReadError error;
    error.kind = ToReadErrorKind(failure.kind);
    error.path = path;
    error.status_code = failure.status_code;
    error.message = failure.message;
    return ReadResult::Failure(std::move(error));
}

WebAssetReader::WebAssetReader(FetchConfiguration config, std::unique_ptr<IAssetReader> local, std::shared_ptr<IFetchBackend> backend)
    : config_(std::move(config)), local_(std::move(local)), backend_(std::move(backend)) {
    if (!local_) {
        throw std::invalid_argument("WebAssetReader requires a local asset reader");
    }
    if (!backend_) {
        throw std::invalid_argument("WebAssetReader requires a fetch backend");
    }
}

void WebAssetReader::Read(const std::string& path, const CancellationToken& token, ReadCallback cb) {
    if (Classify(path) == RequestKind::Local) {
        local_->Read(path, token, std::move(cb));
        return;
    }
    FetchNetwork(path, Augment(path, config_), token, std::move(cb));
}

void WebAssetReader::ReadMeta(const std::string& path, const CancellationToken& token, ReadCallback cb) {
    if (Classify(path) == RequestKind::Local) {
        local_->ReadMeta(path, token, std::move(cb));
        return;
    }
    FetchNetwork(path, AugmentMeta(path, config_), token, std::move(cb));
}

void WebAssetReader::IsDirectory(const std::string& path, FlagCallback cb) {
    if (Classify(path) == RequestKind::Local) {
        local_->IsDirectory(path, std::move(cb));
        return;
    }
    cb(FlagResult{false, std::nullopt});
}

void WebAssetReader::ReadDirectory(const std::string& path, DirectoryCallback cb) {
    if (Classify(path) == RequestKind::Local) {
        local_->ReadDirectory(path, std::move(cb));
        return;
    }
    DirectoryResult result;
    result.error = ReadError{ReadErrorKind::NotFound, path, 0, "network paths cannot be listed"};
    cb(std::move(result));
}

void WebAssetReader::Exists(const std::string& path, FlagCallback cb) {
    if (Classify(path) == RequestKind::Local) {
        local_->Exists(path, std::move(cb));
        return;
    }
    cb(FlagResult{true, std::nullopt});
}

FlagResult WebAssetReader::WatchForChanges(const std::string& path, ChangeCallback on_change) {
    if (Classify(path) == RequestKind::Local) {
        return local_->WatchForChanges(path, std::move(on_change));
    }
    Logger::Log(LogLevel::Debug, "Not watching network asset " + path);
    return FlagResult{false, std::nullopt};
}

void WebAssetReader::FetchNetwork(const std::string& path, RequestMetadata request, const CancellationToken& token, ReadCallback cb) {
    Logger::Log(LogLevel::Info, "Fetching " + request.url);
    backend_->Fetch(request, token, [path, cb = std::move(cb)](FetchResult fetched) {
        ReadResult result = ToReadResult(path, std::move(fetched));
        if (!result.Ok()) {
            Logger::Log(LogLevel::Warn, "Failed to load " + result.error->Describe());
        }
        cb(std::move(result));
    });
}

}
