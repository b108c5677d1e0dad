#include "EmscriptenFetchBackend.hpp"
#include <emscripten/fetch.h>
#include <cstring>
#include <memory>
#include "FetchResponse.hpp"
#include "../utils/Logger.hpp"

namespace WebAsset {

namespace {

struct PendingFetch {
    std::string url;
    std::vector<std::string> header_storage;
    std::vector<const char*> header_ptrs;  // name, value, ..., nullptr
    IFetchBackend::Callback callback;
    CancellationRegistration cancel_registration;
    bool delivered = false;

    void Deliver(FetchResult result) {
        if (delivered) return;
        delivered = true;
        cancel_registration.Reset();
        IFetchBackend::Callback cb = std::move(callback);
        callback = nullptr;
        if (cb) cb(std::move(result));
    }
};

using PendingHolder = std::shared_ptr<PendingFetch>;

// Reclaims the heap-allocated holder passed through userData.
PendingHolder TakePending(emscripten_fetch_t* fetch) {
    std::unique_ptr<PendingHolder> holder(static_cast<PendingHolder*>(fetch->userData));
    fetch->userData = nullptr;
    return *holder;
}

void OnFetchSuccess(emscripten_fetch_t* fetch) {
    PendingHolder pending = TakePending(fetch);
    const long status_code = fetch->status;
    const auto* data = reinterpret_cast<const uint8_t*>(fetch->data);
    std::vector<uint8_t> body(data, data + static_cast<size_t>(fetch->numBytes));
    emscripten_fetch_close(fetch);

    pending->Deliver(MakeHttpResult(pending->url, status_code, std::move(body)));
}

void OnFetchError(emscripten_fetch_t* fetch) {
    PendingHolder pending = TakePending(fetch);
    const long status_code = fetch->status;
    std::string status_text = fetch->statusText;
    emscripten_fetch_close(fetch);

    if (status_code == 0) {
        // The browser reports DNS, CORS, connection and redirect-loop errors
        // without a status.
        std::string message = status_text.empty() ? "network error" : status_text;
        pending->Deliver(MakeTransportFailure(pending->url, message));
    } else {
        pending->Deliver(MakeHttpResult(pending->url, status_code, {}));
    }
}

}

EmscriptenFetchBackend::EmscriptenFetchBackend(FetchBackendOptions options) : options_(std::move(options)) {}

void EmscriptenFetchBackend::Fetch(const RequestMetadata& request, const CancellationToken& token, Callback cb) {
    if (token.IsCancelled()) {
        if (cb) cb(MakeCancelled(request.url));
        return;
    }

    auto pending = std::make_shared<PendingFetch>();
    pending->url = request.url;
    pending->callback = std::move(cb);
    pending->header_storage.reserve(request.headers.size() * 2);
    for (const auto& header : request.headers) {
        pending->header_storage.push_back(header.first);
        pending->header_storage.push_back(header.second);
    }
    for (const auto& s : pending->header_storage) {
        pending->header_ptrs.push_back(s.c_str());
    }
    pending->header_ptrs.push_back(nullptr);

    emscripten_fetch_attr_t attr;
    emscripten_fetch_attr_init(&attr);
    std::strcpy(attr.requestMethod, "GET");
    attr.attributes = EMSCRIPTEN_FETCH_LOAD_TO_MEMORY;
    attr.requestHeaders = pending->header_ptrs.data();
    attr.timeoutMSecs = static_cast<unsigned long>(options_.timeout_ms);
    attr.onsuccess = OnFetchSuccess;
    attr.onerror = OnFetchError;
    attr.userData = new PendingHolder(pending);

    Logger::Log(LogLevel::Debug, "emscripten_fetch: " + pending->url);
    emscripten_fetch_t* handle = emscripten_fetch(&attr, pending->url.c_str());
    if (!handle) {
        delete static_cast<PendingHolder*>(attr.userData);
        Logger::Log(LogLevel::Error, "emscripten_fetch failed to start for: " + pending->url);
        pending->Deliver(MakeTransportFailure(pending->url, "failed to start fetch"));
        return;
    }

    std::weak_ptr<PendingFetch> weak = pending;
    CancellationRegistration registration = token.OnCancel([weak] {
        if (auto p = weak.lock()) p->Deliver(MakeCancelled(p->url));
    });
    if (!pending->delivered) {
        pending->cancel_registration = std::move(registration);
    }
}

}
