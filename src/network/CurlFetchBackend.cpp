#include "CurlFetchBackend.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <stdexcept>
#include "FetchResponse.hpp"
#include "../utils/Logger.hpp"

namespace WebAsset {

// State of one easy handle while it is attached to the multi handle
struct CurlFetchBackend::Transfer {
    std::string url;
    std::vector<uint8_t> body;
    curl_slist* headers = nullptr;
    CancellationToken token;
    CancellationRegistration cancel_registration;
    Callback callback;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    ~Transfer() {
        if (headers) curl_slist_free_all(headers);
    }
};

// Lets cancellation hooks and Fetch() interrupt curl_multi_poll. Outlives the
// backend when a token still holds it.
struct CurlFetchBackend::Waker {
    std::mutex mutex;
    CURLM* multi = nullptr;

    void Wake() {
        std::lock_guard<std::mutex> lock(mutex);
        if (multi) curl_multi_wakeup(multi);
    }
};

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* body = static_cast<std::vector<uint8_t>*>(userp);
    if (!body) return 0;
    try {
        const auto* bytes = static_cast<const uint8_t*>(contents);
        body->insert(body->end(), bytes, bytes + chunk);
    } catch (const std::bad_alloc&) {
        return 0; // Aborts the transfer with CURLE_WRITE_ERROR
    }
    return chunk;
}

// Helper to create and configure a cURL easy handle
CURL* CreateEasyHandle(const FetchBackendOptions& options, void* transfer, const std::string& url,
                       std::vector<uint8_t>* body, curl_slist* headers, char* error_buffer) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, body);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    return curl;
}

void Deliver(const IFetchBackend::Callback& callback, FetchResult result) {
    if (!callback) return;
    try {
        callback(std::move(result));
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
    }
}

} // anonymous namespace

CurlFetchBackend::CurlFetchBackend(FetchBackendOptions options) : options_(std::move(options)) {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    waker_ = std::make_shared<Waker>();
    waker_->multi = multi_handle_;
    worker_thread_ = std::thread(&CurlFetchBackend::Run, this);
}

CurlFetchBackend::~CurlFetchBackend() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    waker_->Wake();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(waker_->mutex);
        waker_->multi = nullptr;
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void CurlFetchBackend::Fetch(const RequestMetadata& request, const CancellationToken& token, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        pending_requests_.push_back({request, token, std::move(cb)});
    }
    cv_.notify_one();
    waker_->Wake();
}

void CurlFetchBackend::Run() {
    Logger::Log(LogLevel::Debug, "CurlFetchBackend worker thread started.");
    int still_running = 0;

    while (true) {
        std::vector<Request> incoming;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return stop_ || !pending_requests_.empty() || !active_.empty(); });
            if (stop_) break;
            std::swap(incoming, pending_requests_);
        }

        StartPending(incoming);
        AbandonCancelled();

        curl_multi_perform(multi_handle_, &still_running);
        CompleteFinished();

        if (!active_.empty()) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    CancelAll();
    Logger::Log(LogLevel::Debug, "CurlFetchBackend worker thread stopped.");
}

void CurlFetchBackend::StartPending(std::vector<Request>& requests) {
    for (auto& req : requests) {
        if (req.token.IsCancelled()) {
            Deliver(req.callback, MakeCancelled(req.request.url));
            continue;
        }

        auto transfer = std::make_unique<Transfer>();
        transfer->url = req.request.url;
        transfer->token = req.token;
        transfer->callback = std::move(req.callback);
        for (const auto& header : req.request.headers) {
            std::string line = header.first + ": " + header.second;
            curl_slist* appended = curl_slist_append(transfer->headers, line.c_str());
            if (!appended) {
                Logger::Log(LogLevel::Error, "Failed to build header list for: " + transfer->url);
                break;
            }
            transfer->headers = appended;
        }

        CURL* easy_handle = CreateEasyHandle(options_, transfer.get(), transfer->url, &transfer->body,
                                             transfer->headers, transfer->error_buffer);
        if (!easy_handle) {
            Logger::Log(LogLevel::Error, "Failed to create cURL easy handle for: " + transfer->url);
            Deliver(transfer->callback, MakeTransportFailure(transfer->url, "failed to create cURL easy handle"));
            continue;
        }

        CURLMcode rc = curl_multi_add_handle(multi_handle_, easy_handle);
        if (rc != CURLM_OK) {
            Logger::Log(LogLevel::Error, "curl_multi_add_handle failed for " + transfer->url + ": " + curl_multi_strerror(rc));
            curl_easy_cleanup(easy_handle);
            Deliver(transfer->callback, MakeTransportFailure(transfer->url, curl_multi_strerror(rc)));
            continue;
        }

        std::weak_ptr<Waker> waker = waker_;
        transfer->cancel_registration = transfer->token.OnCancel([waker] {
            if (auto w = waker.lock()) w->Wake();
        });

        Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + transfer->url);
        active_.emplace(easy_handle, std::move(transfer));
        active_count_.store(active_.size());
    }
}

void CurlFetchBackend::AbandonCancelled() {
    std::vector<CURL*> cancelled;
    for (const auto& entry : active_) {
        if (entry.second->token.IsCancelled()) {
            cancelled.push_back(entry.first);
        }
    }
    for (CURL* easy_handle : cancelled) {
        Logger::Log(LogLevel::Debug, "Abandoning cancelled transfer: " + active_[easy_handle]->url);
        Finish(easy_handle, MakeCancelled(active_[easy_handle]->url));
    }
}

void CurlFetchBackend::CompleteFinished() {
    int msgs_in_queue = 0;
    CURLMsg* msg = nullptr;
    while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
        if (msg->msg != CURLMSG_DONE) continue;

        CURL* easy_handle = msg->easy_handle;
        auto it = active_.find(easy_handle);
        if (it == active_.end()) continue;
        Transfer& transfer = *it->second;

        FetchResult result;
        if (msg->data.result == CURLE_OK) {
            long status_code = 0;
            curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &status_code);
            result = MakeHttpResult(transfer.url, status_code, std::move(transfer.body));
        } else {
            std::string error = transfer.error_buffer;
            if (error.empty()) {
                error = curl_easy_strerror(msg->data.result);
            }
            result = MakeTransportFailure(transfer.url, error);
        }
        Logger::Log(LogLevel::Debug, "CURLMSG_DONE for " + transfer.url + " (status " + std::to_string(result.status_code) + ")");
        Finish(easy_handle, std::move(result));
    }
}

void CurlFetchBackend::CancelAll() {
    std::vector<CURL*> handles;
    handles.reserve(active_.size());
    for (const auto& entry : active_) {
        handles.push_back(entry.first);
    }
    for (CURL* easy_handle : handles) {
        Finish(easy_handle, MakeCancelled(active_[easy_handle]->url));
    }

    std::vector<Request> leftover;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        std::swap(leftover, pending_requests_);
    }
    for (auto& req : leftover) {
        Deliver(req.callback, MakeCancelled(req.request.url));
    }
}

void CurlFetchBackend::Finish(CURL* easy_handle, FetchResult result) {
    auto it = active_.find(easy_handle);
    if (it == active_.end()) return;
    std::unique_ptr<Transfer> transfer = std::move(it->second);
    active_.erase(it);
    active_count_.store(active_.size());

    // Detaching returns the connection to the multi handle's pool, or closes
    // it when the transfer did not complete.
    curl_multi_remove_handle(multi_handle_, easy_handle);
    curl_easy_cleanup(easy_handle);

    // The token may outlive this transfer; its wake hook must not.
    transfer->cancel_registration.Reset();
    Deliver(transfer->callback, std::move(result));
}

}
