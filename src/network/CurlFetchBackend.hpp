#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>
#include "../interfaces/IFetchBackend.hpp"
#include "FetchBackendOptions.hpp"

// Forward declare curl handles
typedef void CURL;
typedef void CURLM;

namespace WebAsset {

// Native backend. All transfers run on one curl multi handle driven by a
// worker thread, so Fetch() never blocks the caller. Callbacks are invoked
// on that worker thread.
class CurlFetchBackend : public IFetchBackend {
public:
    explicit CurlFetchBackend(FetchBackendOptions options = {});
    ~CurlFetchBackend() override;

    // Non-copyable
    CurlFetchBackend(const CurlFetchBackend&) = delete;
    CurlFetchBackend& operator=(const CurlFetchBackend&) = delete;

    void Fetch(const RequestMetadata& request, const CancellationToken& token, Callback cb) override;

    // Easy handles currently attached to the multi handle.
    size_t ActiveTransfers() const { return active_count_.load(); }

private:
    struct Request {
        RequestMetadata request;
        CancellationToken token;
        Callback callback;
    };
    struct Transfer;
    struct Waker;

    void Run();
    void StartPending(std::vector<Request>& requests);
    void AbandonCancelled();
    void CompleteFinished();
    void CancelAll();
    void Finish(CURL* easy_handle, FetchResult result);

    FetchBackendOptions options_;
    CURLM* multi_handle_ = nullptr;
    std::shared_ptr<Waker> waker_;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::vector<Request> pending_requests_;

    // Owned by the worker thread.
    std::unordered_map<CURL*, std::unique_ptr<Transfer>> active_;
    std::atomic<size_t> active_count_{0};
};

}
