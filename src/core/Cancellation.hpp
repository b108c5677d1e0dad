#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace WebAsset {

namespace detail {
struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    uint64_t next_id = 0;
    std::vector<std::pair<uint64_t, std::function<void()>>> hooks;
};
}

// Keeps a cancellation hook registered. Destroying or resetting it removes
// the hook; a hook that is already running may still finish.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration() { Reset(); }

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {}
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            Reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
        }
        return *this;
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void Reset();

private:
    friend class CancellationToken;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

// Observer side of a cancellation flag. A default-constructed token can
// never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool IsCancelled() const;
    bool CanBeCancelled() const { return static_cast<bool>(state_); }

    // Runs `hook` once when the owning source is cancelled, or right away
    // if it already is. Hooks run on the thread that calls Cancel(). The
    // hook stays registered only while the returned registration lives.
    CancellationRegistration OnCancel(std::function<void()> hook) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// Owned by whoever owns the asynchronous task.
class CancellationSource {
public:
    CancellationSource();

    CancellationToken Token() const { return CancellationToken(state_); }
    void Cancel();
    bool IsCancelled() const;

    // Hooks still waiting for Cancel().
    size_t RegisteredHooks() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}
