#include "Cancellation.hpp"
#include <algorithm>

namespace WebAsset {

void CancellationRegistration::Reset() {
    std::shared_ptr<detail::CancellationState> state = state_.lock();
    state_.reset();
    if (!state) return;

    std::function<void()> removed;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = std::find_if(state->hooks.begin(), state->hooks.end(),
                               [this](const auto& entry) { return entry.first == id_; });
        if (it != state->hooks.end()) {
            removed = std::move(it->second);
            state->hooks.erase(it);
        }
    }
    // `removed` is destroyed outside the lock in case its captures re-enter.
}

bool CancellationToken::IsCancelled() const {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

CancellationRegistration CancellationToken::OnCancel(std::function<void()> hook) const {
    if (!state_ || !hook) return CancellationRegistration();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load(std::memory_order_acquire)) {
            const uint64_t id = ++state_->next_id;
            state_->hooks.emplace_back(id, std::move(hook));
            return CancellationRegistration(state_, id);
        }
    }
    hook();
    return CancellationRegistration();
}

CancellationSource::CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::Cancel() {
    std::vector<std::pair<uint64_t, std::function<void()>>> hooks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) return;
        std::swap(hooks, state_->hooks);
    }
    for (auto& hook : hooks) {
        hook.second();
    }
}

bool CancellationSource::IsCancelled() const {
    return state_->cancelled.load(std::memory_order_acquire);
}

size_t CancellationSource::RegisteredHooks() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->hooks.size();
}

}
