#include "upsync/core/cancellation.hpp"

#include <vector>

namespace upsync {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    std::vector<std::function<void()>> to_fire;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        to_fire.reserve(state_->callbacks.size());
        for (auto& [id, callback] : state_->callbacks) {
            to_fire.push_back(std::move(callback));
        }
        state_->callbacks.clear();
    }
    state_->cv.notify_all();

    for (auto& callback : to_fire) {
        callback();
    }
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled; });
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled) {
            const auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }
    callback();
    return CancellationRegistration();
}

CancellationRegistration::~CancellationRegistration() {
    release();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_), active_(other.active_) {
    other.active_ = false;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
        id_ = other.id_;
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

void CancellationRegistration::release() {
    if (!active_) {
        return;
    }
    active_ = false;
    if (auto state = state_.lock()) {
        std::lock_guard lock(state->mutex);
        state->callbacks.erase(id_);
    }
}

} // namespace upsync
