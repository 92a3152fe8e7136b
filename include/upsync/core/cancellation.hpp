#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace upsync {

class CancellationRegistration;

/**
 * @brief Cooperative cancellation shared between a requester and workers
 *
 * Copies share one state, so the controller keeps a token, hands copies to
 * the transport, and cancel() reaches every holder. Callbacks registered
 * with on_cancel() run on the cancelling thread and must only post work
 * elsewhere (they are invoked with the token's lock released).
 */
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    [[nodiscard]] bool is_cancelled() const;

    /**
     * @brief Sleep for up to @p duration unless cancelled first
     * @return true if the wait ended because of cancellation
     */
    bool wait_for(std::chrono::milliseconds duration) const;

    /**
     * @brief Register a callback fired once on cancel()
     *
     * Fires immediately on the calling thread if already cancelled.
     * The callback is unregistered when the returned object is destroyed.
     */
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const;

private:
    friend class CancellationRegistration;

    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::size_t next_id = 0;
        std::unordered_map<std::size_t, std::function<void()>> callbacks;
    };

    std::shared_ptr<State> state_;
};

class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

private:
    friend class CancellationToken;

    CancellationRegistration(std::weak_ptr<CancellationToken::State> state, std::size_t id)
        : state_(std::move(state)), id_(id), active_(true) {}

    void release();

    std::weak_ptr<CancellationToken::State> state_;
    std::size_t id_ = 0;
    bool active_ = false;
};

} // namespace upsync
