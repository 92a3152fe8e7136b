#pragma once

#include "upsync/core/result.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <thread>

namespace upsync::sync {

class SyncController;

/**
 * @brief Pauses a controller whenever one of the given signals arrives
 *
 * The wait is re-armed after every signal. A signal that arrives before
 * there is anything to pause (source still loading, upload not started)
 * is remembered; apply_pending() honours it once the upload runs.
 *
 * Handlers run on a private io_context thread. Destroy before the
 * controller.
 */
class SignalPauser {
public:
    SignalPauser(SyncController& controller, std::initializer_list<int> signals);
    ~SignalPauser();

    SignalPauser(const SignalPauser&) = delete;
    SignalPauser& operator=(const SignalPauser&) = delete;

    /// Pause now if a signal arrived while nothing was uploading
    Result<void> apply_pending();

    [[nodiscard]] bool pending() const noexcept { return pending_.load(); }
    [[nodiscard]] std::size_t signals_received() const noexcept { return received_.load(); }

private:
    void arm();

    SyncController& controller_;
    boost::asio::io_context context_;
    boost::asio::signal_set signals_;
    std::thread thread_;
    std::atomic<bool> pending_{false};
    std::atomic<std::size_t> received_{0};
};

} // namespace upsync::sync
