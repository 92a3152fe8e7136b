#include "upsync/sync/signal_pause.hpp"

#include "upsync/sync/controller.hpp"

#include <spdlog/spdlog.h>

namespace upsync::sync {

SignalPauser::SignalPauser(SyncController& controller, std::initializer_list<int> signals)
    : controller_(controller), signals_(context_) {
    for (int signal : signals) {
        signals_.add(signal);
    }
    arm();
    thread_ = std::thread([this]() { context_.run(); });
}

SignalPauser::~SignalPauser() {
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

Result<void> SignalPauser::apply_pending() {
    if (!pending_.exchange(false)) {
        return Ok();
    }
    spdlog::warn("Applying pause requested during startup");
    return controller_.pause();
}

void SignalPauser::arm() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        ++received_;
        spdlog::warn("Signal {} received, pausing", signal);

        // Set first so a concurrent apply_pending() cannot miss it
        pending_ = true;
        auto paused = controller_.pause();
        if (paused.is_ok()) {
            pending_ = false;
        } else {
            spdlog::debug("Pause deferred: {}", paused.error().message);
        }
        arm();
    });
}

} // namespace upsync::sync
