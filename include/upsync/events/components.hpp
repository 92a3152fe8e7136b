/**
 * @file components.hpp
 * @brief Event-driven observers of the sync controller
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * // Every controller event now ends up in the spdlog output
 */

#pragma once

#include "upsync/events/event_bus.hpp"
#include "upsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace upsync::events {

/**
 * @brief Logs every controller event with spdlog
 *
 * Unsubscribes on destruction, so it may live shorter than the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        ids_.state = bus_.subscribe<StateChangedEvent>([this](const StateChangedEvent& e) {
            on_state_changed(e);
        });

        ids_.loaded = bus_.subscribe<SourceLoadedEvent>([this](const SourceLoadedEvent& e) {
            on_source_loaded(e);
        });

        ids_.started = bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        });

        ids_.confirmed = bus_.subscribe<BatchConfirmedEvent>([this](const BatchConfirmedEvent& e) {
            on_batch_confirmed(e);
        });

        ids_.skipped = bus_.subscribe<BatchSkippedEvent>([this](const BatchSkippedEvent& e) {
            on_batch_skipped(e);
        });

        ids_.paused = bus_.subscribe<SyncPausedEvent>([this](const SyncPausedEvent& e) {
            on_paused(e);
        });

        ids_.failed = bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent& e) {
            on_failed(e);
        });

        ids_.completed = bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            on_completed(e);
        });

        ids_.reset = bus_.subscribe<SyncResetEvent>([this](const SyncResetEvent& e) {
            on_reset(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<StateChangedEvent>(ids_.state);
        bus_.unsubscribe<SourceLoadedEvent>(ids_.loaded);
        bus_.unsubscribe<UploadStartedEvent>(ids_.started);
        bus_.unsubscribe<BatchConfirmedEvent>(ids_.confirmed);
        bus_.unsubscribe<BatchSkippedEvent>(ids_.skipped);
        bus_.unsubscribe<SyncPausedEvent>(ids_.paused);
        bus_.unsubscribe<SyncFailedEvent>(ids_.failed);
        bus_.unsubscribe<SyncCompletedEvent>(ids_.completed);
        bus_.unsubscribe<SyncResetEvent>(ids_.reset);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_state_changed(const StateChangedEvent& e) {
        spdlog::debug("[State] {} -> {}", sync::status_name(e.from), sync::status_name(e.to));
    }

    void on_source_loaded(const SourceLoadedEvent& e) {
        spdlog::info("[SourceLoaded] file={} articles={} creators={} already_confirmed={}/{}",
                     e.source_path,
                     e.total_articles,
                     e.total_creators,
                     e.confirmed_articles,
                     e.confirmed_creators);
        if (e.skipped_rows > 0) {
            spdlog::warn("[SourceLoaded] skipped {} rows with empty or duplicate ids", e.skipped_rows);
        }
    }

    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] {} pending articles={} creators={} batches={}",
                     e.resumed ? "resuming," : "fresh,",
                     e.pending_articles,
                     e.pending_creators,
                     e.total_batches);
    }

    void on_batch_confirmed(const BatchConfirmedEvent& e) {
        spdlog::info("[BatchConfirmed] {} ({}/{}) records={} inserted={} updated={} {}ms",
                     e.batch_id,
                     e.current_batch,
                     e.total_batches,
                     e.records,
                     e.inserted,
                     e.updated,
                     e.duration.count());
    }

    void on_batch_skipped(const BatchSkippedEvent& e) {
        spdlog::warn("[BatchSkipped] {} records={} reason={}", e.batch_id, e.records, e.reason);
    }

    void on_paused(const SyncPausedEvent& e) {
        spdlog::info("[Paused] confirmed articles={} creators={}", e.uploaded_articles, e.uploaded_creators);
    }

    void on_failed(const SyncFailedEvent& e) {
        if (e.batch_id.empty()) {
            spdlog::error("[Failed] {}", describe(e.error));
        } else {
            spdlog::error("[Failed] batch {}: {}", e.batch_id, describe(e.error));
        }
    }

    void on_completed(const SyncCompletedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Upload complete: articles={} creators={}", e.uploaded_articles, e.uploaded_creators);
        spdlog::info("  inserted={} updated={} skipped_batches={}", e.inserted, e.updated, e.skipped_batches);
        spdlog::info("  checkpoint {}", e.checkpoint_cleared ? "cleared" : "retained");
        spdlog::info("════════════════════════════════════════════");
    }

    void on_reset(const SyncResetEvent& e) {
        spdlog::info("[Reset] checkpoint cleared for {}", e.fingerprint.empty() ? "<none>" : e.fingerprint);
    }

    struct SubscriptionIds {
        size_t state = 0;
        size_t loaded = 0;
        size_t started = 0;
        size_t confirmed = 0;
        size_t skipped = 0;
        size_t paused = 0;
        size_t failed = 0;
        size_t completed = 0;
        size_t reset = 0;
    };

    EventBus& bus_;
    SubscriptionIds ids_;
};

} // namespace upsync::events
