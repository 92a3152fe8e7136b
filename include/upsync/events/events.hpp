/**
 * @file events.hpp
 * @brief Events published by the sync controller
 *
 * NAMING CONVENTION:
 * Events are past-tense: BatchConfirmedEvent, SyncPausedEvent.
 * Every event is emitted after the controller state it describes is
 * committed, and never while the controller lock is held.
 */

#pragma once

#include "upsync/core/error.hpp"
#include "upsync/source/records.hpp"
#include "upsync/sync/state.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace upsync::events {

// ════════════════════════════════════════════════════════
// Lifecycle Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted on every status change
 *
 * WHO SUBSCRIBES:
 * - CLI (rewrite the status journal)
 * - Tests (observe transitions)
 */
struct StateChangedEvent {
    sync::SyncStatus from;
    sync::SyncStatus to;
    sync::SyncState snapshot;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when extraction finished and the checkpoint was loaded
 */
struct SourceLoadedEvent {
    std::string source_path;
    std::string fingerprint;
    std::size_t total_articles = 0;
    std::size_t total_creators = 0;
    std::size_t confirmed_articles = 0;
    std::size_t confirmed_creators = 0;
    std::size_t skipped_rows = 0;     ///< empty or duplicate ids
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadStartedEvent {
    std::string fingerprint;
    std::size_t pending_articles = 0;
    std::size_t pending_creators = 0;
    std::size_t total_batches = 0;
    bool resumed = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

struct BatchConfirmedEvent {
    std::string batch_id;
    source::EntityType entity_type = source::EntityType::Content;
    std::size_t records = 0;
    std::size_t inserted = 0;
    std::size_t updated = 0;
    std::size_t current_batch = 0;
    std::size_t total_batches = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the remote side rejected one batch's payload
 *
 * The ids of a skipped batch are never confirmed.
 */
struct BatchSkippedEvent {
    std::string batch_id;
    source::EntityType entity_type = source::EntityType::Content;
    std::size_t records = 0;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Outcome Events
// ════════════════════════════════════════════════════════

struct SyncPausedEvent {
    std::size_t uploaded_articles = 0;
    std::size_t uploaded_creators = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncFailedEvent {
    Error error;
    std::string batch_id;             ///< empty when no batch was involved
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncCompletedEvent {
    std::size_t uploaded_articles = 0;
    std::size_t uploaded_creators = 0;
    std::size_t inserted = 0;
    std::size_t updated = 0;
    std::size_t skipped_batches = 0;
    bool checkpoint_cleared = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncResetEvent {
    std::string fingerprint;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace upsync::events
