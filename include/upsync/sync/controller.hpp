#pragma once

#include "upsync/core/cancellation.hpp"
#include "upsync/core/result.hpp"
#include "upsync/events/event_bus.hpp"
#include "upsync/sync/checkpoint.hpp"
#include "upsync/sync/config.hpp"
#include "upsync/sync/scheduler.hpp"
#include "upsync/sync/state.hpp"
#include "upsync/sync/transport.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace upsync::sync {

/**
 * @brief Drives one snapshot through extraction, batching and upload
 *
 * Lifecycle:
 *   Idle --start--> Loading --> Idle(ready) | Error
 *   Idle(ready) --start_upload--> Uploading
 *   Uploading --> Paused | Completed | Error
 *   Paused --resume--> Uploading,  Error --retry--> Uploading
 *   Idle | Paused | Completed | Error --reset--> Idle
 *
 * The upload loop runs on a worker thread owned by the controller. Public
 * operations may be called from any thread and are serialized. Events are
 * published on the thread that caused them, never under the controller's
 * lock; handlers must not call back into the controller.
 *
 * A batch's ids are confirmed and the checkpoint flushed to disk before
 * the next batch is sent. A cancelled request never confirms anything.
 */
class SyncController {
public:
    SyncController(SyncConfig config, std::shared_ptr<BatchTransport> transport, events::EventBus& bus);
    ~SyncController();

    SyncController(const SyncController&) = delete;
    SyncController& operator=(const SyncController&) = delete;

    /// Extract @p source_path and load its checkpoint; runs on the calling thread
    Result<void> start(const std::filesystem::path& source_path);

    /// ErrorKind::Config without a state change when @p credential is empty
    Result<void> start_upload(const std::string& credential);

    /// Abort the in-flight request and the inter-batch delay; returns once the worker stopped
    Result<void> pause();

    Result<void> resume();

    /// Re-enter Uploading from the first unconfirmed batch, optionally with a new credential
    Result<void> retry(const std::optional<std::string>& credential = std::nullopt);

    /// Discard the checkpoint, counters and loaded source
    Result<void> reset();

    /// Block until no upload is running; returns the settled status
    SyncStatus wait();

    /// @return false if still uploading after @p timeout
    bool wait_for(std::chrono::milliseconds timeout);

    SyncState snapshot() const;
    SyncStatus status() const;

    const SyncConfig& config() const noexcept { return config_; }

private:
    using Outbox = std::vector<std::function<void()>>;

    enum class Ending {
        Completed,
        Paused,
        Failed
    };

    struct LoadedSource {
        std::string fingerprint;
        std::vector<ContentRecord> content;
        std::vector<CreatorRecord> creators;
        std::size_t skipped_rows = 0;
    };

    Result<LoadedSource> load_source(const std::filesystem::path& source_path);

    void run_upload(CancellationToken cancel, bool resumed);
    Result<void> confirm_batch(const Batch& batch, const BatchAck& ack,
                               std::chrono::milliseconds elapsed, Outbox& outbox);
    void skip_batch(const Batch& batch, const Error& error, Outbox& outbox);
    void finish_run(Ending ending, const std::optional<Error>& failure, const std::string& batch_id);

    // Callers hold mutex_
    Result<void> transition_locked(SyncStatus next, Outbox& outbox);
    Result<void> launch_locked(bool resumed, Outbox& outbox);
    Result<std::vector<Batch>> plan_batches_locked() const;
    void refresh_progress_locked();
    void fail_locked(const Error& error, const std::string& batch_id, Outbox& outbox);
    SyncState snapshot_locked() const;
    void log_locked(const std::string& message);

    Result<void> ensure_not_uploading() const;
    void join_worker();
    static void flush(Outbox& outbox);
    static std::size_t slot(EntityType type) { return type == EntityType::Content ? 0 : 1; }

    const SyncConfig config_;
    std::shared_ptr<BatchTransport> transport_;
    events::EventBus& bus_;

    std::mutex op_mutex_;                 // serializes public operations
    mutable std::mutex mutex_;            // guards everything below
    std::condition_variable cv_;

    SyncStateMachine machine_;
    SyncState state_;
    LogBuffer logs_;
    bool loaded_ = false;
    bool worker_active_ = false;

    CheckpointStore checkpoint_;          // touched by the worker only while Uploading
    std::vector<ContentRecord> content_;
    std::vector<CreatorRecord> creators_;
    std::string credential_;
    std::array<std::uint64_t, 2> next_sequence_{1, 1};

    CancellationToken cancel_;
    std::thread worker_;
};

} // namespace upsync::sync
