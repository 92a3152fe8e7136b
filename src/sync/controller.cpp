#include "upsync/sync/controller.hpp"

#include "upsync/events/events.hpp"
#include "upsync/source/extractor.hpp"

#include <spdlog/spdlog.h>

namespace upsync::sync {
namespace fs = std::filesystem;

namespace {

bool is_settled(SyncStatus status) {
    return status != SyncStatus::Uploading && status != SyncStatus::Loading;
}

} // namespace

SyncController::SyncController(SyncConfig config, std::shared_ptr<BatchTransport> transport, events::EventBus& bus)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , bus_(bus)
    , logs_(config_.log_capacity)
    , checkpoint_(config_.state_dir) {
}

SyncController::~SyncController() {
    {
        std::lock_guard lock(mutex_);
        cancel_.cancel();
    }
    join_worker();
}

// ============================================================================
// Loading
// ============================================================================

Result<void> SyncController::start(const fs::path& source_path) {
    std::lock_guard op(op_mutex_);
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);
        if (!machine_.can_transition(SyncStatus::Loading)) {
            return Err<void>(ErrorKind::State,
                             std::string("Cannot load a source while ") + status_name(machine_.status()));
        }
    }
    join_worker();

    {
        std::lock_guard lock(mutex_);
        loaded_ = false;
        state_ = SyncState{};
        next_sequence_ = {1, 1};
        state_.source_path = source_path.string();
        log_locked("Loading " + source_path.string());
        auto moved = transition_locked(SyncStatus::Loading, outbox);
        if (moved.is_error()) {
            return moved;
        }
    }
    flush(outbox);

    auto loaded = load_source(source_path);

    Result<void> result = Ok();
    {
        std::lock_guard lock(mutex_);
        if (loaded.is_error()) {
            fail_locked(loaded.error(), "", outbox);
            result = Err<void>(loaded.error());
        } else {
            auto& source = loaded.value();
            content_ = std::move(source.content);
            creators_ = std::move(source.creators);
            loaded_ = true;

            state_.fingerprint = source.fingerprint;
            state_.total_articles = content_.size();
            state_.total_creators = creators_.size();
            state_.last_error.reset();
            refresh_progress_locked();

            log_locked("Found " + std::to_string(content_.size()) + " articles and " +
                       std::to_string(creators_.size()) + " creators");
            if (state_.uploaded_articles > 0 || state_.uploaded_creators > 0) {
                log_locked("Resuming: " + std::to_string(state_.uploaded_articles) + " articles and " +
                           std::to_string(state_.uploaded_creators) + " creators already uploaded");
            }

            events::SourceLoadedEvent event;
            event.source_path = state_.source_path;
            event.fingerprint = state_.fingerprint;
            event.total_articles = state_.total_articles;
            event.total_creators = state_.total_creators;
            event.confirmed_articles = state_.uploaded_articles;
            event.confirmed_creators = state_.uploaded_creators;
            event.skipped_rows = source.skipped_rows;
            outbox.push_back([this, event]() { bus_.emit(event); });

            auto moved = transition_locked(SyncStatus::Idle, outbox);
            if (moved.is_error()) {
                result = moved;
            }
        }
    }
    flush(outbox);
    return result;
}

Result<SyncController::LoadedSource> SyncController::load_source(const fs::path& source_path) {
    auto extractor = source::SourceExtractor::open(source_path);
    if (extractor.is_error()) {
        return Err<LoadedSource>(extractor.error());
    }

    LoadedSource loaded;
    loaded.fingerprint = extractor.value().fingerprint();

    auto content_stream = extractor.value().extract_content();
    if (content_stream.is_error()) {
        return Err<LoadedSource>(content_stream.error());
    }
    std::size_t content_duplicates = 0;
    auto content = source::collect_unique(content_stream.value(), &content_duplicates);
    if (content.is_error()) {
        return Err<LoadedSource>(content.error());
    }

    auto creator_stream = extractor.value().extract_creators();
    if (creator_stream.is_error()) {
        return Err<LoadedSource>(creator_stream.error());
    }
    std::size_t creator_duplicates = 0;
    auto creators = source::collect_unique(creator_stream.value(), &creator_duplicates);
    if (creators.is_error()) {
        return Err<LoadedSource>(creators.error());
    }

    if (content_duplicates + creator_duplicates > 0) {
        spdlog::warn("Dropped {} duplicate content ids and {} duplicate creator ids from {}",
                     content_duplicates, creator_duplicates, source_path.string());
    }

    loaded.content = std::move(content.value());
    loaded.creators = std::move(creators.value());
    loaded.skipped_rows = content_duplicates + creator_duplicates +
                          content_stream.value().skipped_without_id() +
                          creator_stream.value().skipped_without_id();

    auto checkpoint = checkpoint_.load(loaded.fingerprint);
    if (checkpoint.is_error()) {
        return Err<LoadedSource>(checkpoint.error());
    }
    return Ok(std::move(loaded));
}

// ============================================================================
// Upload control
// ============================================================================

Result<void> SyncController::start_upload(const std::string& credential) {
    std::lock_guard op(op_mutex_);
    auto idle = ensure_not_uploading();
    if (idle.is_error()) {
        return idle;
    }
    join_worker();

    Outbox outbox;
    Result<void> result = Ok();
    {
        std::lock_guard lock(mutex_);
        if (machine_.status() != SyncStatus::Idle || !loaded_) {
            return Err<void>(ErrorKind::State, "No source loaded; call start() first");
        }
        if (credential.empty()) {
            return Err<void>(ErrorKind::Config, "An upload credential is required");
        }
        credential_ = credential;
        result = launch_locked(false, outbox);
    }
    flush(outbox);
    return result;
}

Result<void> SyncController::pause() {
    std::lock_guard op(op_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (machine_.status() != SyncStatus::Uploading) {
            return Err<void>(ErrorKind::State,
                             std::string("Nothing to pause while ") + status_name(machine_.status()));
        }
        log_locked("Pausing...");
        cancel_.cancel();
    }
    join_worker();
    return Ok();
}

Result<void> SyncController::resume() {
    std::lock_guard op(op_mutex_);
    auto idle = ensure_not_uploading();
    if (idle.is_error()) {
        return idle;
    }
    join_worker();

    Outbox outbox;
    Result<void> result = Ok();
    {
        std::lock_guard lock(mutex_);
        if (machine_.status() != SyncStatus::Paused) {
            return Err<void>(ErrorKind::State,
                             std::string("Nothing to resume while ") + status_name(machine_.status()));
        }
        refresh_progress_locked();
        log_locked("Resuming upload");
        result = launch_locked(true, outbox);
    }
    flush(outbox);
    return result;
}

Result<void> SyncController::retry(const std::optional<std::string>& credential) {
    std::lock_guard op(op_mutex_);
    auto idle = ensure_not_uploading();
    if (idle.is_error()) {
        return idle;
    }
    join_worker();

    Outbox outbox;
    Result<void> result = Ok();
    {
        std::lock_guard lock(mutex_);
        if (machine_.status() != SyncStatus::Error) {
            return Err<void>(ErrorKind::State,
                             std::string("Nothing to retry while ") + status_name(machine_.status()));
        }
        if (!loaded_) {
            return Err<void>(ErrorKind::State, "No source loaded; call start() again");
        }
        if (credential) {
            if (credential->empty()) {
                return Err<void>(ErrorKind::Config, "An upload credential is required");
            }
            credential_ = *credential;
        }
        if (credential_.empty()) {
            return Err<void>(ErrorKind::Config, "An upload credential is required");
        }

        // Drop anything confirmed in memory that never reached the disk
        auto reloaded = checkpoint_.load(state_.fingerprint);
        if (reloaded.is_error()) {
            state_.last_error = reloaded.error();
            return Err<void>(reloaded.error());
        }
        refresh_progress_locked();
        state_.last_error.reset();
        log_locked("Retrying from the first unconfirmed batch");
        result = launch_locked(true, outbox);
    }
    flush(outbox);
    return result;
}

Result<void> SyncController::reset() {
    std::lock_guard op(op_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (!is_settled(machine_.status())) {
            return Err<void>(ErrorKind::State,
                             std::string("Cannot reset while ") + status_name(machine_.status()) + "; pause first");
        }
    }
    join_worker();

    Outbox outbox;
    {
        std::lock_guard lock(mutex_);
        const std::string fingerprint = loaded_ ? state_.fingerprint : std::string();
        if (!fingerprint.empty()) {
            auto cleared = checkpoint_.clear(fingerprint);
            if (cleared.is_error()) {
                return cleared;
            }
        }

        loaded_ = false;
        content_.clear();
        creators_.clear();
        state_ = SyncState{};
        next_sequence_ = {1, 1};
        logs_.clear();

        auto moved = transition_locked(SyncStatus::Idle, outbox);
        if (moved.is_error()) {
            return moved;
        }
        events::SyncResetEvent event;
        event.fingerprint = fingerprint;
        outbox.push_back([this, event]() { bus_.emit(event); });
    }
    flush(outbox);
    return Ok();
}

SyncStatus SyncController::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return !worker_active_ && is_settled(machine_.status()); });
    return machine_.status();
}

bool SyncController::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !worker_active_ && is_settled(machine_.status()); });
}

SyncState SyncController::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_locked();
}

SyncStatus SyncController::status() const {
    std::lock_guard lock(mutex_);
    return machine_.status();
}

// ============================================================================
// Worker
// ============================================================================

void SyncController::run_upload(CancellationToken cancel, bool resumed) {
    Outbox outbox;
    std::vector<Batch> batches;
    std::string credential;
    std::optional<Error> planning_error;
    {
        std::lock_guard lock(mutex_);
        credential = credential_;
        auto planned = plan_batches_locked();
        if (planned.is_error()) {
            planning_error = planned.error();
        } else {
            batches = std::move(planned.value());
            state_.current_batch = 0;
            state_.total_batches = batches.size();

            events::UploadStartedEvent event;
            event.fingerprint = state_.fingerprint;
            event.pending_articles = state_.total_articles - state_.uploaded_articles;
            event.pending_creators = state_.total_creators - state_.uploaded_creators;
            event.total_batches = batches.size();
            event.resumed = resumed;
            outbox.push_back([this, event]() { bus_.emit(event); });
            log_locked("Uploading " + std::to_string(event.pending_articles) + " articles and " +
                       std::to_string(event.pending_creators) + " creators in " +
                       std::to_string(batches.size()) + " batches");
        }
    }
    flush(outbox);
    if (planning_error) {
        finish_run(Ending::Failed, planning_error, "");
        return;
    }

    Ending ending = Ending::Completed;
    std::optional<Error> failure;
    std::string failed_batch;

    for (std::size_t i = 0; i < batches.size(); ++i) {
        const Batch& batch = batches[i];
        if (cancel.is_cancelled()) {
            ending = Ending::Paused;
            break;
        }

        {
            std::lock_guard lock(mutex_);
            state_.current_batch = i + 1;
            next_sequence_[slot(batch.entity_type)] = batch.sequence + 1;
            log_locked("Sending " + batch.batch_id() + " (" + std::to_string(batch.size()) + " records)");
        }

        const auto started = std::chrono::steady_clock::now();
        auto ack = transport_->send(batch, credential, cancel);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (ack.is_ok()) {
            auto confirmed = confirm_batch(batch, ack.value(), elapsed, outbox);
            flush(outbox);
            if (confirmed.is_error()) {
                ending = Ending::Failed;
                failure = confirmed.error();
                failed_batch = batch.batch_id();
                break;
            }
        } else if (ack.error().kind == ErrorKind::Cancelled && cancel.is_cancelled()) {
            ending = Ending::Paused;
            break;
        } else if (ack.error().kind == ErrorKind::Validation) {
            skip_batch(batch, ack.error(), outbox);
            flush(outbox);
        } else {
            ending = Ending::Failed;
            failure = ack.error();
            failed_batch = batch.batch_id();
            break;
        }

        if (i + 1 < batches.size() && config_.inter_batch_delay.count() > 0) {
            if (cancel.wait_for(config_.inter_batch_delay)) {
                ending = Ending::Paused;
                break;
            }
        }
    }

    finish_run(ending, failure, failed_batch);
}

Result<void> SyncController::confirm_batch(const Batch& batch, const BatchAck& ack,
                                           std::chrono::milliseconds elapsed, Outbox& outbox) {
    // The worker is the checkpoint's only user while Uploading
    auto added = checkpoint_.mark_confirmed(batch.entity_type, batch.ids());
    if (added.is_error()) {
        return Err<void>(added.error());
    }
    auto persisted = checkpoint_.persist();
    if (persisted.is_error()) {
        return persisted;
    }

    std::lock_guard lock(mutex_);
    if (batch.entity_type == EntityType::Content) {
        state_.uploaded_articles += added.value();
    } else {
        state_.uploaded_creators += added.value();
    }
    state_.inserted += ack.inserted;
    state_.updated += ack.updated;
    log_locked(batch.batch_id() + " confirmed: +" + std::to_string(ack.inserted) + " ~" +
               std::to_string(ack.updated));

    events::BatchConfirmedEvent event;
    event.batch_id = batch.batch_id();
    event.entity_type = batch.entity_type;
    event.records = batch.size();
    event.inserted = ack.inserted;
    event.updated = ack.updated;
    event.current_batch = state_.current_batch;
    event.total_batches = state_.total_batches;
    event.duration = elapsed;
    outbox.push_back([this, event]() { bus_.emit(event); });
    return Ok();
}

void SyncController::skip_batch(const Batch& batch, const Error& error, Outbox& outbox) {
    std::lock_guard lock(mutex_);
    ++state_.skipped_batches;
    log_locked(batch.batch_id() + " rejected, skipping: " + error.message);

    events::BatchSkippedEvent event;
    event.batch_id = batch.batch_id();
    event.entity_type = batch.entity_type;
    event.records = batch.size();
    event.reason = error.message;
    outbox.push_back([this, event]() { bus_.emit(event); });
}

void SyncController::finish_run(Ending ending, const std::optional<Error>& failure, const std::string& batch_id) {
    Outbox outbox;
    {
        std::lock_guard lock(mutex_);
        switch (ending) {
            case Ending::Paused: {
                log_locked("Paused with " + std::to_string(state_.uploaded_articles) + " articles and " +
                           std::to_string(state_.uploaded_creators) + " creators confirmed");
                events::SyncPausedEvent event;
                event.uploaded_articles = state_.uploaded_articles;
                event.uploaded_creators = state_.uploaded_creators;
                outbox.push_back([this, event]() { bus_.emit(event); });
                auto moved = transition_locked(SyncStatus::Paused, outbox);
                if (moved.is_error()) {
                    spdlog::error("{}", describe(moved.error()));
                }
                break;
            }
            case Ending::Failed:
                fail_locked(failure.value_or(Error{ErrorKind::Server, "Upload failed"}), batch_id, outbox);
                break;
            case Ending::Completed: {
                bool cleared = false;
                if (config_.completion_policy == CompletionPolicy::Clear) {
                    auto result = checkpoint_.clear(state_.fingerprint);
                    if (result.is_error()) {
                        log_locked("Could not clear checkpoint: " + result.error().message);
                    } else {
                        cleared = true;
                    }
                }
                log_locked("Upload complete: " + std::to_string(state_.uploaded_articles) + " articles, " +
                           std::to_string(state_.uploaded_creators) + " creators");

                events::SyncCompletedEvent event;
                event.uploaded_articles = state_.uploaded_articles;
                event.uploaded_creators = state_.uploaded_creators;
                event.inserted = state_.inserted;
                event.updated = state_.updated;
                event.skipped_batches = state_.skipped_batches;
                event.checkpoint_cleared = cleared;
                outbox.push_back([this, event]() { bus_.emit(event); });
                auto moved = transition_locked(SyncStatus::Completed, outbox);
                if (moved.is_error()) {
                    spdlog::error("{}", describe(moved.error()));
                }
                break;
            }
        }
    }
    flush(outbox);

    std::lock_guard lock(mutex_);
    worker_active_ = false;
    cv_.notify_all();
}

// ============================================================================
// Helpers (mutex_ held)
// ============================================================================

Result<void> SyncController::transition_locked(SyncStatus next, Outbox& outbox) {
    const SyncStatus from = machine_.status();
    auto moved = machine_.transition_to(next);
    if (moved.is_error()) {
        return moved;
    }
    state_.status = next;

    events::StateChangedEvent event{from, next, snapshot_locked()};
    outbox.push_back([this, event]() { bus_.emit(event); });
    cv_.notify_all();
    return Ok();
}

Result<void> SyncController::launch_locked(bool resumed, Outbox& outbox) {
    if (worker_.joinable()) {
        return Err<void>(ErrorKind::State, "Upload worker is still running");
    }

    cancel_ = CancellationToken();
    auto moved = transition_locked(SyncStatus::Uploading, outbox);
    if (moved.is_error()) {
        return moved;
    }

    worker_active_ = true;
    CancellationToken token = cancel_;
    worker_ = std::thread([this, token, resumed]() { run_upload(token, resumed); });
    return Ok();
}

Result<std::vector<Batch>> SyncController::plan_batches_locked() const {
    std::vector<ContentRecord> pending_content;
    for (const auto& record : content_) {
        if (!checkpoint_.is_confirmed(EntityType::Content, record.content_id)) {
            pending_content.push_back(record);
        }
    }
    std::vector<CreatorRecord> pending_creators;
    for (const auto& record : creators_) {
        if (!checkpoint_.is_confirmed(EntityType::Creator, record.user_id)) {
            pending_creators.push_back(record);
        }
    }

    auto batches = BatchScheduler::schedule(pending_content, config_.batch_size,
                                            next_sequence_[slot(EntityType::Content)]);
    if (batches.is_error()) {
        return batches;
    }
    auto creator_batches = BatchScheduler::schedule(pending_creators, config_.batch_size,
                                                    next_sequence_[slot(EntityType::Creator)]);
    if (creator_batches.is_error()) {
        return creator_batches;
    }

    auto& all = batches.value();
    for (auto& batch : creator_batches.value()) {
        all.push_back(std::move(batch));
    }
    return batches;
}

void SyncController::refresh_progress_locked() {
    std::size_t confirmed_content = 0;
    for (const auto& record : content_) {
        if (checkpoint_.is_confirmed(EntityType::Content, record.content_id)) {
            ++confirmed_content;
        }
    }
    std::size_t confirmed_creators = 0;
    for (const auto& record : creators_) {
        if (checkpoint_.is_confirmed(EntityType::Creator, record.user_id)) {
            ++confirmed_creators;
        }
    }

    state_.uploaded_articles = confirmed_content;
    state_.uploaded_creators = confirmed_creators;
    state_.current_batch = 0;
    state_.total_batches = BatchScheduler::total_batches(
        PendingCounts{content_.size() - confirmed_content, creators_.size() - confirmed_creators},
        config_.batch_size);
}

void SyncController::fail_locked(const Error& error, const std::string& batch_id, Outbox& outbox) {
    state_.last_error = error;
    log_locked("Error: " + describe(error));

    events::SyncFailedEvent event;
    event.error = error;
    event.batch_id = batch_id;
    outbox.push_back([this, event]() { bus_.emit(event); });

    auto moved = transition_locked(SyncStatus::Error, outbox);
    if (moved.is_error()) {
        spdlog::error("{}", describe(moved.error()));
    }
}

SyncState SyncController::snapshot_locked() const {
    SyncState copy = state_;
    copy.status = machine_.status();
    copy.ready = loaded_ && machine_.status() == SyncStatus::Idle;
    copy.logs = logs_.entries();
    return copy;
}

void SyncController::log_locked(const std::string& message) {
    logs_.append(message);
}

// ============================================================================

Result<void> SyncController::ensure_not_uploading() const {
    std::lock_guard lock(mutex_);
    if (machine_.status() == SyncStatus::Uploading) {
        return Err<void>(ErrorKind::State, "An upload is already running");
    }
    return Ok();
}

void SyncController::join_worker() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void SyncController::flush(Outbox& outbox) {
    for (auto& emit : outbox) {
        emit();
    }
    outbox.clear();
}

} // namespace upsync::sync
