#pragma once

#include "upsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace upsync::sync {

enum class SyncStatus {
    Idle,
    Loading,
    Uploading,
    Paused,
    Completed,
    Error
};

const char* status_name(SyncStatus status);
std::optional<SyncStatus> status_from_name(const std::string& name);

/**
 * @brief Rolling window of timestamped log lines
 */
class LogBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit LogBuffer(std::size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    void append(const std::string& message);
    void clear() { entries_.clear(); }

    [[nodiscard]] std::vector<std::string> entries() const { return {entries_.begin(), entries_.end()}; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<std::string> entries_;
};

/**
 * @brief Point-in-time view of an upload, handed out by the controller
 */
struct SyncState {
    SyncStatus status = SyncStatus::Idle;
    bool ready = false;                  ///< Idle with a loaded source
    std::string source_path;
    std::string fingerprint;
    std::size_t total_articles = 0;
    std::size_t total_creators = 0;
    std::size_t uploaded_articles = 0;
    std::size_t uploaded_creators = 0;
    std::size_t current_batch = 0;
    std::size_t total_batches = 0;
    std::size_t skipped_batches = 0;
    std::size_t inserted = 0;
    std::size_t updated = 0;
    std::optional<Error> last_error;     ///< Populated when status == Error
    std::vector<std::string> logs;
};

/**
 * @brief Legal status transitions of the upload lifecycle
 */
class SyncStateMachine {
public:
    [[nodiscard]] SyncStatus status() const noexcept { return status_; }

    Result<void> transition_to(SyncStatus next);

    [[nodiscard]] bool can_transition(SyncStatus target) const noexcept;

private:
    SyncStatus status_ = SyncStatus::Idle;
};

} // namespace upsync::sync
