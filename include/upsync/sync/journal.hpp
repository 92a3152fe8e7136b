#pragma once

#include "upsync/core/result.hpp"
#include "upsync/sync/state.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace upsync::sync {

/**
 * @brief Last known state of an upload, shared between CLI invocations
 *
 * Lives in the state directory next to the checkpoints:
 *
 *   status.json   { "status": "paused", "source_path": ..., "endpoint": ...,
 *                   "total_articles": n, ..., "last_error": {...}, "logs": [...] }
 *   upsync.pid    pid of the process currently uploading
 */
class StatusJournal {
public:
    struct Entry {
        SyncState state;
        std::string endpoint;
        std::optional<long> pid;      ///< set when a live uploader owns the state dir
    };

    explicit StatusJournal(std::filesystem::path directory);

    Result<void> write(const SyncState& state, const std::string& endpoint);

    /// ErrorKind::State when nothing was recorded yet
    Result<Entry> read() const;

    Result<void> remove();

    Result<void> claim_pid(long pid);
    void release_pid();

    /// Pid of a running uploader; stale pid files are ignored
    std::optional<long> running_pid() const;

    std::filesystem::path status_path() const { return directory_ / "status.json"; }
    std::filesystem::path pid_path() const { return directory_ / "upsync.pid"; }

private:
    std::filesystem::path directory_;
};

} // namespace upsync::sync
