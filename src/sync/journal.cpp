#include "upsync/sync/journal.hpp"

#include "upsync/core/file_io.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <sys/types.h>

namespace upsync::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<ErrorKind> kind_from_key(const std::string& key) {
    for (auto kind : {ErrorKind::Format, ErrorKind::Config, ErrorKind::Auth, ErrorKind::Server,
                      ErrorKind::Validation, ErrorKind::Cancelled, ErrorKind::Io, ErrorKind::State,
                      ErrorKind::Protocol}) {
        if (key == error_kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

bool process_alive(long pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

} // namespace

StatusJournal::StatusJournal(fs::path directory) : directory_(std::move(directory)) {}

Result<void> StatusJournal::write(const SyncState& state, const std::string& endpoint) {
    json doc;
    doc["status"] = status_name(state.status);
    doc["source_path"] = state.source_path;
    doc["fingerprint"] = state.fingerprint;
    doc["endpoint"] = endpoint;
    doc["total_articles"] = state.total_articles;
    doc["total_creators"] = state.total_creators;
    doc["uploaded_articles"] = state.uploaded_articles;
    doc["uploaded_creators"] = state.uploaded_creators;
    doc["current_batch"] = state.current_batch;
    doc["total_batches"] = state.total_batches;
    doc["skipped_batches"] = state.skipped_batches;
    doc["inserted"] = state.inserted;
    doc["updated"] = state.updated;
    if (state.last_error) {
        doc["last_error"] = {{"kind", error_kind_name(state.last_error->kind)}, {"message", state.last_error->message}};
    } else {
        doc["last_error"] = nullptr;
    }
    doc["logs"] = state.logs;

    // Paths and log lines may carry bytes that are not UTF-8
    return write_file_atomic(status_path(), doc.dump(2, ' ', false, json::error_handler_t::replace));
}

Result<StatusJournal::Entry> StatusJournal::read() const {
    std::error_code ec;
    if (!fs::exists(status_path(), ec)) {
        return Err<Entry>(ErrorKind::State, "No upload recorded in " + directory_.string());
    }

    auto contents = read_file(status_path());
    if (contents.is_error()) {
        return Err<Entry>(contents.error());
    }

    Entry entry;
    try {
        const auto doc = json::parse(contents.value());
        auto status = status_from_name(doc.value("status", std::string()));
        if (!status) {
            return Err<Entry>(ErrorKind::Io, "Unknown status in " + status_path().string());
        }
        auto& state = entry.state;
        state.status = *status;
        state.source_path = doc.value("source_path", std::string());
        state.fingerprint = doc.value("fingerprint", std::string());
        state.total_articles = doc.value("total_articles", std::size_t{0});
        state.total_creators = doc.value("total_creators", std::size_t{0});
        state.uploaded_articles = doc.value("uploaded_articles", std::size_t{0});
        state.uploaded_creators = doc.value("uploaded_creators", std::size_t{0});
        state.current_batch = doc.value("current_batch", std::size_t{0});
        state.total_batches = doc.value("total_batches", std::size_t{0});
        state.skipped_batches = doc.value("skipped_batches", std::size_t{0});
        state.inserted = doc.value("inserted", std::size_t{0});
        state.updated = doc.value("updated", std::size_t{0});
        if (doc.contains("last_error") && doc["last_error"].is_object()) {
            const auto& err = doc["last_error"];
            auto kind = kind_from_key(err.value("kind", std::string()));
            state.last_error = Error{kind.value_or(ErrorKind::State), err.value("message", std::string())};
        }
        state.logs = doc.value("logs", std::vector<std::string>{});
        entry.endpoint = doc.value("endpoint", std::string());
    } catch (const json::exception& e) {
        return Err<Entry>(ErrorKind::Io, "Status file " + status_path().string() + " is unreadable: " + e.what());
    }

    entry.pid = running_pid();
    return Ok(std::move(entry));
}

Result<void> StatusJournal::remove() {
    std::error_code ec;
    fs::remove(status_path(), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to remove " + status_path().string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> StatusJournal::claim_pid(long pid) {
    if (auto other = running_pid(); other && *other != pid) {
        return Err<void>(ErrorKind::State, "Another upload (pid " + std::to_string(*other) + ") owns " +
                                               directory_.string());
    }
    return write_file_atomic(pid_path(), std::to_string(pid) + "\n");
}

void StatusJournal::release_pid() {
    std::error_code ec;
    fs::remove(pid_path(), ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", pid_path().string(), ec.message());
    }
}

std::optional<long> StatusJournal::running_pid() const {
    std::error_code ec;
    if (!fs::exists(pid_path(), ec)) {
        return std::nullopt;
    }
    auto contents = read_file(pid_path());
    if (contents.is_error()) {
        return std::nullopt;
    }
    long pid = 0;
    try {
        pid = std::stol(contents.value());
    } catch (const std::exception&) {
        spdlog::warn("Ignoring malformed pid file {}", pid_path().string());
        return std::nullopt;
    }
    if (!process_alive(pid)) {
        return std::nullopt;
    }
    return pid;
}

} // namespace upsync::sync
