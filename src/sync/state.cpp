#include "upsync/sync/state.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace upsync::sync {
namespace {

bool is_allowed(SyncStatus current, SyncStatus target) {
    static const std::unordered_map<SyncStatus, std::vector<SyncStatus>> transitions {
        {SyncStatus::Idle, {SyncStatus::Loading, SyncStatus::Uploading}},
        {SyncStatus::Loading, {SyncStatus::Idle, SyncStatus::Error}},
        {SyncStatus::Uploading, {SyncStatus::Paused, SyncStatus::Completed, SyncStatus::Error}},
        {SyncStatus::Paused, {SyncStatus::Uploading, SyncStatus::Idle}},
        {SyncStatus::Completed, {SyncStatus::Idle, SyncStatus::Loading}},
        {SyncStatus::Error, {SyncStatus::Uploading, SyncStatus::Idle, SyncStatus::Loading}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

std::string timestamp_now() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

} // namespace

const char* status_name(SyncStatus status) {
    switch (status) {
        case SyncStatus::Idle: return "idle";
        case SyncStatus::Loading: return "loading";
        case SyncStatus::Uploading: return "uploading";
        case SyncStatus::Paused: return "paused";
        case SyncStatus::Completed: return "completed";
        case SyncStatus::Error: return "error";
    }
    return "unknown";
}

std::optional<SyncStatus> status_from_name(const std::string& name) {
    for (auto status : {SyncStatus::Idle, SyncStatus::Loading, SyncStatus::Uploading,
                        SyncStatus::Paused, SyncStatus::Completed, SyncStatus::Error}) {
        if (name == status_name(status)) {
            return status;
        }
    }
    return std::nullopt;
}

void LogBuffer::append(const std::string& message) {
    if (capacity_ == 0) {
        return;
    }
    entries_.push_back("[" + timestamp_now() + "] " + message);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

Result<void> SyncStateMachine::transition_to(SyncStatus next) {
    if (!can_transition(next)) {
        return Err<void>(ErrorKind::State,
                         std::string("Illegal transition ") + status_name(status_) + " -> " + status_name(next));
    }
    status_ = next;
    return Ok();
}

bool SyncStateMachine::can_transition(SyncStatus target) const noexcept {
    if (status_ == target) {
        return status_ == SyncStatus::Idle;
    }
    return is_allowed(status_, target);
}

} // namespace upsync::sync
