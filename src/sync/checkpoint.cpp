#include "upsync/sync/checkpoint.hpp"

#include "upsync/core/file_io.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace upsync::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

// ============================================================================
// ConfirmedIdSet
// ============================================================================

bool ConfirmedIdSet::insert(EntityType type, const std::string& id) {
    auto& part = partition(type);
    if (!part.index.insert(id).second) {
        return false;
    }
    part.order.push_back(id);
    return true;
}

bool ConfirmedIdSet::contains(EntityType type, const std::string& id) const {
    return partition(type).index.count(id) > 0;
}

std::size_t ConfirmedIdSet::size(EntityType type) const {
    return partition(type).order.size();
}

bool ConfirmedIdSet::empty() const {
    return content_.order.empty() && creators_.order.empty();
}

const std::vector<std::string>& ConfirmedIdSet::ids(EntityType type) const {
    return partition(type).order;
}

void ConfirmedIdSet::clear() {
    content_ = Partition{};
    creators_ = Partition{};
}

ConfirmedIdSet::Partition& ConfirmedIdSet::partition(EntityType type) {
    return type == EntityType::Content ? content_ : creators_;
}

const ConfirmedIdSet::Partition& ConfirmedIdSet::partition(EntityType type) const {
    return type == EntityType::Content ? content_ : creators_;
}

// ============================================================================
// CheckpointStore
// ============================================================================

CheckpointStore::CheckpointStore(fs::path directory) : directory_(std::move(directory)) {}

Result<ConfirmedIdSet> CheckpointStore::load(const std::string& fingerprint) {
    fingerprint_ = fingerprint;
    confirmed_.clear();

    const auto path = path_for(fingerprint);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(confirmed_);
    }

    auto contents = read_file(path);
    if (contents.is_error()) {
        return Err<ConfirmedIdSet>(contents.error());
    }

    try {
        const auto doc = json::parse(contents.value());
        if (doc.value("fingerprint", std::string()) != fingerprint) {
            // Hash collision with another snapshot's checkpoint
            spdlog::warn("Checkpoint {} belongs to a different source; starting fresh", path.string());
            return Ok(confirmed_);
        }
        const auto& confirmed = doc.at("confirmed");
        for (const auto& id : confirmed.value("articles", json::array())) {
            confirmed_.insert(EntityType::Content, id.get<std::string>());
        }
        for (const auto& id : confirmed.value("creators", json::array())) {
            confirmed_.insert(EntityType::Creator, id.get<std::string>());
        }
    } catch (const json::exception& e) {
        confirmed_.clear();
        return Err<ConfirmedIdSet>(ErrorKind::Io,
                                   "Checkpoint " + path.string() + " is unreadable (" + e.what() +
                                       "); reset to discard it");
    }

    spdlog::debug("Loaded checkpoint for {}: {} articles, {} creators confirmed",
                  fingerprint,
                  confirmed_.size(EntityType::Content),
                  confirmed_.size(EntityType::Creator));
    return Ok(confirmed_);
}

Result<std::size_t> CheckpointStore::mark_confirmed(EntityType type, const std::vector<std::string>& ids) {
    if (!fingerprint_) {
        return Err<std::size_t>(ErrorKind::State, "No checkpoint loaded");
    }
    std::size_t added = 0;
    for (const auto& id : ids) {
        if (confirmed_.insert(type, id)) {
            ++added;
        }
    }
    return Ok(added);
}

Result<void> CheckpointStore::persist() {
    if (!fingerprint_) {
        return Err<void>(ErrorKind::State, "No checkpoint loaded");
    }

    json doc;
    doc["fingerprint"] = *fingerprint_;
    doc["uploaded_articles"] = confirmed_.size(EntityType::Content);
    doc["uploaded_creators"] = confirmed_.size(EntityType::Creator);
    doc["confirmed"] = {
        {"articles", confirmed_.ids(EntityType::Content)},
        {"creators", confirmed_.ids(EntityType::Creator)},
    };

    return write_file_atomic(path_for(*fingerprint_), doc.dump(-1, ' ', false, json::error_handler_t::replace));
}

Result<void> CheckpointStore::clear(const std::string& fingerprint) {
    const auto path = path_for(fingerprint);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to remove checkpoint " + path.string() + ": " + ec.message());
    }
    if (fingerprint_ && *fingerprint_ == fingerprint) {
        confirmed_.clear();
    }
    return Ok();
}

bool CheckpointStore::is_confirmed(EntityType type, const std::string& id) const {
    return confirmed_.contains(type, id);
}

bool CheckpointStore::exists(const std::string& fingerprint) const {
    std::error_code ec;
    return fs::exists(path_for(fingerprint), ec);
}

fs::path CheckpointStore::path_for(const std::string& fingerprint) const {
    return directory_ / ("checkpoint-" + fnv1a_hex(fingerprint) + ".json");
}

} // namespace upsync::sync
