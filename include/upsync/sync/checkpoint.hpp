#pragma once

#include "upsync/core/result.hpp"
#include "upsync/source/records.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace upsync::sync {

using source::EntityType;

/**
 * @brief Ids the remote service has acknowledged, split by entity type
 *
 * Insertion order is kept so the persisted document is stable across runs.
 */
class ConfirmedIdSet {
public:
    /// @return true if @p id was not present before
    bool insert(EntityType type, const std::string& id);

    [[nodiscard]] bool contains(EntityType type, const std::string& id) const;
    [[nodiscard]] std::size_t size(EntityType type) const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] const std::vector<std::string>& ids(EntityType type) const;

    void clear();

private:
    struct Partition {
        std::vector<std::string> order;
        std::unordered_set<std::string> index;
    };

    Partition& partition(EntityType type);
    const Partition& partition(EntityType type) const;

    Partition content_;
    Partition creators_;
};

/**
 * @brief Durable per-fingerprint record of confirmed ids
 *
 * Layout: one JSON document per fingerprint in the store directory,
 * named after the FNV-1a hash of the fingerprint:
 *
 *   { "fingerprint": "...", "uploaded_articles": n, "uploaded_creators": m,
 *     "confirmed": { "articles": [...], "creators": [...] } }
 *
 * Only one checkpoint is active at a time (the one last load()ed).
 * Not thread-safe; the controller is its single mutator.
 */
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path directory);

    /// Activates @p fingerprint; returns an empty set if nothing was saved for it
    Result<ConfirmedIdSet> load(const std::string& fingerprint);

    /// @return number of ids that were not confirmed before
    Result<std::size_t> mark_confirmed(EntityType type, const std::vector<std::string>& ids);

    /// Flush the active checkpoint to disk before returning
    Result<void> persist();

    Result<void> clear(const std::string& fingerprint);

    [[nodiscard]] bool is_confirmed(EntityType type, const std::string& id) const;
    [[nodiscard]] const ConfirmedIdSet& confirmed() const noexcept { return confirmed_; }

    [[nodiscard]] bool exists(const std::string& fingerprint) const;
    [[nodiscard]] std::filesystem::path path_for(const std::string& fingerprint) const;

private:
    std::filesystem::path directory_;
    std::optional<std::string> fingerprint_;
    ConfirmedIdSet confirmed_;
};

} // namespace upsync::sync
