#pragma once

#include "upsync/core/result.hpp"
#include "upsync/source/records.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace upsync::sync {

using source::ContentRecord;
using source::CreatorRecord;
using source::EntityType;

/**
 * @brief Ordered slice of one entity type's pending records
 *
 * Exactly one of content/creators is populated, matching entity_type.
 */
struct Batch {
    EntityType entity_type = EntityType::Content;
    std::uint64_t sequence = 0;
    std::vector<ContentRecord> content;
    std::vector<CreatorRecord> creators;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<std::string> ids() const;

    /// "articles-3", "creators-1"
    [[nodiscard]] std::string batch_id() const;
};

struct PendingCounts {
    std::size_t content = 0;
    std::size_t creators = 0;
};

class BatchScheduler {
public:
    static constexpr std::size_t kDefaultBatchSize = 50;

    /**
     * @brief Split @p pending into batches of at most @p max_batch_size
     *
     * Batch k holds input indices [k*N, min((k+1)*N, len)); sequence
     * numbers start at @p first_sequence and increase by one.
     */
    static Result<std::vector<Batch>> schedule(const std::vector<ContentRecord>& pending,
                                               std::size_t max_batch_size,
                                               std::uint64_t first_sequence = 1);

    static Result<std::vector<Batch>> schedule(const std::vector<CreatorRecord>& pending,
                                               std::size_t max_batch_size,
                                               std::uint64_t first_sequence = 1);

    /// Sum over entity types of ceil(count / N); 0 when N is 0
    static std::size_t total_batches(const PendingCounts& pending, std::size_t max_batch_size) noexcept;
};

} // namespace upsync::sync
