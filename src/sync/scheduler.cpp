#include "upsync/sync/scheduler.hpp"

#include <algorithm>

namespace upsync::sync {
namespace {

std::size_t ceil_div(std::size_t count, std::size_t size) {
    return (count + size - 1) / size;
}

template<typename Record>
Result<std::vector<Batch>> split(const std::vector<Record>& pending,
                                 std::size_t max_batch_size,
                                 std::uint64_t first_sequence,
                                 EntityType type,
                                 std::vector<Record> Batch::*slot) {
    if (max_batch_size == 0) {
        return Err<std::vector<Batch>>(ErrorKind::Config, "batch size must be > 0");
    }

    std::vector<Batch> batches;
    batches.reserve(ceil_div(pending.size(), max_batch_size));

    std::uint64_t sequence = first_sequence;
    for (std::size_t begin = 0; begin < pending.size(); begin += max_batch_size) {
        const std::size_t end = std::min(begin + max_batch_size, pending.size());
        Batch batch;
        batch.entity_type = type;
        batch.sequence = sequence++;
        (batch.*slot).assign(pending.begin() + static_cast<std::ptrdiff_t>(begin),
                             pending.begin() + static_cast<std::ptrdiff_t>(end));
        batches.push_back(std::move(batch));
    }
    return Ok(std::move(batches));
}

} // namespace

std::size_t Batch::size() const noexcept {
    return entity_type == EntityType::Content ? content.size() : creators.size();
}

std::vector<std::string> Batch::ids() const {
    std::vector<std::string> out;
    out.reserve(size());
    if (entity_type == EntityType::Content) {
        for (const auto& record : content) {
            out.push_back(record.content_id);
        }
    } else {
        for (const auto& record : creators) {
            out.push_back(record.user_id);
        }
    }
    return out;
}

std::string Batch::batch_id() const {
    return std::string(source::entity_label(entity_type)) + "-" + std::to_string(sequence);
}

Result<std::vector<Batch>> BatchScheduler::schedule(const std::vector<ContentRecord>& pending,
                                                    std::size_t max_batch_size,
                                                    std::uint64_t first_sequence) {
    return split(pending, max_batch_size, first_sequence, EntityType::Content, &Batch::content);
}

Result<std::vector<Batch>> BatchScheduler::schedule(const std::vector<CreatorRecord>& pending,
                                                    std::size_t max_batch_size,
                                                    std::uint64_t first_sequence) {
    return split(pending, max_batch_size, first_sequence, EntityType::Creator, &Batch::creators);
}

std::size_t BatchScheduler::total_batches(const PendingCounts& pending, std::size_t max_batch_size) noexcept {
    if (max_batch_size == 0) {
        return 0;
    }
    return ceil_div(pending.content, max_batch_size) + ceil_div(pending.creators, max_batch_size);
}

} // namespace upsync::sync
