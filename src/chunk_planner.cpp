#include "memrun/chunk_plan.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace memrun {

ChunkPolicy::ChunkPolicy(std::vector<Band> bands) : bands_(std::move(bands)) {
    if (bands_.empty()) {
        throw std::invalid_argument("Chunk policy needs at least one band");
    }
    if (bands_.front().min_size != 0) {
        throw std::invalid_argument("First chunk policy band must start at size 0");
    }
    for (std::size_t i = 0; i < bands_.size(); ++i) {
        const auto& band = bands_[i];
        if (band.chunk_length == 0 || band.concurrency == 0) {
            throw std::invalid_argument(
                fmt::format("Chunk policy band {} has zero chunk length or concurrency", i));
        }
        if (i > 0 && band.min_size <= bands_[i - 1].min_size) {
            throw std::invalid_argument(
                fmt::format("Chunk policy band {} is not in ascending size order", i));
        }
    }
}

ChunkPolicy ChunkPolicy::defaults() {
    return ChunkPolicy({
        {0, 4 * kMiB, 4},
        {64 * kMiB, 16 * kMiB, 8},
        {512 * kMiB, 64 * kMiB, 12},
        {2 * kGiB, 128 * kMiB, 16},
    });
}

ChunkPolicy ChunkPolicy::fixed(std::uint64_t chunk_length, std::size_t concurrency) {
    return ChunkPolicy({{0, chunk_length, concurrency}});
}

const ChunkPolicy::Band& ChunkPolicy::select(std::uint64_t total_size) const {
    // Last band whose lower bound is <= total_size; a size on a boundary takes the higher band.
    auto it = std::upper_bound(bands_.begin(), bands_.end(), total_size,
                               [](std::uint64_t size, const Band& band) { return size < band.min_size; });
    return *std::prev(it);
}

ChunkPlan planChunks(std::uint64_t total_size, const ChunkPolicy& policy) {
    const auto& band = policy.select(total_size);

    ChunkPlan plan;
    plan.total_size = total_size;
    plan.chunk_length = band.chunk_length;
    plan.concurrency = band.concurrency;

    if (total_size == 0) {
        return plan;
    }

    plan.ranges.reserve(static_cast<std::size_t>((total_size + band.chunk_length - 1) / band.chunk_length));
    for (std::uint64_t start = 0; start < total_size; start += band.chunk_length) {
        const std::uint64_t end = std::min(total_size, start + band.chunk_length);
        plan.ranges.push_back({start, end});
        if (end == total_size) {
            break;
        }
    }
    return plan;
}

} // namespace memrun
