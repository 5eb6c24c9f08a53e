#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace memrun {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
constexpr std::uint64_t kGiB = 1024ULL * kMiB;

// Half-open byte range [start, end).
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }

    bool operator==(const ByteRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const ByteRange& other) const noexcept { return !(*this == other); }
};

struct ChunkPlan {
    std::uint64_t total_size{0};
    std::uint64_t chunk_length{0};
    std::size_t concurrency{1};
    std::vector<ByteRange> ranges;

    bool operator==(const ChunkPlan& other) const noexcept {
        return total_size == other.total_size && chunk_length == other.chunk_length &&
               concurrency == other.concurrency && ranges == other.ranges;
    }
};

// Size-banded chunking policy. Each band applies from min_size (inclusive) up to
// the next band's min_size (exclusive); the first band must start at 0.
class ChunkPolicy {
public:
    struct Band {
        std::uint64_t min_size{0};
        std::uint64_t chunk_length{0};
        std::size_t concurrency{1};
    };

    explicit ChunkPolicy(std::vector<Band> bands);

    static ChunkPolicy defaults();
    static ChunkPolicy fixed(std::uint64_t chunk_length, std::size_t concurrency);

    [[nodiscard]] const Band& select(std::uint64_t total_size) const;
    [[nodiscard]] const std::vector<Band>& bands() const noexcept { return bands_; }

private:
    std::vector<Band> bands_;
};

[[nodiscard]] ChunkPlan planChunks(std::uint64_t total_size,
                                   const ChunkPolicy& policy = ChunkPolicy::defaults());

} // namespace memrun
