#pragma once

#include "chunk_plan.hpp"
#include "object_ref.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace memrun {

// Receives response body bytes in arrival order. May throw to abort the transfer.
using ByteSink = std::function<void(const char* data, std::size_t size)>;

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Total object size. Throws NotFound or BackendError.
    [[nodiscard]] virtual std::uint64_t head(const ObjectRef& object) = 0;

    // Streams bytes [range.start, range.end) into sink. Throws ChunkTransientError for
    // retryable failures and BackendError otherwise. Gives up promptly once cancel is set.
    virtual void getRange(const ObjectRef& object, const ByteRange& range, const ByteSink& sink,
                          const std::atomic<bool>& cancel) = 0;
};

} // namespace memrun
