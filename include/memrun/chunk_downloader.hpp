#pragma once

#include "chunk_plan.hpp"
#include "memory_file.hpp"
#include "object_ref.hpp"
#include "progress.hpp"
#include "storage_backend.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace memrun {

struct DownloadOptions {
    // Total attempts per chunk, the first one included.
    int max_attempts{3};
    // Backoff before the first retry; doubles on every further retry of the same chunk.
    std::chrono::milliseconds retry_delay{200};
};

struct DownloadStats {
    std::uint64_t total_bytes{0};
    std::size_t chunks{0};
    std::size_t retries{0};
    std::size_t workers{0};
    std::chrono::milliseconds elapsed{0};
};

// Fetches every range of a plan into a memory file with a bounded pool of worker
// threads. Each worker writes only through the MemoryRegion of the chunk it holds.
class ChunkDownloader {
public:
    ChunkDownloader(StorageBackend& backend, ObjectRef object, DownloadOptions options = {});
    ~ChunkDownloader();

    ChunkDownloader(const ChunkDownloader&) = delete;
    ChunkDownloader& operator=(const ChunkDownloader&) = delete;

    // Returns once every chunk is written. Throws ChunkExhausted when a chunk runs out
    // of attempts or fails permanently; all other chunks are cancelled first.
    DownloadStats run(const ChunkPlan& plan, const MemoryFile& file);

    [[nodiscard]] Progress getProgress() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace memrun
