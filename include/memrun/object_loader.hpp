#pragma once

#include "chunk_downloader.hpp"
#include "chunk_plan.hpp"
#include "memory_file.hpp"
#include "object_ref.hpp"
#include "storage_backend.hpp"

#include <cstdint>
#include <string>

namespace memrun {

struct LoadOptions {
    ChunkPolicy policy{ChunkPolicy::defaults()};
    DownloadOptions download{};
    std::string memfd_name{"memrun"};
};

// A finished download. Owns the populated memory file; releasing the job frees it.
struct DownloadJob {
    ObjectRef object;
    std::uint64_t total_size{0};
    ChunkPlan plan;
    MemoryFile file;
    DownloadStats stats;
};

class ObjectLoader {
public:
    explicit ObjectLoader(StorageBackend& backend, LoadOptions options = {});

    // Resolve size, plan, allocate and download. Throws NotFound, BackendError,
    // AllocationError or ChunkExhausted; no partially written file is ever returned.
    [[nodiscard]] DownloadJob load(const ObjectRef& object);

private:
    StorageBackend& backend_;
    LoadOptions options_;
};

} // namespace memrun
