#include "memrun/object_loader.hpp"
#include "memrun/format.hpp"
#include "memrun/size_resolver.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace memrun {

ObjectLoader::ObjectLoader(StorageBackend& backend, LoadOptions options)
    : backend_(backend), options_(std::move(options)) {}

DownloadJob ObjectLoader::load(const ObjectRef& object) {
    DownloadJob job;
    job.object = object;
    job.total_size = ObjectSizeResolver{backend_}.resolve(object);
    job.plan = planChunks(job.total_size, options_.policy);

    spdlog::info("Download parameters: size {} ({} bytes), chunk {}, concurrency {}, {} chunks",
                 formatSize(job.total_size), job.total_size, formatSize(job.plan.chunk_length),
                 job.plan.concurrency, job.plan.ranges.size());

    job.file = MemoryFile::allocate(options_.memfd_name, job.total_size);
    spdlog::debug("Created memory file {} of {} bytes", job.file.path(), job.file.size());

    ChunkDownloader downloader{backend_, object, options_.download};
    job.stats = downloader.run(job.plan, job.file);
    return job;
}

} // namespace memrun
