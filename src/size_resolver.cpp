#include "memrun/size_resolver.hpp"
#include "memrun/format.hpp"

#include <spdlog/spdlog.h>

namespace memrun {

std::uint64_t ObjectSizeResolver::resolve(const ObjectRef& object) const {
    spdlog::info("Getting object metadata for s3://{}/{}", object.bucket, object.key);
    const std::uint64_t size = backend_.head(object);
    spdlog::debug("s3://{}/{} is {} bytes ({})", object.bucket, object.key, size, formatSize(size));
    return size;
}

} // namespace memrun
