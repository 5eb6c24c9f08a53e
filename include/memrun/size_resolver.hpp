#pragma once

#include "object_ref.hpp"
#include "storage_backend.hpp"

#include <cstdint>

namespace memrun {

class ObjectSizeResolver {
public:
    explicit ObjectSizeResolver(StorageBackend& backend) : backend_(backend) {}

    // Throws NotFound or BackendError. Zero is a valid size.
    [[nodiscard]] std::uint64_t resolve(const ObjectRef& object) const;

private:
    StorageBackend& backend_;
};

} // namespace memrun
