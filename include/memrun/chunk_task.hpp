#pragma once

#include "chunk_plan.hpp"

#include <string>

namespace memrun {

enum class ChunkStatus {
    Pending,
    InFlight,
    Completed,
    Failed,
};

// Mutated only by the worker currently holding it.
struct ChunkTask {
    ByteRange range;
    int attempts{0};
    ChunkStatus status{ChunkStatus::Pending};
    std::string last_error;
};

} // namespace memrun
