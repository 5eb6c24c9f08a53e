#include "memrun/errors.hpp"

#include <fmt/format.h>

namespace memrun {

ChunkExhausted::ChunkExhausted(ByteRange range, int attempts, const std::string& reason)
    : Error(fmt::format("range [{}, {}) failed after {} attempt{}: {}",
                        range.start, range.end, attempts, attempts == 1 ? "" : "s", reason)),
      range_(range),
      attempts_(attempts) {}

} // namespace memrun
