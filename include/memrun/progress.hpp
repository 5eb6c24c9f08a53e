#pragma once

#include <cstddef>
#include <cstdint>

namespace memrun {

struct Progress {
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    std::size_t total_chunks{0};
    std::size_t completed_chunks{0};
    std::size_t retries{0};
    bool is_running{false};
    bool has_error{false};
};

} // namespace memrun
