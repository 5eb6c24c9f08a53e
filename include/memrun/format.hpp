#pragma once

#include <cstdint>
#include <string>

namespace memrun {

// Human-readable byte count in binary units, e.g. "1.5 GiB".
[[nodiscard]] std::string formatSize(std::uint64_t bytes);

} // namespace memrun
