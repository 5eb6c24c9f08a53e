#pragma once

#include "chunk_plan.hpp"
#include "launcher.hpp"
#include "object_ref.hpp"
#include "s3_backend.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memrun {

/**
 * Runtime configuration, built once from the command line and the environment.
 * Flags win over environment variables.
 */
struct Config {
    ObjectRef object;
    S3Options s3;

    std::string placeholder{kDefaultPlaceholder};
    int max_attempts{3};
    std::chrono::milliseconds retry_delay{200};

    // Overrides for the size-banded chunk policy; either may be set alone.
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::size_t> concurrency;

    LaunchMode launch_mode{LaunchMode::Replace};
    std::string log_level{"info"};

    // Program followed by its arguments.
    std::vector<std::string> command;

    bool show_help{false};

    [[nodiscard]] ChunkPolicy chunkPolicy() const;
};

// Throws UsageError on malformed or missing options.
[[nodiscard]] Config parseCommandLine(int argc, const char* const* argv);

void printUsage(const char* program_name);

} // namespace memrun
