#include "memrun/config.hpp"
#include "memrun/errors.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace memrun {

namespace {

constexpr std::array<const char*, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template <typename T>
T parseNumber(const std::string& option, const std::string& text, T min_value, T max_value) {
    unsigned long long value = 0;
    std::size_t consumed = 0;
    try {
        if (!text.empty() && text.front() == '-') {
            throw std::invalid_argument("negative");
        }
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw UsageError(fmt::format("Invalid value for {}: '{}'", option, text));
    }
    if (consumed != text.size() || value < static_cast<unsigned long long>(min_value) ||
        value > static_cast<unsigned long long>(max_value)) {
        throw UsageError(fmt::format("Invalid value for {}: '{}' (expected {}..{})", option, text, min_value,
                                     max_value));
    }
    return static_cast<T>(value);
}

bool parseFlag(const std::string& text) {
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

void checkLogLevel(const std::string& level) {
    if (std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
        throw UsageError(fmt::format("Unknown log level '{}'", level));
    }
}

constexpr int kMaxAttempts = 100;
constexpr std::size_t kMaxConcurrency = 256;
constexpr std::uint64_t kMaxChunkSizeMiB = 4096;

} // namespace

ChunkPolicy Config::chunkPolicy() const {
    if (chunk_size && concurrency) {
        return ChunkPolicy::fixed(*chunk_size, *concurrency);
    }
    auto bands = ChunkPolicy::defaults().bands();
    for (auto& band : bands) {
        if (chunk_size) {
            band.chunk_length = *chunk_size;
        }
        if (concurrency) {
            band.concurrency = *concurrency;
        }
    }
    return ChunkPolicy(std::move(bands));
}

Config parseCommandLine(int argc, const char* const* argv) {
    Config config;
    config.s3 = s3OptionsFromEnvironment();

    if (const char* v = envValue("S3_BUCKET")) {
        config.object.bucket = v;
    }
    if (const char* v = envValue("S3_KEY")) {
        config.object.key = v;
    }
    if (const char* v = envValue("MEMFD_PLACEHOLDER")) {
        config.placeholder = v;
    }
    if (const char* v = envValue("MEMRUN_MAX_ATTEMPTS")) {
        config.max_attempts = parseNumber<int>("MEMRUN_MAX_ATTEMPTS", v, 1, kMaxAttempts);
    }
    if (const char* v = envValue("MEMRUN_CHUNK_SIZE_MB")) {
        config.chunk_size = parseNumber<std::uint64_t>("MEMRUN_CHUNK_SIZE_MB", v, 1, kMaxChunkSizeMiB) * kMiB;
    }
    if (const char* v = envValue("MEMRUN_CONCURRENCY")) {
        config.concurrency = parseNumber<std::size_t>("MEMRUN_CONCURRENCY", v, 1, kMaxConcurrency);
    }
    if (const char* v = envValue("MEMRUN_SPAWN")) {
        config.launch_mode = parseFlag(v) ? LaunchMode::Spawn : LaunchMode::Replace;
    }
    if (const char* v = envValue("MEMRUN_LOG_LEVEL")) {
        config.log_level = v;
    }

    int arg_index = 1;
    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];
        auto value = [&]() -> std::string {
            if (arg_index + 1 >= argc) {
                throw UsageError(fmt::format("Option {} needs a value", option));
            }
            arg_index += 2;
            return argv[arg_index - 1];
        };

        if (option == "--") {
            ++arg_index;
            break;
        } else if (option == "-h" || option == "--help") {
            config.show_help = true;
            return config;
        } else if (option == "--bucket") {
            config.object.bucket = value();
        } else if (option == "--key") {
            config.object.key = value();
        } else if (option == "--memfd-placeholder") {
            config.placeholder = value();
        } else if (option == "--max-attempts") {
            config.max_attempts = parseNumber<int>(option, value(), 1, kMaxAttempts);
        } else if (option == "--chunk-size") {
            config.chunk_size = parseNumber<std::uint64_t>(option, value(), 1, kMaxChunkSizeMiB) * kMiB;
        } else if (option == "--concurrency") {
            config.concurrency = parseNumber<std::size_t>(option, value(), 1, kMaxConcurrency);
        } else if (option == "--spawn") {
            config.launch_mode = LaunchMode::Spawn;
            ++arg_index;
        } else if (option == "--log-level") {
            config.log_level = value();
        } else if (option == "--region") {
            config.s3.region = value();
        } else if (option == "--endpoint") {
            config.s3.endpoint = value();
        } else {
            throw UsageError(fmt::format("Unknown option '{}'", option));
        }
    }

    for (; arg_index < argc; ++arg_index) {
        config.command.emplace_back(argv[arg_index]);
    }

    checkLogLevel(config.log_level);
    if (config.object.bucket.empty()) {
        throw UsageError("S3_BUCKET environment variable not set and --bucket not provided");
    }
    if (config.object.key.empty()) {
        throw UsageError("S3_KEY environment variable not set and --key not provided");
    }
    if (config.command.empty()) {
        throw UsageError("No program to execute");
    }
    return config;
}

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] [--] <program> [args...]\n"
              << "Downloads an S3 object into an anonymous memory file, then runs <program>\n"
              << "with every occurrence of the placeholder replaced by the file's path.\n\n"
              << "Options:\n"
              << "  --bucket <name>              S3 bucket (env S3_BUCKET)\n"
              << "  --key <key>                  S3 object key (env S3_KEY)\n"
              << "  --memfd-placeholder <token>  Placeholder token (env MEMFD_PLACEHOLDER, default {{memfd}})\n"
              << "  --max-attempts <n>           Attempts per chunk (env MEMRUN_MAX_ATTEMPTS, default 3)\n"
              << "  --chunk-size <MiB>           Fixed chunk size (env MEMRUN_CHUNK_SIZE_MB)\n"
              << "  --concurrency <n>            Fixed worker count (env MEMRUN_CONCURRENCY)\n"
              << "  --spawn                      Run as a child and wait instead of exec (env MEMRUN_SPAWN=1)\n"
              << "  --log-level <level>          trace, debug, info, warn, error, critical, off\n"
              << "                               (env MEMRUN_LOG_LEVEL, default info)\n"
              << "  --region <region>            AWS region (env AWS_REGION, default us-east-1)\n"
              << "  --endpoint <url>             Custom S3 endpoint, path-style (env AWS_ENDPOINT_URL)\n"
              << "  -h, --help                   Show this message" << std::endl;
}

} // namespace memrun
