#include "memrun/config.hpp"
#include "memrun/detail/curl_utils.hpp"
#include "memrun/errors.hpp"
#include "memrun/launcher.hpp"
#include "memrun/object_loader.hpp"
#include "memrun/s3_backend.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// stdout belongs to the launched program, so logs go to stderr.
void setupLogging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("memrun");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(std::move(logger));
}

int fail(const memrun::Error& ex) {
    spdlog::error("{}: {}", ex.kind(), ex.what());
    spdlog::default_logger()->flush();
    fmt::print(stderr, "memrun: {}: {}\n", ex.kind(), ex.what());
    return static_cast<int>(ex.exitCode());
}

} // namespace

int main(int argc, char** argv) {
    memrun::Config config;
    try {
        config = memrun::parseCommandLine(argc, argv);
    } catch (const memrun::UsageError& ex) {
        fmt::print(stderr, "memrun: {}\n", ex.what());
        memrun::printUsage(argv[0]);
        return static_cast<int>(ex.exitCode());
    }
    if (config.show_help) {
        memrun::printUsage(argv[0]);
        return 0;
    }

    try {
        setupLogging(config.log_level);
        memrun::detail::ensureCurlInitialized();

        const std::string& program = config.command.front();
        const std::vector<std::string> program_args(config.command.begin() + 1, config.command.end());

        spdlog::info("Configuration loaded: bucket={} key={} program={} args=[{}] placeholder={}",
                     config.object.bucket, config.object.key, program, fmt::join(program_args, ", "),
                     config.placeholder);

        // Fail before downloading gigabytes for a program that cannot run.
        memrun::Launcher::preflight(program);

        memrun::S3Backend backend{config.s3};

        memrun::LoadOptions options;
        options.policy = config.chunkPolicy();
        options.download.max_attempts = config.max_attempts;
        options.download.retry_delay = config.retry_delay;

        memrun::ObjectLoader loader{backend, std::move(options)};
        memrun::DownloadJob job = loader.load(config.object);

        memrun::LaunchSpec spec{program, program_args, config.placeholder};
        memrun::Launcher launcher{config.launch_mode};
        return launcher.launch(spec, job.file.path());
    } catch (const memrun::Error& ex) {
        return fail(ex);
    } catch (const std::exception& ex) {
        spdlog::error("Fatal error: {}", ex.what());
        fmt::print(stderr, "memrun: fatal error: {}\n", ex.what());
        return static_cast<int>(memrun::ExitCode::Failure);
    }
}
