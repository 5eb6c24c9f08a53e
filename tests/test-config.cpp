//  Tests command-line and environment configuration.

#include "testing.h"

#include "memrun/chunk_plan.hpp"
#include "memrun/config.hpp"
#include "memrun/errors.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using namespace memrun;

static void clear_environment() {
    for (const char* name : {"S3_BUCKET", "S3_KEY", "MEMFD_PLACEHOLDER", "MEMRUN_MAX_ATTEMPTS",
                             "MEMRUN_CHUNK_SIZE_MB", "MEMRUN_CONCURRENCY", "MEMRUN_SPAWN", "MEMRUN_LOG_LEVEL",
                             "AWS_REGION", "AWS_DEFAULT_REGION", "AWS_ENDPOINT_URL", "AWS_ENDPOINT_URL_S3"}) {
        unsetenv(name);
    }
}

static Config parse(std::vector<const char*> args) {
    args.insert(args.begin(), "memrun");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

static void test_flags() {
    printf("[%s]\n", __func__);
    clear_environment();

    const auto config = parse({"--bucket", "test-bucket", "--key", "test-key", "--log-level", "debug",
                               "program", "arg1", "arg2"});
    assert_equals(std::string{"test-bucket"}, config.object.bucket);
    assert_equals(std::string{"test-key"}, config.object.key);
    assert_equals(std::string{"debug"}, config.log_level);
    assert_equals(std::string{"{{memfd}}"}, config.placeholder);
    assert_equals(3, config.max_attempts);
    assert_true(config.launch_mode == LaunchMode::Replace, "exec replacement is the default");
    assert_true(config.command == std::vector<std::string>{"program", "arg1", "arg2"}, "command is kept in order");
    assert_true(!config.chunk_size && !config.concurrency, "no plan override by default");
}

static void test_command_options_are_not_parsed() {
    printf("[%s]\n", __func__);
    clear_environment();

    const auto config = parse({"--bucket", "b", "--key", "k", "--memfd-placeholder", "{{custom}}", "--spawn",
                               "--", "bin/llama-server", "-m", "{{custom}}", "--help"});
    assert_equals(std::string{"{{custom}}"}, config.placeholder);
    assert_true(config.launch_mode == LaunchMode::Spawn, "--spawn selects the fallback");
    assert_true(!config.show_help, "--help after the program belongs to the program");
    assert_true(config.command ==
                    std::vector<std::string>{"bin/llama-server", "-m", "{{custom}}", "--help"},
                "everything after -- is the command");
}

static void test_environment_fallback() {
    printf("[%s]\n", __func__);
    clear_environment();
    setenv("S3_BUCKET", "env-bucket", 1);
    setenv("S3_KEY", "env-key", 1);
    setenv("MEMRUN_MAX_ATTEMPTS", "5", 1);
    setenv("MEMRUN_CONCURRENCY", "2", 1);
    setenv("AWS_REGION", "eu-west-1", 1);

    auto config = parse({"program"});
    assert_equals(std::string{"env-bucket"}, config.object.bucket);
    assert_equals(std::string{"env-key"}, config.object.key);
    assert_equals(5, config.max_attempts);
    assert_equals(std::string{"eu-west-1"}, config.s3.region);

    config = parse({"--bucket", "flag-bucket", "--max-attempts", "2", "--region", "us-west-2", "program"});
    assert_equals(std::string{"flag-bucket"}, config.object.bucket);
    assert_equals(2, config.max_attempts);
    assert_equals(std::string{"us-west-2"}, config.s3.region);
    clear_environment();
}

static void test_chunk_policy_override() {
    printf("[%s]\n", __func__);
    clear_environment();

    const auto both = parse({"--bucket", "b", "--key", "k", "--chunk-size", "8", "--concurrency", "3", "p"});
    const auto fixed = planChunks(100 * kMiB, both.chunkPolicy());
    assert_equals(8 * kMiB, fixed.chunk_length);
    assert_equals(std::size_t{3}, fixed.concurrency);

    const auto only_concurrency = parse({"--bucket", "b", "--key", "k", "--concurrency", "2", "p"});
    const auto plan = planChunks(3 * kGiB, only_concurrency.chunkPolicy());
    assert_equals(128 * kMiB, plan.chunk_length);
    assert_equals(std::size_t{2}, plan.concurrency);

    const auto defaults = parse({"--bucket", "b", "--key", "k", "p"});
    assert_true(planChunks(3 * kGiB, defaults.chunkPolicy()) == planChunks(3 * kGiB), "defaults are the band table");
}

static void test_usage_errors() {
    printf("[%s]\n", __func__);
    clear_environment();

    assert_throws<UsageError>([] { (void)parse({"--key", "k", "p"}); }, "missing bucket");
    assert_throws<UsageError>([] { (void)parse({"--bucket", "b", "p"}); }, "missing key");
    assert_throws<UsageError>([] { (void)parse({"--bucket", "b", "--key", "k"}); }, "missing program");
    assert_throws<UsageError>([] { (void)parse({"--bucket", "b", "--key", "k", "--bogus", "p"}); }, "unknown option");
    assert_throws<UsageError>([] { (void)parse({"--bucket", "b", "--key", "k", "--max-attempts", "0", "p"}); },
                              "attempts below range");
    assert_throws<UsageError>([] { (void)parse({"--bucket", "b", "--key", "k", "--concurrency", "x", "p"}); },
                              "non-numeric concurrency");
    assert_throws<UsageError>([] { (void)parse({"--bucket", "b", "--key", "k", "--chunk-size", "-4", "p"}); },
                              "negative chunk size");
    assert_throws<UsageError>([] { (void)parse({"--bucket", "b", "--key", "k", "--log-level", "loud", "p"}); },
                              "unknown log level");
    assert_throws<UsageError>([] { (void)parse({"--bucket"}); }, "option without value");

    const auto ex = assert_throws<UsageError>([] { (void)parse({"--key", "k", "p"}); }, "exit code");
    assert_equals(static_cast<int>(ExitCode::Usage), static_cast<int>(ex.exitCode()));

    assert_true(parse({"--help"}).show_help, "help needs no other options");
}

int main() {
    test_flags();
    test_command_options_are_not_parsed();
    test_environment_fallback();
    test_chunk_policy_override();
    test_usage_errors();
    printf("All tests passed.\n");
    return 0;
}
