//  Tests the concurrent chunk downloader against an in-memory backend with injected faults.

#include "testing.h"
#include "fake-backend.h"

#include "memrun/chunk_downloader.hpp"
#include "memrun/chunk_plan.hpp"
#include "memrun/errors.hpp"
#include "memrun/memory_file.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

using namespace memrun;
using namespace std::chrono_literals;

static const ObjectRef kObject{"bucket", "models/weights.gguf"};

static DownloadOptions fast_options(int max_attempts = 3) {
    DownloadOptions options;
    options.max_attempts = max_attempts;
    options.retry_delay = 0ms;
    return options;
}

static void test_round_trip_out_of_order() {
    printf("[%s]\n", __func__);

    const auto content = FakeBackend::makeContent(2 * kMiB + 777);
    FakeBackend backend{content};
    backend.setReverseDelays(2ms);

    const auto plan = planChunks(content.size(), ChunkPolicy::fixed(128 * 1024, 6));
    auto file = MemoryFile::allocate("test-round-trip", plan.total_size);

    ChunkDownloader downloader{backend, kObject, fast_options()};
    const auto stats = downloader.run(plan, file);

    assert_equals(plan.ranges.size(), stats.chunks);
    assert_equals(std::size_t{6}, stats.workers);
    assert_equals(std::size_t{0}, stats.retries);
    assert_true(read_file(file.path()) == content, "memory file equals the source object");
    assert_true(backend.maxInFlight() <= 6, "in-flight requests never exceed the concurrency bound");

    const auto progress = downloader.getProgress();
    assert_equals(static_cast<std::uint64_t>(content.size()), progress.downloaded_bytes);
    assert_equals(plan.ranges.size(), progress.completed_chunks);
    assert_true(!progress.is_running && !progress.has_error, "finished without error");
}

static void test_zero_length_dispatches_nothing() {
    printf("[%s]\n", __func__);

    FakeBackend backend{""};
    const auto plan = planChunks(0);
    auto file = MemoryFile::allocate("test-zero", 0);

    ChunkDownloader downloader{backend, kObject, fast_options()};
    const auto stats = downloader.run(plan, file);

    assert_equals(std::size_t{0}, stats.chunks);
    assert_equals(std::size_t{0}, stats.workers);
    assert_equals(0, backend.totalCalls());
}

static void test_retry_below_ceiling_succeeds() {
    printf("[%s]\n", __func__);

    const auto content = FakeBackend::makeContent(1000);
    FakeBackend backend{content};
    backend.failRange(300, 2);  // ceiling - 1 failures

    const auto plan = planChunks(content.size(), ChunkPolicy::fixed(100, 3));
    auto file = MemoryFile::allocate("test-retry", plan.total_size);

    ChunkDownloader downloader{backend, kObject, fast_options(3)};
    const auto stats = downloader.run(plan, file);

    assert_equals(std::size_t{2}, stats.retries);
    assert_equals(3, backend.calls(300));
    assert_true(read_file(file.path()) == content, "retried chunk is written correctly");
}

static void test_ceiling_exhausted_aborts() {
    printf("[%s]\n", __func__);

    const auto content = FakeBackend::makeContent(1000);
    FakeBackend backend{content};
    backend.failRange(500, 3);  // ceiling failures

    const auto plan = planChunks(content.size(), ChunkPolicy::fixed(100, 2));
    auto file = MemoryFile::allocate("test-exhausted", plan.total_size);

    ChunkDownloader downloader{backend, kObject, fast_options(3)};
    const auto ex = assert_throws<ChunkExhausted>([&] { (void)downloader.run(plan, file); }, "chunk exhausted");

    assert_true(ex.range() == ByteRange{500, 600}, "error names the failing range");
    assert_equals(3, ex.attempts());
    assert_equals(3, backend.calls(500));
    assert_true(std::string{ex.what()}.find("[500, 600)") != std::string::npos, "message names the range");
    assert_true(downloader.getProgress().has_error, "progress reports the failure");
}

static void test_malformed_bodies_are_retried() {
    printf("[%s]\n", __func__);

    const auto content = FakeBackend::makeContent(4096);
    FakeBackend backend{content};
    backend.failRange(0, 1, FakeBackend::Fault::ShortBody);
    backend.failRange(1024, 1, FakeBackend::Fault::LongBody);

    const auto plan = planChunks(content.size(), ChunkPolicy::fixed(1024, 4));
    auto file = MemoryFile::allocate("test-malformed", plan.total_size);

    ChunkDownloader downloader{backend, kObject, fast_options(2)};
    const auto stats = downloader.run(plan, file);

    assert_equals(std::size_t{2}, stats.retries);
    assert_equals(2, backend.calls(0));
    assert_equals(2, backend.calls(1024));
    assert_true(read_file(file.path()) == content, "partial responses are never accepted");
}

static void test_permanent_error_fails_immediately() {
    printf("[%s]\n", __func__);

    const auto content = FakeBackend::makeContent(1000);
    FakeBackend backend{content};
    backend.failRange(0, 1, FakeBackend::Fault::Permanent);

    const auto plan = planChunks(content.size(), ChunkPolicy::fixed(100, 1));
    auto file = MemoryFile::allocate("test-permanent", plan.total_size);

    ChunkDownloader downloader{backend, kObject, fast_options(3)};
    const auto ex = assert_throws<ChunkExhausted>([&] { (void)downloader.run(plan, file); }, "permanent error");

    assert_equals(1, ex.attempts());
    assert_equals(1, backend.calls(0));
    // A single worker stops after the first failure, so nothing else is fetched.
    assert_equals(1, backend.totalCalls());
}

static void test_first_failure_cancels_other_workers() {
    printf("[%s]\n", __func__);

    const auto content = FakeBackend::makeContent(40 * 1024);
    FakeBackend backend{content};
    // Range 0 fails permanently once the other workers are stalled mid-fetch.
    backend.failRange(0, 1, FakeBackend::Fault::Permanent);
    backend.delayRange(0, 200ms);
    backend.setBlockingRange(1024);
    backend.setBlockingRange(2048);
    backend.setBlockingRange(3072);

    const auto plan = planChunks(content.size(), ChunkPolicy::fixed(1024, 4));
    assert_equals(std::size_t{40}, plan.ranges.size());
    auto file = MemoryFile::allocate("test-cancel", plan.total_size);

    ChunkDownloader downloader{backend, kObject, fast_options(3)};
    const auto started = std::chrono::steady_clock::now();
    const auto ex = assert_throws<ChunkExhausted>([&] { (void)downloader.run(plan, file); }, "first failure");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert_true(ex.range() == ByteRange{0, 1024}, "error names the first failing range");
    assert_true(backend.maxInFlight() <= 4, "in-flight requests never exceed the concurrency bound");
    // At most the initial fetches ever start; no worker picks up another of the 40 chunks.
    assert_true(backend.totalCalls() <= 4, "no chunk is dispatched after the failure");
    assert_true(backend.cancelledFetches() >= 1, "a stalled fetch observed the cancel flag");
    assert_equals(backend.totalCalls() - 1, backend.cancelledFetches());
    assert_true(elapsed < 5s, "stalled fetches return as soon as they see the cancel flag");
}

static void test_allocation_failure_is_not_retried() {
    printf("[%s]\n", __func__);

    const auto content = FakeBackend::makeContent(1000);
    FakeBackend backend{content};
    backend.failRange(200, 1, FakeBackend::Fault::OutOfMemory);

    const auto plan = planChunks(content.size(), ChunkPolicy::fixed(100, 1));
    auto file = MemoryFile::allocate("test-oom", plan.total_size);

    ChunkDownloader downloader{backend, kObject, fast_options(3)};
    const auto ex = assert_throws<AllocationError>([&] { (void)downloader.run(plan, file); }, "out of memory");

    assert_true(ex.exitCode() == ExitCode::AllocationError, "reported as an allocation failure");
    assert_equals(1, backend.calls(200));
    assert_equals(3, backend.totalCalls());
}

static void test_invalid_arguments() {
    printf("[%s]\n", __func__);

    FakeBackend backend{"abc"};
    assert_throws<std::invalid_argument>([&] { ChunkDownloader{backend, kObject, fast_options(0)}; },
                                         "zero attempts");

    const auto plan = planChunks(3);
    auto file = MemoryFile::allocate("test-mismatch", 4);
    ChunkDownloader downloader{backend, kObject, fast_options()};
    assert_throws<std::invalid_argument>([&] { (void)downloader.run(plan, file); }, "plan and file sizes differ");
}

int main() {
    test_round_trip_out_of_order();
    test_zero_length_dispatches_nothing();
    test_retry_below_ceiling_succeeds();
    test_ceiling_exhausted_aborts();
    test_malformed_bodies_are_retried();
    test_permanent_error_fails_immediately();
    test_first_failure_cancels_other_workers();
    test_allocation_failure_is_not_retried();
    test_invalid_arguments();
    printf("All tests passed.\n");
    return 0;
}
