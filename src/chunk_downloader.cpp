#include "memrun/chunk_downloader.hpp"
#include "memrun/chunk_task.hpp"
#include "memrun/errors.hpp"
#include "memrun/format.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace memrun {

class ChunkDownloader::Impl {
public:
    Impl(StorageBackend& backend, ObjectRef object, DownloadOptions options)
        : backend_(backend),
          object_(std::move(object)),
          options_(options) {
        if (options_.max_attempts < 1) {
            throw std::invalid_argument("max_attempts must be at least 1");
        }
    }

    ~Impl() { joinWorkers(); }

    DownloadStats run(const ChunkPlan& plan, const MemoryFile& file) {
        if (plan.total_size != file.size()) {
            throw std::invalid_argument(fmt::format("plan covers {} bytes but memory file holds {}",
                                                    plan.total_size, file.size()));
        }
        for (const auto& range : plan.ranges) {
            if (range.start >= range.end || range.end > plan.total_size) {
                throw std::invalid_argument(fmt::format("range [{}, {}) outside object of {} bytes",
                                                        range.start, range.end, plan.total_size));
            }
        }

        const auto started = std::chrono::steady_clock::now();
        resetState(plan);

        DownloadStats stats;
        stats.total_bytes = plan.total_size;
        stats.chunks = tasks_.size();
        if (tasks_.empty()) {
            spdlog::debug("Nothing to download for a zero-length object");
            return stats;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            is_running_ = true;
        }

        stats.workers = std::min(plan.concurrency, tasks_.size());
        spdlog::info("Starting parallel download: {} chunks, {} workers", tasks_.size(), stats.workers);

        workers_.reserve(stats.workers);
        try {
            for (std::size_t i = 0; i < stats.workers; ++i) {
                workers_.emplace_back([this, &file]() { workerLoop(file); });
            }
        } catch (const std::system_error&) {
            cancel();
            joinWorkers();
            throw;
        }
        joinWorkers();

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            is_running_ = false;
            stats.retries = retries_;
        }
        stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (failure_) {
            std::rethrow_exception(failure_);
        }

        const double seconds = std::max(0.001, static_cast<double>(stats.elapsed.count()) / 1000.0);
        spdlog::info("Download completed: {} in {:.1f}s ({}/s, {} retries)", formatSize(stats.total_bytes),
                     seconds, formatSize(static_cast<std::uint64_t>(stats.total_bytes / seconds)), stats.retries);
        return stats;
    }

    [[nodiscard]] Progress getProgress() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return {
            total_bytes_,
            downloaded_bytes_.load(),
            tasks_.size(),
            completed_chunks_,
            retries_,
            is_running_,
            static_cast<bool>(failure_)
        };
    }

private:
    void resetState(const ChunkPlan& plan) {
        joinWorkers();

        std::lock_guard<std::mutex> lock(state_mutex_);
        tasks_.clear();
        tasks_.reserve(plan.ranges.size());
        pending_.clear();
        for (const auto& range : plan.ranges) {
            pending_.push_back(tasks_.size());
            tasks_.push_back(ChunkTask{range});
        }
        outstanding_ = tasks_.size();
        completed_chunks_ = 0;
        retries_ = 0;
        total_bytes_ = plan.total_size;
        downloaded_bytes_ = 0;
        failure_ = nullptr;
        cancelled_ = false;
        is_running_ = false;
    }

    void workerLoop(const MemoryFile& file) {
        while (true) {
            std::size_t index = 0;
            {
                std::unique_lock<std::mutex> lock(state_mutex_);
                queue_cv_.wait(lock, [this] { return cancelled_ || outstanding_ == 0 || !pending_.empty(); });
                if (cancelled_ || outstanding_ == 0) {
                    return;
                }
                index = pending_.front();
                pending_.pop_front();
                tasks_[index].status = ChunkStatus::InFlight;
                ++tasks_[index].attempts;
            }
            fetchChunk(index, file);
        }
    }

    void fetchChunk(std::size_t index, const MemoryFile& file) {
        ChunkTask& task = tasks_[index];
        MemoryRegion region = file.region(task.range);

        spdlog::debug("Fetching range [{}, {}) attempt {}/{}", task.range.start, task.range.end,
                      task.attempts, options_.max_attempts);

        try {
            backend_.getRange(
                object_, task.range,
                [this, &region](const char* data, std::size_t size) {
                    region.write(data, size);
                    downloaded_bytes_ += size;
                },
                cancelled_);
            if (!region.complete()) {
                throw ChunkTransientError(fmt::format("short response: {} of {} bytes",
                                                      region.written(), task.range.length()));
            }
        } catch (const ChunkTransientError& ex) {
            downloaded_bytes_ -= region.written();
            if (!cancelled_) {
                retryOrFail(index, ex.what());
            }
            return;
        } catch (const AllocationError& ex) {
            // Out of memory is not a chunk problem; report it as is.
            downloaded_bytes_ -= region.written();
            fail(index, ex.what(), std::current_exception());
            return;
        } catch (const std::exception& ex) {
            downloaded_bytes_ -= region.written();
            fail(index, ex.what());
            return;
        }

        complete(index);
    }

    void complete(std::size_t index) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        tasks_[index].status = ChunkStatus::Completed;
        ++completed_chunks_;
        --outstanding_;

        if (completed_chunks_ % 10 == 0 || outstanding_ == 0) {
            const auto downloaded = downloaded_bytes_.load();
            const auto percent = total_bytes_ == 0 ? 100 : static_cast<int>(downloaded * 100 / total_bytes_);
            spdlog::info("Download progress: {}/{} chunks, {} of {} ({}%)", completed_chunks_, tasks_.size(),
                         formatSize(downloaded), formatSize(total_bytes_), percent);
        }
        if (outstanding_ == 0) {
            queue_cv_.notify_all();
        }
    }

    void retryOrFail(std::size_t index, const std::string& reason) {
        ChunkTask& task = tasks_[index];
        task.last_error = reason;
        if (task.attempts >= options_.max_attempts) {
            fail(index, reason);
            return;
        }

        spdlog::warn("Range [{}, {}) failed (attempt {}/{}): {}", task.range.start, task.range.end,
                     task.attempts, options_.max_attempts, reason);

        const auto delay = options_.retry_delay * (1 << std::min(task.attempts - 1, 10));
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (queue_cv_.wait_for(lock, delay, [this] { return cancelled_.load(); })) {
            return;
        }
        task.status = ChunkStatus::Pending;
        ++retries_;
        pending_.push_back(index);
        queue_cv_.notify_one();
    }

    void fail(std::size_t index, const std::string& reason, std::exception_ptr error = nullptr) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ChunkTask& task = tasks_[index];
        task.status = ChunkStatus::Failed;
        task.last_error = reason;
        if (!failure_) {
            spdlog::error("Range [{}, {}) failed permanently after {} attempt(s): {}", task.range.start,
                          task.range.end, task.attempts, reason);
            failure_ = error ? error : std::make_exception_ptr(ChunkExhausted(task.range, task.attempts, reason));
        }
        cancelled_ = true;
        queue_cv_.notify_all();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cancelled_ = true;
        queue_cv_.notify_all();
    }

    void joinWorkers() {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    StorageBackend& backend_;
    ObjectRef object_;
    DownloadOptions options_;

    std::vector<ChunkTask> tasks_;
    std::vector<std::thread> workers_;

    mutable std::mutex state_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::size_t> pending_;
    std::size_t outstanding_{0};
    std::size_t completed_chunks_{0};
    std::size_t retries_{0};
    std::uint64_t total_bytes_{0};
    std::atomic<std::uint64_t> downloaded_bytes_{0};
    std::atomic<bool> cancelled_{false};
    std::exception_ptr failure_;
    bool is_running_{false};
};

ChunkDownloader::ChunkDownloader(StorageBackend& backend, ObjectRef object, DownloadOptions options)
    : impl_(std::make_unique<Impl>(backend, std::move(object), options)) {}

ChunkDownloader::~ChunkDownloader() = default;

DownloadStats ChunkDownloader::run(const ChunkPlan& plan, const MemoryFile& file) {
    return impl_->run(plan, file);
}

Progress ChunkDownloader::getProgress() const { return impl_->getProgress(); }

} // namespace memrun
