#pragma once

#include "chunk_plan.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace memrun {

// Process exit codes, one per fatal failure kind.
enum class ExitCode : int {
    Success = 0,
    Failure = 1,
    Usage = 2,
    NotFound = 3,
    BackendError = 4,
    AllocationError = 5,
    ChunkExhausted = 6,
    ExecFailure = 7,
};

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    [[nodiscard]] virtual const char* kind() const noexcept { return "error"; }
    [[nodiscard]] virtual ExitCode exitCode() const noexcept { return ExitCode::Failure; }
};

class UsageError final : public Error {
public:
    using Error::Error;

    [[nodiscard]] const char* kind() const noexcept override { return "usage error"; }
    [[nodiscard]] ExitCode exitCode() const noexcept override { return ExitCode::Usage; }
};

class NotFound final : public Error {
public:
    using Error::Error;

    [[nodiscard]] const char* kind() const noexcept override { return "not found"; }
    [[nodiscard]] ExitCode exitCode() const noexcept override { return ExitCode::NotFound; }
};

class BackendError final : public Error {
public:
    BackendError(std::string message, long http_status = 0)
        : Error(std::move(message)), http_status_(http_status) {}

    [[nodiscard]] long httpStatus() const noexcept { return http_status_; }
    [[nodiscard]] const char* kind() const noexcept override { return "backend error"; }
    [[nodiscard]] ExitCode exitCode() const noexcept override { return ExitCode::BackendError; }

private:
    long http_status_;
};

class AllocationError final : public Error {
public:
    using Error::Error;

    [[nodiscard]] const char* kind() const noexcept override { return "allocation error"; }
    [[nodiscard]] ExitCode exitCode() const noexcept override { return ExitCode::AllocationError; }
};

// Retryable failure of a single ranged fetch. Never escapes the chunk downloader.
class ChunkTransientError final : public Error {
public:
    using Error::Error;

    [[nodiscard]] const char* kind() const noexcept override { return "transient chunk error"; }
};

class ChunkExhausted final : public Error {
public:
    ChunkExhausted(ByteRange range, int attempts, const std::string& reason);

    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }
    [[nodiscard]] int attempts() const noexcept { return attempts_; }
    [[nodiscard]] const char* kind() const noexcept override { return "chunk exhausted"; }
    [[nodiscard]] ExitCode exitCode() const noexcept override { return ExitCode::ChunkExhausted; }

private:
    ByteRange range_;
    int attempts_;
};

class ExecFailure final : public Error {
public:
    using Error::Error;

    [[nodiscard]] const char* kind() const noexcept override { return "exec failure"; }
    [[nodiscard]] ExitCode exitCode() const noexcept override { return ExitCode::ExecFailure; }
};

} // namespace memrun
