#pragma once

#include "storage_backend.hpp"

#include <memory>
#include <string>

namespace memrun {

struct S3Options {
    std::string region{"us-east-1"};
    // Custom endpoint (MinIO, LocalStack, ...). Switches to path-style addressing.
    std::string endpoint;
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    long connect_timeout_seconds{10};
    long low_speed_limit_bytes{1024};
    long low_speed_time_seconds{30};
};

// Fills region, endpoint and credentials from the standard AWS_* variables.
[[nodiscard]] S3Options s3OptionsFromEnvironment();

[[nodiscard]] std::string buildObjectUrl(const S3Options& options, const ObjectRef& object);

enum class RangeResponse {
    Complete,   // body holds the requested bytes
    Transient,  // retry the chunk
    Permanent,  // retrying cannot help
};

// Classifies a ranged GET by whether the transfer itself succeeded and the HTTP status.
// 429 and 5xx are transient, other 4xx permanent. A 200 is accepted only for a range
// starting at 0, where a server that ignores Range still sends the right leading bytes.
[[nodiscard]] RangeResponse classifyRangeResponse(bool transfer_ok, long http_status, const ByteRange& range);

class S3Backend final : public StorageBackend {
public:
    explicit S3Backend(S3Options options);
    ~S3Backend() override;

    [[nodiscard]] std::uint64_t head(const ObjectRef& object) override;
    void getRange(const ObjectRef& object, const ByteRange& range, const ByteSink& sink,
                  const std::atomic<bool>& cancel) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace memrun
