#include "memrun/s3_backend.hpp"
#include "memrun/detail/curl_utils.hpp"
#include "memrun/errors.hpp"

#include <cstdlib>
#include <exception>
#include <new>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace memrun {

namespace {

// SHA-256 of an empty payload; every request this backend sends is bodiless.
constexpr const char* kEmptyPayloadHash =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string envOr(const char* name, const std::string& fallback = {}) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string{value} : fallback;
}

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

// RFC 3986 encoding of an object key, keeping '/' separators as SigV4 expects for S3.
std::string encodeKey(const std::string& key) {
    std::string out;
    out.reserve(key.size() * 3);
    for (const unsigned char c : key) {
        if (isUnreserved(c) || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

bool isRetryableStatus(long code) { return code == 429 || code >= 500; }

} // namespace

S3Options s3OptionsFromEnvironment() {
    S3Options options;
    options.region = envOr("AWS_REGION", envOr("AWS_DEFAULT_REGION", options.region));
    options.endpoint = envOr("AWS_ENDPOINT_URL_S3", envOr("AWS_ENDPOINT_URL"));
    options.access_key_id = envOr("AWS_ACCESS_KEY_ID");
    options.secret_access_key = envOr("AWS_SECRET_ACCESS_KEY");
    options.session_token = envOr("AWS_SESSION_TOKEN");
    return options;
}

RangeResponse classifyRangeResponse(bool transfer_ok, long http_status, const ByteRange& range) {
    const bool client_error = http_status >= 400 && http_status < 500;
    if (isRetryableStatus(http_status)) {
        return RangeResponse::Transient;
    }
    if (client_error) {
        return RangeResponse::Permanent;
    }
    if (!transfer_ok) {
        return RangeResponse::Transient;
    }
    if (http_status == 206 || (http_status == 200 && range.start == 0)) {
        return RangeResponse::Complete;
    }
    return RangeResponse::Transient;
}

std::string buildObjectUrl(const S3Options& options, const ObjectRef& object) {
    if (options.endpoint.empty()) {
        return fmt::format("https://{}.s3.{}.amazonaws.com/{}", object.bucket, options.region,
                           encodeKey(object.key));
    }
    std::string endpoint = options.endpoint;
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    return fmt::format("{}/{}/{}", endpoint, object.bucket, encodeKey(object.key));
}

class S3Backend::Impl {
public:
    explicit Impl(S3Options options) : options_(std::move(options)) {
        if (!options_.access_key_id.empty() && !options_.secret_access_key.empty()) {
            sigv4_ = fmt::format("aws:amz:{}:s3", options_.region);
            userpwd_ = options_.access_key_id + ":" + options_.secret_access_key;
        } else {
            spdlog::warn("No AWS credentials in environment, sending unsigned S3 requests");
        }
    }

    std::uint64_t head(const ObjectRef& object) {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            throw BackendError("Failed to allocate curl handle");
        }

        const std::string url = buildObjectUrl(options_, object);
        auto headers = prepare(curl.get(), url);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw BackendError(fmt::format("HEAD {} failed: {}", url, curl_easy_strerror(res)));
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code == 404) {
            throw NotFound(fmt::format("s3://{}/{} does not exist", object.bucket, object.key));
        }
        if (code != 200) {
            throw BackendError(fmt::format("HEAD {} returned HTTP {}", url, code), code);
        }

        curl_off_t length = -1;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length < 0) {
            throw BackendError(fmt::format("HEAD {} returned no Content-Length", url), code);
        }
        return static_cast<std::uint64_t>(length);
    }

    void getRange(const ObjectRef& object, const ByteRange& range, const ByteSink& sink,
                  const std::atomic<bool>& cancel) {
        if (range.length() == 0) {
            return;
        }

        auto curl = detail::makeCurlHandle();
        if (!curl) {
            throw ChunkTransientError("Failed to allocate curl handle");
        }

        const std::string url = buildObjectUrl(options_, object);
        auto headers = prepare(curl.get(), url);

        TransferContext ctx{&sink, &cancel, {}};
        const std::string byte_range = fmt::format("{}-{}", range.start, range.end - 1);

        curl_easy_setopt(curl.get(), CURLOPT_RANGE, byte_range.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (res == CURLE_ABORTED_BY_CALLBACK && cancel.load()) {
            throw ChunkTransientError(fmt::format("range {} cancelled", byte_range));
        }
        switch (classifyRangeResponse(res == CURLE_OK, code, range)) {
        case RangeResponse::Complete:
            return;
        case RangeResponse::Permanent:
            throw BackendError(fmt::format("GET {} range {} returned HTTP {}", url, byte_range, code), code);
        case RangeResponse::Transient:
            break;
        }
        if (res != CURLE_OK) {
            throw ChunkTransientError(
                fmt::format("GET {} range {} failed: {} (HTTP {})", url, byte_range, curl_easy_strerror(res), code));
        }
        throw ChunkTransientError(fmt::format("GET {} range {} returned HTTP {}", url, byte_range, code));
    }

private:
    struct TransferContext {
        const ByteSink* sink;
        const std::atomic<bool>* cancel;
        std::exception_ptr error;
    };

    detail::CurlHeaders prepare(CURL* curl, const std::string& url) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit_bytes);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options_.low_speed_time_seconds);

        detail::CurlHeaders headers{nullptr, &curl_slist_free_all};
        if (!sigv4_.empty()) {
            curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, sigv4_.c_str());
            curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd_.c_str());
            appendHeader(headers, fmt::format("x-amz-content-sha256: {}", kEmptyPayloadHash));
            if (!options_.session_token.empty()) {
                appendHeader(headers, fmt::format("x-amz-security-token: {}", options_.session_token));
            }
        }
        if (headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        }
        return headers;
    }

    static void appendHeader(detail::CurlHeaders& headers, const std::string& line) {
        curl_slist* list = curl_slist_append(headers.get(), line.c_str());
        if (!list) {
            throw std::bad_alloc();
        }
        headers.release();
        headers.reset(list);
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nmemb;
        try {
            (*ctx->sink)(ptr, total);
        } catch (...) {
            // Rethrown from getRange once curl has unwound.
            ctx->error = std::current_exception();
            return 0;
        }
        return total;
    }

    static int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* ctx = static_cast<TransferContext*>(clientp);
        return ctx->cancel->load() ? 1 : 0;
    }

    S3Options options_;
    std::string sigv4_;
    std::string userpwd_;
};

S3Backend::S3Backend(S3Options options) : impl_(std::make_unique<Impl>(std::move(options))) {}

S3Backend::~S3Backend() = default;

std::uint64_t S3Backend::head(const ObjectRef& object) { return impl_->head(object); }

void S3Backend::getRange(const ObjectRef& object, const ByteRange& range, const ByteSink& sink,
                         const std::atomic<bool>& cancel) {
    impl_->getRange(object, range, sink, cancel);
}

} // namespace memrun
