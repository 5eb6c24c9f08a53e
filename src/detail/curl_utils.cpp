#include "memrun/detail/curl_utils.hpp"
#include "memrun/errors.hpp"

#include <curl/curl.h>
#include <fmt/format.h>

namespace memrun::detail {

namespace {

// Owns libcurl's global state for the life of the process.
class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw BackendError(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc)));
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

void ensureCurlInitialized() {
    // A throwing constructor leaves the static uninitialized, so the next call tries again.
    static const CurlGlobal global;
    (void)global;
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

} // namespace memrun::detail
