#pragma once

#include <memory>

#include <curl/curl.h>

namespace memrun::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

} // namespace memrun::detail
