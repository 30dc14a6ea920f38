#pragma once

#include "exception.hpp"
#include "localization.hpp"
#include "transport.hpp"

#include <curl/curl.h>

#include <array>
#include <memory>
#include <mutex>
#include <string>

struct TransportOptions {
    long connect_timeout_seconds = 30;
    // 0 disables the whole-transfer timeout.
    long timeout_seconds = 0;
    // A transfer slower than low_speed_limit_bytes per second for
    // stall_timeout_seconds is aborted as a timeout. 0 disables the check.
    long low_speed_limit_bytes = 1;
    long stall_timeout_seconds = 60;
    long max_redirects = 30;
    std::string user_agent = std::string("bulkdl/") + BULKDL_VERSION;
};

struct CurlShareDeleter {
    void operator()(CURLSH* share) const {
        if (share) {
            curl_share_cleanup(share);
        }
    }
};
using CurlShareHandle = std::unique_ptr<CURLSH, CurlShareDeleter>;

// libcurl transport. One easy handle per request; connection and DNS caches
// live in a share handle guarded by per-data mutexes.
// curl_global_init() must have been called before construction.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(TransportOptions options = {});

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    FetchAttempt get(const std::string& url) override;

    const TransportOptions& get_options() const { return options; }

private:
    static void lock_share(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlock_share(CURL* handle, curl_lock_data data, void* userptr);

    TransportOptions options;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks;
    CurlShareHandle share;
};

bool is_retryable_curl_error(CURLcode code);

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw BulkdlException(get_string("error.curl_global_init_failed"));
        }
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};
