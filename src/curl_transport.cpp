#include "curl_transport.hpp"
#include "localization.hpp"

#include <new>
#include <utility>

namespace {
    size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
        std::string* out = static_cast<std::string*>(userdata);
        size_t bytes = size * nmemb;
        try {
            out->append(static_cast<const char*>(ptr), bytes);
        } catch (const std::bad_alloc&) {
            return 0;
        }
        return bytes;
    }

    // Custom deleter for the CURL handle
    struct CurlDeleter {
        void operator()(CURL* curl) const {
            if (curl) {
                curl_easy_cleanup(curl);
            }
        }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
}

bool is_retryable_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

CurlTransport::CurlTransport(TransportOptions opts)
    : options(std::move(opts)), share(curl_share_init()) {
    if (!share) {
        throw BulkdlException(get_string("error.curl_share_init_failed"));
    }
    curl_share_setopt(share.get(), CURLSHOPT_LOCKFUNC, &CurlTransport::lock_share);
    curl_share_setopt(share.get(), CURLSHOPT_UNLOCKFUNC, &CurlTransport::unlock_share);
    curl_share_setopt(share.get(), CURLSHOPT_USERDATA, this);
    curl_share_setopt(share.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
}

void CurlTransport::lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* self = static_cast<CurlTransport*>(userptr);
    self->share_locks[static_cast<size_t>(data) % self->share_locks.size()].lock();
}

void CurlTransport::unlock_share(CURL*, curl_lock_data data, void* userptr) {
    auto* self = static_cast<CurlTransport*>(userptr);
    self->share_locks[static_cast<size_t>(data) % self->share_locks.size()].unlock();
}

FetchAttempt CurlTransport::get(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return FetchAttempt::transport_error(get_string("error.curl_easy_init_failed"), false);
    }

    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SHARE, share.get());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_seconds);
    if (options.stall_timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit_bytes);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options.stall_timeout_seconds);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string message = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(res));
        return FetchAttempt::transport_error(message, is_retryable_curl_error(res));
    }

    long code = 0;
    res = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (res != CURLE_OK) {
        return FetchAttempt::transport_error(curl_easy_strerror(res), false);
    }
    return FetchAttempt::response(static_cast<int>(code), std::move(body));
}
