#include "fetcher.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <exception>
#include <thread>
#include <utility>

void sleep_for_backoff(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

Fetcher::Fetcher(Transport& t, RetryPolicy p, Sleeper s)
    : transport(t), policy(std::move(p)), sleeper(std::move(s)) {}

bool Fetcher::should_retry(const FetchAttempt& attempt) const {
    if (attempt.is_response()) {
        return policy.is_retryable_status(attempt.status_code);
    }
    return attempt.retryable;
}

FetchResult Fetcher::fetch(const std::string& url) const {
    FetchResult result;
    for (int attempt = 1; attempt <= policy.max_attempts(); ++attempt) {
        result.attempts = attempt;
        try {
            result.last = transport.get(url);
        } catch (const std::exception& e) {
            result.last = FetchAttempt::transport_error(e.what(), false);
        }

        if (attempt == policy.max_attempts() || !should_retry(result.last)) {
            break;
        }

        auto delay = policy.backoff_delay(attempt);
        std::string reason = result.last.is_response()
            ? string_format("info.http_status", result.last.status_code)
            : result.last.error;
        log_warning(string_format("warning.retrying", url, reason, attempt, policy.max_attempts(), delay.count()));
        if (sleeper && delay.count() > 0) {
            sleeper(delay);
        }
    }
    return result;
}
