#include "retry_policy.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cmath>

const std::set<int>& registered_error_status_codes() {
    static const std::set<int> codes = {
        400, 401, 402, 403, 404, 405, 406, 407, 408, 409, 410, 411, 412, 413, 414, 415, 416, 417, 418,
        421, 422, 423, 424, 425, 426, 428, 429, 431, 444, 449, 450, 451, 499,
        500, 501, 502, 503, 504, 505, 506, 507, 508, 509, 510, 511
    };
    return codes;
}

bool is_special_status(int status) {
    return SPECIAL_STATUS_CODES.contains(status);
}

RetryPolicy::RetryPolicy()
    : RetryPolicy(DEFAULT_MAX_ATTEMPTS, DEFAULT_BACKOFF_FACTOR) {}

RetryPolicy::RetryPolicy(int max_attempts, double backoff_factor)
    : RetryPolicy(max_attempts, backoff_factor, registered_error_status_codes()) {}

RetryPolicy::RetryPolicy(int max_attempts, double backoff_factor, const std::set<int>& retryable_status_codes)
    : attempts(max_attempts), factor(backoff_factor) {
    if (max_attempts < 1) {
        throw BulkdlException(string_format("error.invalid_max_attempts", max_attempts));
    }
    if (!std::isfinite(backoff_factor) || backoff_factor < 0.0) {
        throw BulkdlException(string_format("error.invalid_backoff_factor", backoff_factor));
    }
    for (int code : retryable_status_codes) {
        if (!is_special_status(code)) {
            retryable.insert(code);
        }
    }
}

bool RetryPolicy::is_retryable_status(int status) const {
    return retryable.contains(status);
}

std::chrono::milliseconds RetryPolicy::backoff_delay(int attempt) const {
    if (attempt < 1) {
        return std::chrono::milliseconds(0);
    }
    const double cap = static_cast<double>(MAX_BACKOFF.count());
    // The exponent is clamped; the cap is reached long before 2^64.
    double seconds = std::min(cap, factor * std::ldexp(1.0, std::min(attempt - 1, 64)));
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(seconds));
}
