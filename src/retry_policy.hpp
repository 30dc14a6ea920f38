#pragma once

#include <chrono>
#include <set>

// Status codes that mean a permanent client-facing failure. Never retried.
inline const std::set<int> SPECIAL_STATUS_CODES = {403, 404};

inline constexpr int DEFAULT_MAX_ATTEMPTS = 6;
inline constexpr double DEFAULT_BACKOFF_FACTOR = 0.5;
inline constexpr std::chrono::seconds MAX_BACKOFF{120};

// Every registered HTTP status code >= 400.
const std::set<int>& registered_error_status_codes();

bool is_special_status(int status);

// Immutable retry settings shared read-only by all concurrent fetches.
// SPECIAL_STATUS_CODES are removed from the retryable set on construction.
class RetryPolicy {
public:
    RetryPolicy();
    RetryPolicy(int max_attempts, double backoff_factor);
    RetryPolicy(int max_attempts, double backoff_factor, const std::set<int>& retryable_status_codes);

    int max_attempts() const { return attempts; }
    double backoff_factor() const { return factor; }
    const std::set<int>& retryable_status_codes() const { return retryable; }

    bool is_retryable_status(int status) const;

    // Wait between attempt `attempt` and `attempt + 1` (1-based):
    // backoff_factor * 2^(attempt - 1) seconds, capped at MAX_BACKOFF.
    std::chrono::milliseconds backoff_delay(int attempt) const;

private:
    int attempts;
    double factor;
    std::set<int> retryable;
};
