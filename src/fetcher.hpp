#pragma once

#include "retry_policy.hpp"
#include "transport.hpp"

#include <chrono>
#include <functional>
#include <string>

// The final attempt of a fetch and how many attempts it took to get there.
struct FetchResult {
    FetchAttempt last;
    int attempts = 0;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

void sleep_for_backoff(std::chrono::milliseconds delay);

// GET with transparent retries. Never throws: transport exceptions become
// TRANSPORT_ERROR attempts.
class Fetcher {
public:
    Fetcher(Transport& transport, RetryPolicy policy, Sleeper sleeper = sleep_for_backoff);

    FetchResult fetch(const std::string& url) const;

    const RetryPolicy& get_policy() const { return policy; }

private:
    bool should_retry(const FetchAttempt& attempt) const;

    Transport& transport;
    const RetryPolicy policy;
    Sleeper sleeper;
};
