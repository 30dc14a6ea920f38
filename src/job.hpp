#pragma once

#include "fetcher.hpp"
#include "outcome.hpp"
#include "retry_policy.hpp"
#include "scheduler.hpp"
#include "transport.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// One batch run: built from validated inputs, executed once.
struct DownloadJob {
    std::vector<std::string> urls;
    RetryPolicy policy;
    std::filesystem::path directory;
    size_t concurrency = DEFAULT_CONCURRENCY;
};

std::vector<Outcome> execute_job(const DownloadJob& job,
                                 Transport& transport,
                                 const OutcomeCallback& on_outcome = nullptr,
                                 const CancellationToken* token = nullptr,
                                 Sleeper sleeper = sleep_for_backoff);

// Tally of outcomes by kind for the end-of-run report.
class JobSummary {
public:
    void add(const Outcome& outcome);

    size_t count(OutcomeKind kind) const;
    size_t total() const { return total_count; }
    size_t failures() const { return total_count - count(OutcomeKind::SUCCESS); }
    // URLs of a batch of `expected` that never produced an outcome.
    size_t not_started(size_t expected) const { return expected > total_count ? expected - total_count : 0; }

    std::string to_string() const;

private:
    std::map<OutcomeKind, size_t> counts;
    size_t total_count = 0;
};
