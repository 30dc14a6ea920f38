#include "job.hpp"
#include "localization.hpp"

#include <utility>

std::vector<Outcome> execute_job(const DownloadJob& job,
                                 Transport& transport,
                                 const OutcomeCallback& on_outcome,
                                 const CancellationToken* token,
                                 Sleeper sleeper) {
    Fetcher fetcher(transport, job.policy, std::move(sleeper));
    Scheduler scheduler(fetcher, job.directory, job.concurrency);
    return scheduler.run(job.urls, on_outcome, token);
}

void JobSummary::add(const Outcome& outcome) {
    ++counts[outcome.kind];
    ++total_count;
}

size_t JobSummary::count(OutcomeKind kind) const {
    auto it = counts.find(kind);
    return it == counts.end() ? 0 : it->second;
}

std::string JobSummary::to_string() const {
    return string_format("info.summary",
                         count(OutcomeKind::SUCCESS),
                         total_count,
                         count(OutcomeKind::INVALID_URL),
                         count(OutcomeKind::CONNECTION_ERROR),
                         count(OutcomeKind::TERMINAL_HTTP_ERROR),
                         count(OutcomeKind::RETRIES_EXHAUSTED),
                         count(OutcomeKind::FILESYSTEM_ERROR));
}
