#pragma once

#include "download_task.hpp"
#include "fetcher.hpp"
#include "outcome.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

inline constexpr size_t DEFAULT_CONCURRENCY = 100;

// Set once from outside (e.g. an interrupt handler); read by the workers.
class CancellationToken {
public:
    void request_stop() noexcept { stopped.store(true); }
    bool stop_requested() const noexcept { return stopped.load(); }

private:
    std::atomic<bool> stopped{false};
};

// Receives each outcome as its task completes. Calls are serialized, so the
// callback needs no locking of its own, but it runs on a worker thread.
using OutcomeCallback = std::function<void(const Outcome&)>;

// Bounded worker pool. At most `concurrency` tasks run at once; URLs are
// admitted in input order. After cancellation no further URL is admitted,
// tasks already started run to completion.
class Scheduler {
public:
    Scheduler(const Fetcher& fetcher, std::filesystem::path directory, size_t concurrency = DEFAULT_CONCURRENCY);

    void set_state_listener(StateListener listener);

    // Returns the outcomes in completion order. Without cancellation there
    // is exactly one per input URL.
    std::vector<Outcome> run(const std::vector<std::string>& urls,
                             const OutcomeCallback& on_outcome = nullptr,
                             const CancellationToken* token = nullptr) const;

    size_t get_concurrency() const { return concurrency; }

private:
    const Fetcher& fetcher;
    std::filesystem::path directory;
    size_t concurrency;
    StateListener state_listener;
};
