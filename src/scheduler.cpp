#include "scheduler.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <future>
#include <mutex>
#include <utility>

Scheduler::Scheduler(const Fetcher& f, std::filesystem::path dir, size_t limit)
    : fetcher(f), directory(std::move(dir)), concurrency(limit) {
    if (concurrency == 0) {
        throw BulkdlException(string_format("error.invalid_concurrency", concurrency));
    }
}

void Scheduler::set_state_listener(StateListener listener) {
    state_listener = std::move(listener);
}

std::vector<Outcome> Scheduler::run(const std::vector<std::string>& urls,
                                    const OutcomeCallback& on_outcome,
                                    const CancellationToken* token) const {
    std::vector<Outcome> outcomes;
    outcomes.reserve(urls.size());

    std::mutex queue_mutex;
    size_t next = 0;
    std::atomic<bool> aborted{false};

    std::mutex results_mutex;

    auto admit = [&](size_t& index) {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (aborted.load() || (token && token->stop_requested()) || next >= urls.size()) {
            return false;
        }
        index = next++;
        return true;
    };

    auto worker = [&] {
        try {
            size_t index = 0;
            while (admit(index)) {
                DownloadTask task(urls[index], fetcher, directory, state_listener);
                Outcome outcome = task.run();

                std::lock_guard<std::mutex> lock(results_mutex);
                outcomes.push_back(outcome);
                if (on_outcome) {
                    on_outcome(outcomes.back());
                }
            }
        } catch (...) {
            aborted.store(true);
            throw;
        }
    };

    const size_t worker_count = std::min(concurrency, urls.size());
    std::vector<std::future<void>> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.push_back(std::async(std::launch::async, worker));
    }

    // Wait for every worker before rethrowing, they reference this frame.
    for (auto& w : workers) {
        w.wait();
    }
    for (auto& w : workers) {
        w.get();
    }

    return outcomes;
}
