#include "download_task.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "url.hpp"
#include "writer.hpp"

#include <utility>

std::string task_state_name(TaskState state) {
    switch (state) {
        case TaskState::PENDING: return "pending";
        case TaskState::VALIDATING: return "validating";
        case TaskState::FETCHING: return "fetching";
        case TaskState::CLASSIFYING: return "classifying";
        case TaskState::WRITING: return "writing";
        case TaskState::REJECTED: return "rejected";
        case TaskState::DONE: return "done";
    }
    return "unknown";
}

DownloadTask::DownloadTask(std::string u, const Fetcher& f, std::filesystem::path dir, StateListener l)
    : url(std::move(u)), fetcher(f), directory(std::move(dir)), listener(std::move(l)) {}

void DownloadTask::transition(TaskState next) {
    state = next;
    if (listener) {
        listener(url, state);
    }
}

Outcome DownloadTask::finish(Outcome outcome) {
    transition(TaskState::DONE);
    return outcome;
}

Outcome DownloadTask::run() {
    if (state != TaskState::PENDING) {
        throw BulkdlException(string_format("error.task_already_run", url));
    }

    transition(TaskState::VALIDATING);
    if (!is_valid_url(url)) {
        transition(TaskState::REJECTED);
        return finish(Outcome::invalid_url(url));
    }

    transition(TaskState::FETCHING);
    FetchResult result = fetcher.fetch(url);

    transition(TaskState::CLASSIFYING);
    if (auto failure = classify(url, result, fetcher.get_policy())) {
        transition(TaskState::REJECTED);
        return finish(std::move(*failure));
    }

    transition(TaskState::WRITING);
    Outcome outcome = write_download(directory, url, result.last.body);
    outcome.attempts = result.attempts;
    return finish(std::move(outcome));
}
