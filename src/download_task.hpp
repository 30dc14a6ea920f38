#pragma once

#include "fetcher.hpp"
#include "outcome.hpp"

#include <filesystem>
#include <functional>
#include <string>

enum class TaskState {
    PENDING,
    VALIDATING,
    FETCHING,
    CLASSIFYING,
    WRITING,
    REJECTED,
    DONE
};

std::string task_state_name(TaskState state);

// Called on every state change. Invoked from worker threads.
using StateListener = std::function<void(const std::string& url, TaskState state)>;

// Validate -> fetch -> classify -> write for a single URL.
class DownloadTask {
public:
    DownloadTask(std::string url, const Fetcher& fetcher, std::filesystem::path directory, StateListener listener = nullptr);

    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    // Runs the state machine to DONE. May be called once.
    Outcome run();

    TaskState get_state() const { return state; }
    const std::string& get_url() const { return url; }

private:
    void transition(TaskState next);
    Outcome finish(Outcome outcome);

    std::string url;
    const Fetcher& fetcher;
    std::filesystem::path directory;
    StateListener listener;
    TaskState state = TaskState::PENDING;
};
