#pragma once

#include <atomic>
#include <functional>
#include <signal.h>
#include <thread>

// Blocks SIGINT and SIGTERM in the calling thread (and every thread it
// creates afterwards) and waits for them on a dedicated thread, so the
// handler may run ordinary code. Construct before spawning other threads.
// The first signal runs the callback; a second one kills the process with
// the signal's default action.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::function<void(int)> on_interrupt);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    bool interrupted() const { return fired.load(); }

private:
    void watch();
    static void terminate_with(int sig);

    std::function<void(int)> callback;
    sigset_t signals;
    sigset_t previous_mask;
    std::atomic<bool> finished{false};
    std::atomic<bool> fired{false};
    std::thread watcher;
};
