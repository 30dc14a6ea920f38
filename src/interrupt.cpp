#include "interrupt.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <pthread.h>
#include <cerrno>
#include <ctime>
#include <utility>

InterruptWatcher::InterruptWatcher(std::function<void(int)> on_interrupt)
    : callback(std::move(on_interrupt)) {
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, &previous_mask) != 0) {
        throw BulkdlException(get_string("error.signal_mask_failed"));
    }
    watcher = std::thread(&InterruptWatcher::watch, this);
}

InterruptWatcher::~InterruptWatcher() {
    finished.store(true);
    if (watcher.joinable()) {
        watcher.join();
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
}

void InterruptWatcher::watch() {
    const timespec poll_interval{0, 100 * 1000 * 1000};
    while (!finished.load()) {
        int sig = sigtimedwait(&signals, nullptr, &poll_interval);
        if (sig < 0) {
            // EAGAIN on timeout, EINTR on an unrelated signal.
            continue;
        }
        if (fired.exchange(true)) {
            terminate_with(sig);
        }
        if (callback) {
            callback(sig);
        }
    }
}

void InterruptWatcher::terminate_with(int sig) {
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    sigaction(sig, &action, nullptr);

    sigset_t only;
    sigemptyset(&only);
    sigaddset(&only, sig);
    pthread_sigmask(SIG_UNBLOCK, &only, nullptr);
    raise(sig);
}
