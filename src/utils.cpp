#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_line_open = false;

    // Caller must hold log_mutex.
    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    // Caller must hold log_mutex.
    void close_progress_line() {
        if (progress_line_open) {
            std::cout << std::endl;
            progress_line_open = false;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();
        close_progress_line();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress_tick() {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cout << '.' << std::flush;
    progress_line_open = true;
}

void log_progress_end() {
    std::lock_guard<std::mutex> lock(log_mutex);
    close_progress_line();
}

bool is_writable_dir(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return false;
    }
    return access(path.c_str(), W_OK | X_OK) == 0;
}

std::vector<std::string> read_lines_from_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw BulkdlException(string_format("error.open_file_failed", path.string()) + ": " + strerror(errno));
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        result.push_back(line);
    }
    return result;
}
