#include "cli.hpp"
#include "curl_transport.hpp"
#include "exception.hpp"
#include "interrupt.hpp"
#include "job.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace {
    constexpr int EXIT_INTERRUPTED = 130;

    void print_usage(const cxxopts::Options& options) {
        std::cerr << options.help() << std::endl;
    }
}

int main(int argc, char* argv[]) {
    init_localization();

    cxxopts::Options options = build_options(argv[0]);

    // Configuration errors end the run before any task is scheduled.
    std::optional<JobConfig> config;
    try {
        config = parse_command_line(options, argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        print_usage(options);
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const BulkdlException& e) {
        print_usage(options);
        log_error(string_format("error.bulkdl_error", e.what()));
        return 1;
    }

    if (!config) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    try {
        DownloadJob job = load_job(*config);
        log_info(string_format("info.starting", job.urls.size(), job.directory.string(), job.concurrency));

        CancellationToken token;
        InterruptWatcher watcher([&token](int) {
            token.request_stop();
            log_warning(get_string("warning.stopping_queued"));
        });

        CurlGlobalInitializer curl_initializer;
        CurlTransport transport(config->transport);

        JobSummary summary;
        const bool quiet = config->quiet;
        auto on_outcome = [&summary, quiet](const Outcome& outcome) {
            summary.add(outcome);
            if (!outcome.is_success()) {
                log_error(describe_outcome(outcome));
            }
            if (!quiet) {
                log_progress_tick();
            }
        };

        execute_job(job, transport, on_outcome, &token);
        log_progress_end();
        log_info(summary.to_string());

        // A signal after the last URL was admitted changes nothing.
        if (watcher.interrupted() && summary.not_started(job.urls.size()) > 0) {
            log_warning(string_format("warning.not_started", summary.not_started(job.urls.size())));
            return EXIT_INTERRUPTED;
        }
    } catch (const BulkdlException& e) {
        log_error(string_format("error.bulkdl_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
