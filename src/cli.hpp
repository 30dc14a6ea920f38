#pragma once

#include "curl_transport.hpp"
#include "job.hpp"
#include "retry_policy.hpp"
#include "scheduler.hpp"

#include <cxxopts.hpp>

#include <filesystem>
#include <optional>
#include <string>

// Validated command line. Every field holds a usable value once built.
struct JobConfig {
    std::filesystem::path input_file;
    std::filesystem::path directory;
    size_t concurrency = DEFAULT_CONCURRENCY;
    RetryPolicy policy;
    TransportOptions transport;
    bool quiet = false;
};

cxxopts::Options build_options(const std::string& program);

// std::nullopt when help was requested. Throws BulkdlException for missing
// options, bad values and absent paths, before any work is scheduled.
std::optional<JobConfig> parse_command_line(cxxopts::Options& options, int argc, const char* const argv[]);

// Reads the URL list and builds the job.
DownloadJob load_job(const JobConfig& config);
