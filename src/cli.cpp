#include "cli.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <vector>

namespace fs = std::filesystem;

cxxopts::Options build_options(const std::string& program) {
    cxxopts::Options options(program, get_string("info.description"));
    options.custom_help(get_string("info.usage"));
    options.set_width(100);

    const TransportOptions transport_defaults;
    options.add_options()
        ("h,help", get_string("help.help"))
        ("i,ifile", get_string("help.ifile"), cxxopts::value<std::string>())
        ("d,directory", get_string("help.directory"), cxxopts::value<std::string>())
        ("j,jobs", get_string("help.jobs"), cxxopts::value<long>()->default_value(std::to_string(DEFAULT_CONCURRENCY)))
        ("r,max-attempts", get_string("help.max_attempts"), cxxopts::value<int>()->default_value(std::to_string(DEFAULT_MAX_ATTEMPTS)))
        ("b,backoff-factor", get_string("help.backoff_factor"), cxxopts::value<double>()->default_value(std::to_string(DEFAULT_BACKOFF_FACTOR)))
        ("connect-timeout", get_string("help.connect_timeout"), cxxopts::value<long>()->default_value(std::to_string(transport_defaults.connect_timeout_seconds)))
        ("timeout", get_string("help.timeout"), cxxopts::value<long>()->default_value(std::to_string(transport_defaults.timeout_seconds)))
        ("stall-timeout", get_string("help.stall_timeout"), cxxopts::value<long>()->default_value(std::to_string(transport_defaults.stall_timeout_seconds)))
        ("user-agent", get_string("help.user_agent"), cxxopts::value<std::string>()->default_value(transport_defaults.user_agent))
        ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"));

    return options;
}

std::optional<JobConfig> parse_command_line(cxxopts::Options& options, int argc, const char* const argv[]) {
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        return std::nullopt;
    }

    std::vector<std::string> missing;
    for (const char* name : {"ifile", "directory"}) {
        if (!result.count(name)) {
            missing.emplace_back(name);
        }
    }
    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            names += names.empty() ? name : " " + name;
        }
        throw BulkdlException(string_format("error.missing_required_options", names));
    }

    JobConfig config;
    config.input_file = result["ifile"].as<std::string>();
    config.directory = result["directory"].as<std::string>();

    std::error_code ec;
    if (!fs::is_regular_file(config.input_file, ec) || !fs::is_directory(config.directory, ec)) {
        throw BulkdlException(get_string("error.input_or_directory_missing"));
    }
    if (!is_writable_dir(config.directory)) {
        throw BulkdlException(string_format("error.directory_not_writable", config.directory.string()));
    }

    long jobs = result["jobs"].as<long>();
    if (jobs < 1) {
        throw BulkdlException(string_format("error.invalid_concurrency", jobs));
    }
    config.concurrency = static_cast<size_t>(jobs);

    config.policy = RetryPolicy(result["max-attempts"].as<int>(), result["backoff-factor"].as<double>());

    config.transport.connect_timeout_seconds = result["connect-timeout"].as<long>();
    config.transport.timeout_seconds = result["timeout"].as<long>();
    config.transport.stall_timeout_seconds = result["stall-timeout"].as<long>();
    if (config.transport.connect_timeout_seconds < 0 || config.transport.timeout_seconds < 0
        || config.transport.stall_timeout_seconds < 0) {
        throw BulkdlException(get_string("error.invalid_timeout"));
    }
    config.transport.user_agent = result["user-agent"].as<std::string>();
    config.quiet = result["quiet"].as<bool>();

    return config;
}

DownloadJob load_job(const JobConfig& config) {
    DownloadJob job{
        read_lines_from_file(config.input_file),
        config.policy,
        config.directory,
        config.concurrency
    };
    return job;
}
