#pragma once

#include "fetcher.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class OutcomeKind {
    SUCCESS,
    INVALID_URL,
    CONNECTION_ERROR,
    TERMINAL_HTTP_ERROR,
    RETRIES_EXHAUSTED,
    FILESYSTEM_ERROR
};

// Terminal classification of one URL. Exactly one per input URL.
struct Outcome {
    OutcomeKind kind = OutcomeKind::INVALID_URL;
    std::string url;
    std::string filename;       // SUCCESS
    std::uintmax_t bytes_written = 0; // SUCCESS
    int status_code = 0;        // TERMINAL_HTTP_ERROR, RETRIES_EXHAUSTED
    int attempts = 0;
    std::string message;        // CONNECTION_ERROR, FILESYSTEM_ERROR

    bool is_success() const { return kind == OutcomeKind::SUCCESS; }

    static Outcome success(const std::string& url, const std::string& filename, std::uintmax_t bytes);
    static Outcome invalid_url(const std::string& url);
    static Outcome connection_error(const std::string& url, const std::string& message);
    static Outcome terminal_http_error(const std::string& url, int status_code);
    static Outcome retries_exhausted(const std::string& url, int status_code);
    static Outcome filesystem_error(const std::string& url, const std::string& message);
};

std::string outcome_kind_name(OutcomeKind kind);

// Human-readable error line for a non-SUCCESS outcome.
std::string describe_outcome(const Outcome& outcome);

// Decides the fate of a finished fetch. std::nullopt means the body should
// go to the writer; anything else is the final outcome.
std::optional<Outcome> classify(const std::string& url, const FetchResult& result, const RetryPolicy& policy);
