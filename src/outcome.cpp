#include "outcome.hpp"
#include "localization.hpp"

Outcome Outcome::success(const std::string& url, const std::string& filename, std::uintmax_t bytes) {
    Outcome o;
    o.kind = OutcomeKind::SUCCESS;
    o.url = url;
    o.filename = filename;
    o.bytes_written = bytes;
    return o;
}

Outcome Outcome::invalid_url(const std::string& url) {
    Outcome o;
    o.kind = OutcomeKind::INVALID_URL;
    o.url = url;
    return o;
}

Outcome Outcome::connection_error(const std::string& url, const std::string& message) {
    Outcome o;
    o.kind = OutcomeKind::CONNECTION_ERROR;
    o.url = url;
    o.message = message;
    return o;
}

Outcome Outcome::terminal_http_error(const std::string& url, int status_code) {
    Outcome o;
    o.kind = OutcomeKind::TERMINAL_HTTP_ERROR;
    o.url = url;
    o.status_code = status_code;
    return o;
}

Outcome Outcome::retries_exhausted(const std::string& url, int status_code) {
    Outcome o;
    o.kind = OutcomeKind::RETRIES_EXHAUSTED;
    o.url = url;
    o.status_code = status_code;
    return o;
}

Outcome Outcome::filesystem_error(const std::string& url, const std::string& message) {
    Outcome o;
    o.kind = OutcomeKind::FILESYSTEM_ERROR;
    o.url = url;
    o.message = message;
    return o;
}

std::string outcome_kind_name(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::SUCCESS: return "success";
        case OutcomeKind::INVALID_URL: return "invalid_url";
        case OutcomeKind::CONNECTION_ERROR: return "connection_error";
        case OutcomeKind::TERMINAL_HTTP_ERROR: return "terminal_http_error";
        case OutcomeKind::RETRIES_EXHAUSTED: return "retries_exhausted";
        case OutcomeKind::FILESYSTEM_ERROR: return "filesystem_error";
    }
    return "unknown";
}

std::string describe_outcome(const Outcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::SUCCESS:
            return string_format("info.downloaded", outcome.url, outcome.filename, outcome.bytes_written);
        case OutcomeKind::INVALID_URL:
            return string_format("error.invalid_url", outcome.url);
        case OutcomeKind::CONNECTION_ERROR:
            return string_format("error.connection_error", outcome.url, outcome.message);
        case OutcomeKind::TERMINAL_HTTP_ERROR:
            return string_format("error.terminal_http_error", outcome.status_code, outcome.url);
        case OutcomeKind::RETRIES_EXHAUSTED:
            return string_format("error.retries_exhausted", outcome.url, outcome.attempts, outcome.status_code);
        case OutcomeKind::FILESYSTEM_ERROR:
            return string_format("error.filesystem_error", outcome.url, outcome.message);
    }
    return outcome.url;
}

std::optional<Outcome> classify(const std::string& url, const FetchResult& result, const RetryPolicy& policy) {
    const FetchAttempt& last = result.last;
    std::optional<Outcome> outcome;

    if (!last.is_response()) {
        outcome = Outcome::connection_error(url, last.error);
    } else if (is_special_status(last.status_code)) {
        outcome = Outcome::terminal_http_error(url, last.status_code);
    } else if (last.status_code >= 400) {
        if (policy.is_retryable_status(last.status_code)) {
            outcome = Outcome::retries_exhausted(url, last.status_code);
        } else {
            outcome = Outcome::terminal_http_error(url, last.status_code);
        }
    }

    if (outcome) {
        outcome->attempts = result.attempts;
    }
    return outcome;
}
