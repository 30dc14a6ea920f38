#pragma once

#include <string>
#include <utility>

// Result of one network call.
struct FetchAttempt {
    enum class Kind {
        RESPONSE,
        TRANSPORT_ERROR
    };

    Kind kind = Kind::TRANSPORT_ERROR;
    int status_code = 0;
    std::string body;
    std::string error;
    // Only meaningful for TRANSPORT_ERROR: connect/read failures worth another try.
    bool retryable = false;

    bool is_response() const { return kind == Kind::RESPONSE; }

    static FetchAttempt response(int status_code, std::string body) {
        FetchAttempt attempt;
        attempt.kind = Kind::RESPONSE;
        attempt.status_code = status_code;
        attempt.body = std::move(body);
        return attempt;
    }

    static FetchAttempt transport_error(std::string error, bool retryable) {
        FetchAttempt attempt;
        attempt.kind = Kind::TRANSPORT_ERROR;
        attempt.error = std::move(error);
        attempt.retryable = retryable;
        return attempt;
    }
};

// Performs a single GET. Implementations are shared by all workers and must
// tolerate concurrent calls.
class Transport {
public:
    virtual ~Transport() = default;
    virtual FetchAttempt get(const std::string& url) = 0;
};
