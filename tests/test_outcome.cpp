#include <gtest/gtest.h>
#include "outcome.hpp"
#include "localization.hpp"

#include <set>

class ClassifierTest : public ::testing::Test {
protected:
    RetryPolicy policy{5, 0.5};

    void SetUp() override {
        init_localization(std::filesystem::path(BULKDL_SOURCE_DIR) / "l10n");
    }

    static FetchResult result_of(FetchAttempt attempt, int attempts) {
        FetchResult result;
        result.last = std::move(attempt);
        result.attempts = attempts;
        return result;
    }
};

TEST_F(ClassifierTest, TransportFailureIsConnectionError) {
    auto outcome = classify("http://x/a", result_of(FetchAttempt::transport_error("Connection refused", true), 5), policy);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::CONNECTION_ERROR);
    EXPECT_EQ(outcome->message, "Connection refused");
    EXPECT_EQ(outcome->attempts, 5);
}

TEST_F(ClassifierTest, SpecialCodesAreTerminal) {
    for (int code : {403, 404}) {
        auto outcome = classify("http://x/a", result_of(FetchAttempt::response(code, ""), 1), policy);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_EQ(outcome->kind, OutcomeKind::TERMINAL_HTTP_ERROR);
        EXPECT_EQ(outcome->status_code, code);
    }
}

TEST_F(ClassifierTest, RetryableStatusAfterBudgetIsExhausted) {
    auto outcome = classify("http://x/a", result_of(FetchAttempt::response(503, ""), 5), policy);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::RETRIES_EXHAUSTED);
    EXPECT_EQ(outcome->status_code, 503);
}

TEST_F(ClassifierTest, ErrorStatusOutsideRetryableSetIsTerminal) {
    RetryPolicy narrow(5, 0.5, {503});
    auto outcome = classify("http://x/a", result_of(FetchAttempt::response(500, ""), 1), narrow);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::TERMINAL_HTTP_ERROR);
    EXPECT_EQ(outcome->status_code, 500);
}

TEST_F(ClassifierTest, SuccessfulAndRedirectResponsesGoToWriter) {
    for (int code : {200, 201, 204, 301, 304}) {
        EXPECT_FALSE(classify("http://x/a", result_of(FetchAttempt::response(code, "b"), 2), policy).has_value()) << code;
    }
}

TEST_F(ClassifierTest, DescriptionsNameTheUrl) {
    const std::string url = "http://x/failing.png";
    for (const Outcome& outcome : {
             Outcome::invalid_url(url),
             Outcome::connection_error(url, "Connection refused"),
             Outcome::terminal_http_error(url, 404),
             Outcome::retries_exhausted(url, 503),
             Outcome::filesystem_error(url, "disk full")}) {
        std::string text = describe_outcome(outcome);
        EXPECT_NE(text.find(url), std::string::npos) << text;
        EXPECT_EQ(text.find("MISSING_STRING"), std::string::npos) << text;
    }
    EXPECT_NE(describe_outcome(Outcome::terminal_http_error(url, 404)).find("404"), std::string::npos);
}

TEST(OutcomeTest, KindNamesAreDistinct) {
    std::set<std::string> names;
    for (OutcomeKind kind : {OutcomeKind::SUCCESS, OutcomeKind::INVALID_URL, OutcomeKind::CONNECTION_ERROR,
                             OutcomeKind::TERMINAL_HTTP_ERROR, OutcomeKind::RETRIES_EXHAUSTED,
                             OutcomeKind::FILESYSTEM_ERROR}) {
        names.insert(outcome_kind_name(kind));
    }
    EXPECT_EQ(names.size(), 6u);
}
