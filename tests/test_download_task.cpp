#include <gtest/gtest.h>
#include "download_task.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "scripted_transport.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

class DownloadTaskTest : public ::testing::Test {
protected:
    fs::path test_dir;
    ScriptedTransport transport;
    std::vector<TaskState> states;

    void SetUp() override {
        init_localization(fs::path(BULKDL_SOURCE_DIR) / "l10n");
        test_dir = fs::absolute("tmp_task_test");
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
    }

    StateListener recorder() {
        return [this](const std::string&, TaskState state) { states.push_back(state); };
    }
};

TEST_F(DownloadTaskTest, SuccessfulPath) {
    Fetcher fetcher(transport, RetryPolicy(3, 0.0));
    DownloadTask task("http://x/a.png", fetcher, test_dir, recorder());

    Outcome outcome = task.run();

    EXPECT_EQ(outcome.kind, OutcomeKind::SUCCESS);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_TRUE(fs::exists(test_dir / "a.png"));
    EXPECT_EQ(states, (std::vector<TaskState>{
        TaskState::VALIDATING, TaskState::FETCHING, TaskState::CLASSIFYING, TaskState::WRITING, TaskState::DONE}));
    EXPECT_EQ(task.get_state(), TaskState::DONE);
}

TEST_F(DownloadTaskTest, InvalidUrlNeverReachesTransport) {
    Fetcher fetcher(transport, RetryPolicy(3, 0.0));
    DownloadTask task("not a url", fetcher, test_dir, recorder());

    Outcome outcome = task.run();

    EXPECT_EQ(outcome.kind, OutcomeKind::INVALID_URL);
    EXPECT_EQ(outcome.url, "not a url");
    EXPECT_EQ(transport.total_calls(), 0);
    EXPECT_EQ(states, (std::vector<TaskState>{TaskState::VALIDATING, TaskState::REJECTED, TaskState::DONE}));
}

TEST_F(DownloadTaskTest, RejectedFetchLeavesDirectoryUntouched) {
    transport.script("http://x/b.png", {FetchAttempt::response(404, "missing")});
    Fetcher fetcher(transport, RetryPolicy(3, 0.0));
    DownloadTask task("http://x/b.png", fetcher, test_dir, recorder());

    Outcome outcome = task.run();

    EXPECT_EQ(outcome.kind, OutcomeKind::TERMINAL_HTTP_ERROR);
    EXPECT_EQ(outcome.status_code, 404);
    EXPECT_TRUE(fs::is_empty(test_dir));
    EXPECT_EQ(states, (std::vector<TaskState>{
        TaskState::VALIDATING, TaskState::FETCHING, TaskState::CLASSIFYING, TaskState::REJECTED, TaskState::DONE}));
}

TEST_F(DownloadTaskTest, ExhaustedRetriesReportAttempts) {
    transport.script("http://x/c.png", {FetchAttempt::response(503, "")});
    Fetcher fetcher(transport, RetryPolicy(4, 0.0));
    DownloadTask task("http://x/c.png", fetcher, test_dir);

    Outcome outcome = task.run();

    EXPECT_EQ(outcome.kind, OutcomeKind::RETRIES_EXHAUSTED);
    EXPECT_EQ(outcome.status_code, 503);
    EXPECT_EQ(outcome.attempts, 4);
    EXPECT_TRUE(fs::is_empty(test_dir));
}

TEST_F(DownloadTaskTest, RunsOnlyOnce) {
    Fetcher fetcher(transport, RetryPolicy(1, 0.0));
    DownloadTask task("http://x/a.png", fetcher, test_dir);
    task.run();
    EXPECT_THROW(task.run(), BulkdlException);
    EXPECT_EQ(transport.total_calls(), 1);
}

TEST(TaskStateTest, NamesAreReadable) {
    EXPECT_EQ(task_state_name(TaskState::FETCHING), "fetching");
    EXPECT_EQ(task_state_name(TaskState::DONE), "done");
}
