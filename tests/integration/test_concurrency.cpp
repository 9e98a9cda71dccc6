/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for the transfer dispatcher
 *
 * This file contains tests for:
 * - Concurrency limit enforcement across many queued jobs
 * - Raising the limit while jobs are waiting
 * - Concurrent submission from several threads
 */

#include "test_fixtures.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

namespace cloudxfer::test {

namespace {

/**
 * @brief Highest number of jobs observed between first in-progress and terminal
 */
auto peak_running(const std::vector<transfer_update>& updates) -> std::size_t {
    std::set<std::string> running;
    std::size_t peak = 0;
    for (const auto& update : updates) {
        if (update.status == transfer_status::in_progress) {
            running.insert(update.id);
        } else if (is_terminal_status(update.status)) {
            running.erase(update.id);
        }
        peak = std::max(peak, running.size());
    }
    return peak;
}

}  // namespace

// =============================================================================
// Concurrency Limit Tests
// =============================================================================

class ConcurrencyLimitTest : public DispatcherFixture {};

TEST_F(ConcurrencyLimitTest, LimitRespected) {
    auto file = create_test_file("limit.bin", 100);
    auto tool = create_sleeping_tool(0.2);
    auto& dispatcher = make_dispatcher(tool.string(), "", 2);

    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(dispatcher.enqueue_upload(file.string(), "b", "").has_value());
    }
    dispatcher.wait_idle();

    auto updates = sink_->all_updates();
    EXPECT_LE(peak_running(updates), 2u);
    EXPECT_EQ(dispatcher.get_statistics().succeeded, 6u);
}

TEST_F(ConcurrencyLimitTest, SerialWithLimitOne) {
    auto file = create_test_file("serial.bin", 100);
    auto tool = create_sleeping_tool(0.1);
    auto& dispatcher = make_dispatcher(tool.string(), "", 1);

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(dispatcher.enqueue_upload(file.string(), "b", "").has_value());
    }
    dispatcher.wait_idle();

    EXPECT_EQ(peak_running(sink_->all_updates()), 1u);
}

TEST_F(ConcurrencyLimitTest, QueuedSnapshotsPublishedImmediately) {
    auto file = create_test_file("queued.bin", 100);
    auto tool = create_sleeping_tool(0.3);
    auto& dispatcher = make_dispatcher(tool.string(), "", 1);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        auto id = dispatcher.enqueue_upload(file.string(), "b", "");
        ASSERT_TRUE(id.has_value());
        ids.push_back(id.value());
    }

    for (const auto& id : ids) {
        auto updates = sink_->updates_for(id);
        ASSERT_FALSE(updates.empty());
        EXPECT_EQ(updates.front().status, transfer_status::queued);
    }
    dispatcher.wait_idle();
}

TEST_F(ConcurrencyLimitTest, RaisingLimitAdmitsWaitingJobs) {
    auto file = create_test_file("raise.bin", 100);
    auto tool = create_sleeping_tool(1.0);
    auto& dispatcher = make_dispatcher(tool.string(), "", 1);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        auto id = dispatcher.enqueue_upload(file.string(), "b", "");
        ASSERT_TRUE(id.has_value());
        ids.push_back(id.value());
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (dispatcher.get_statistics().active == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(dispatcher.get_statistics().active, 1u);

    dispatcher.set_concurrency_limit(3);
    dispatcher.wait_idle();

    EXPECT_GE(peak_running(sink_->all_updates()), 2u);
    EXPECT_EQ(dispatcher.get_statistics().succeeded, 3u);
}

TEST_F(ConcurrencyLimitTest, LoweringLimitDoesNotInterruptRunningJobs) {
    auto file = create_test_file("lower.bin", 100);
    auto tool = create_sleeping_tool(0.3);
    auto& dispatcher = make_dispatcher(tool.string(), "", 3);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(dispatcher.enqueue_upload(file.string(), "b", "").has_value());
    }
    dispatcher.set_concurrency_limit(1);
    dispatcher.wait_idle();

    EXPECT_EQ(dispatcher.get_statistics().succeeded, 3u);
    EXPECT_EQ(dispatcher.get_concurrency_limit(), 1u);
}

// =============================================================================
// Concurrent Submission Tests
// =============================================================================

class ConcurrentSubmissionTest : public DispatcherFixture {};

TEST_F(ConcurrentSubmissionTest, ManyThreadsSubmitting) {
    auto file = create_test_file("shared.bin", 64);
    auto tool = create_progress_tool();
    auto& dispatcher = make_dispatcher(tool.string(), "", 4);

    std::atomic<int> accepted{0};
    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; ++t) {
        submitters.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                if (dispatcher.enqueue_upload(file.string(), "b", "shared/").has_value()) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& t : submitters) {
        t.join();
    }
    dispatcher.wait_idle();

    EXPECT_EQ(accepted.load(), 20);
    auto stats = dispatcher.get_statistics();
    EXPECT_EQ(stats.submitted, 20u);
    EXPECT_EQ(stats.succeeded, 20u);

    std::set<std::string> ids;
    for (const auto& update : sink_->all_updates()) {
        ids.insert(update.id);
    }
    EXPECT_EQ(ids.size(), 20u);
    EXPECT_LE(peak_running(sink_->all_updates()), 4u);
}

}  // namespace cloudxfer::test
