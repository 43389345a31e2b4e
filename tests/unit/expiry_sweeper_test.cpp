#include "core/session/expiry_sweeper.hpp"
#include "session_test_fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using session::core::ExpirySweeper;
using session::core::FieldValue;
using session::core::SweeperOptions;

namespace {

std::int64_t NowUnixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

SweeperOptions FastOptions(std::atomic<int>* sweeps, std::atomic<int>* failures = nullptr) {
    SweeperOptions options;
    options.expire_age = std::chrono::hours(1);
    options.clean_interval = std::chrono::milliseconds(20);
    options.startup_delay = std::chrono::milliseconds(0);
    options.on_sweep = [sweeps, failures](const session::common::Status& status) {
        ++*sweeps;
        if (failures != nullptr && !status.IsOk()) {
            ++*failures;
        }
    };
    return options;
}

} // namespace

class ExpirySweeperTest : public ::testing::Test {
protected:
    std::shared_ptr<testutils::CountingSessionStore> store_ = std::make_shared<testutils::CountingSessionStore>();
};

TEST_F(ExpirySweeperTest, RequiresStore) {
    EXPECT_THROW(ExpirySweeper(nullptr, SweeperOptions()), std::invalid_argument);
}

TEST_F(ExpirySweeperTest, SweepOnceRemovesOnlyExpiredSessions) {
    const auto now = NowUnixSeconds();
    store_->inner.PutRaw("old", FieldValue(std::int64_t{1}), now - 2 * 3600);
    store_->inner.PutRaw("fresh", FieldValue(std::int64_t{2}), now - 60);

    SweeperOptions options;
    options.expire_age = std::chrono::hours(1);
    ExpirySweeper sweeper(store_, options);

    ASSERT_TRUE(sweeper.SweepOnce().IsOk());
    EXPECT_EQ(store_->inner.Size(), 1u);
    EXPECT_TRUE(store_->inner.LookupUserId("fresh").IsOk());
    EXPECT_FALSE(sweeper.Running());
}

TEST_F(ExpirySweeperTest, RunsRepeatedlyAfterStartupDelay) {
    std::atomic<int> sweeps{0};
    ExpirySweeper sweeper(store_, FastOptions(&sweeps));

    sweeper.Start();
    EXPECT_TRUE(sweeper.Running());
    EXPECT_TRUE(testutils::WaitUntil([&sweeps] { return sweeps.load() >= 3; }));

    sweeper.Stop();
    EXPECT_FALSE(sweeper.Running());
    const int after_stop = sweeps.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(sweeps.load(), after_stop);
}

TEST_F(ExpirySweeperTest, StopDuringStartupDelaySkipsSweep) {
    std::atomic<int> sweeps{0};
    auto options = FastOptions(&sweeps);
    options.startup_delay = std::chrono::hours(1);
    ExpirySweeper sweeper(store_, options);

    sweeper.Start();
    const auto begin = std::chrono::steady_clock::now();
    sweeper.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
    EXPECT_EQ(sweeps.load(), 0);
    EXPECT_EQ(store_->purges.load(), 0);
}

TEST_F(ExpirySweeperTest, StartAndStopAreIdempotent) {
    std::atomic<int> sweeps{0};
    auto options = FastOptions(&sweeps);
    options.startup_delay = std::chrono::hours(1);
    ExpirySweeper sweeper(store_, options);

    sweeper.Stop();
    sweeper.Start();
    sweeper.Start();
    EXPECT_TRUE(sweeper.Running());
    sweeper.Stop();
    sweeper.Stop();
    EXPECT_FALSE(sweeper.Running());

    // 停止后可重新启动
    sweeper.Start();
    EXPECT_TRUE(sweeper.Running());
}

TEST_F(ExpirySweeperTest, FailuresDoNotStopSchedule) {
    store_->FailPurge(session::common::Status::Unavailable("mysql down"));
    std::atomic<int> sweeps{0};
    std::atomic<int> failures{0};
    ExpirySweeper sweeper(store_, FastOptions(&sweeps, &failures));

    sweeper.Start();
    EXPECT_TRUE(testutils::WaitUntil([&failures] { return failures.load() >= 2; }));
    sweeper.Stop();
    EXPECT_EQ(sweeps.load(), failures.load());
}

TEST_F(ExpirySweeperTest, StopWaitsForInFlightPurge) {
    store_->purge_delay = std::chrono::milliseconds(150);
    std::atomic<int> sweeps{0};
    ExpirySweeper sweeper(store_, FastOptions(&sweeps));

    sweeper.Start();
    ASSERT_TRUE(testutils::WaitUntil([this] { return store_->purges.load() >= 1; }));
    sweeper.Stop();
    // 清理是同步的: Stop 返回时已开始的清理都已完成
    EXPECT_EQ(sweeps.load(), store_->purges.load());
}
