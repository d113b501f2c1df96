// tests/test_expirysweeper.cpp
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "TestMocks.hpp"
#include "../src/cache/CacheManager.hpp"
#include "../src/cache/ExpirySweeper.hpp"

using namespace std::chrono_literals;
using ::testing::NiceMock;

class ExpirySweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = makeNiceLogger();
        statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
        clock_ = std::make_shared<ManualClock>();
        AppConfig config;
        config.invalidation_rules.clear();
        manager_ = std::make_unique<CacheManager>(config, logger_, statsd_, clock_);

        work_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(ioc_.get_executor());
        ioc_thread_ = std::thread([this]() { ioc_.run(); });
    }

    void TearDown() override {
        work_.reset();
        ioc_.stop();
        if (ioc_thread_.joinable()) {
            ioc_thread_.join();
        }
    }

    // Polls until condition holds or the deadline passes
    static bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds deadline = 2000ms) {
        auto until = std::chrono::steady_clock::now() + deadline;
        while (std::chrono::steady_clock::now() < until) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return condition();
    }

    std::shared_ptr<NiceMock<MockLogger>> logger_;
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<CacheManager> manager_;
    // Declared after manager_ so pending handlers are destroyed first
    net::io_context ioc_;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::thread ioc_thread_;
};

TEST_F(ExpirySweeperTest, PurgesExpiredEntriesInTheBackground) {
    manager_->put("sessions", "a", 1, 50ms);
    manager_->put("sessions", "b", 2, 50ms);
    manager_->put("sessions", "keep", 3);
    clock_->advance(100ms);

    auto sweeper = std::make_shared<ExpirySweeper>(ioc_, *manager_, 10ms, logger_);
    sweeper->start();
    EXPECT_TRUE(sweeper->isRunning());

    EXPECT_TRUE(waitFor([&]() { return manager_->cache("sessions").size() == 1; }));
    EXPECT_TRUE(manager_->cache("sessions").contains("keep"));
    EXPECT_GE(sweeper->sweepCount(), 1u);

    sweeper->stop();
}

TEST_F(ExpirySweeperTest, KeepsSweepingPeriodically) {
    auto sweeper = std::make_shared<ExpirySweeper>(ioc_, *manager_, 5ms, logger_);
    sweeper->start();

    EXPECT_TRUE(waitFor([&]() { return sweeper->sweepCount() >= 3; }));

    // Entries that expire later are picked up by later sweeps
    manager_->put("late", "k", 1, 20ms);
    clock_->advance(30ms);
    EXPECT_TRUE(waitFor([&]() { return manager_->cache("late").size() == 0; }));

    sweeper->stop();
}

TEST_F(ExpirySweeperTest, StopHaltsSweeping) {
    auto sweeper = std::make_shared<ExpirySweeper>(ioc_, *manager_, 5ms, logger_);
    sweeper->start();
    ASSERT_TRUE(waitFor([&]() { return sweeper->sweepCount() >= 1; }));

    sweeper->stop();
    EXPECT_FALSE(sweeper->isRunning());
    std::this_thread::sleep_for(30ms); // Let an in-progress sweep finish
    auto count = sweeper->sweepCount();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(sweeper->sweepCount(), count);

    EXPECT_NO_THROW(sweeper->stop()); // Idempotent
}

TEST_F(ExpirySweeperTest, StartTwiceIsHarmless) {
    auto sweeper = std::make_shared<ExpirySweeper>(ioc_, *manager_, 5ms, logger_);
    sweeper->start();
    sweeper->start();
    EXPECT_TRUE(waitFor([&]() { return sweeper->sweepCount() >= 2; }));
    sweeper->stop();
}

TEST_F(ExpirySweeperTest, RejectsInvalidArguments) {
    EXPECT_THROW(std::make_shared<ExpirySweeper>(ioc_, *manager_, 0ms, logger_), std::invalid_argument);
    EXPECT_THROW(std::make_shared<ExpirySweeper>(ioc_, *manager_, 10ms, nullptr), std::invalid_argument);
}
