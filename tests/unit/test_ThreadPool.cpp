#include <gtest/gtest.h>
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <functional>
#include <stdexcept>

using namespace ib::concurrency;

namespace {

struct FnTask final : Task {
    std::function<void()> fn;
    explicit FnTask(std::function<void()> f) : fn(std::move(f)) {}
    void operator()() override { fn(); }
};

}

TEST(ThreadPoolTest, RunsEverySubmittedTaskBeforeStopping) {
    std::atomic<int> ran{0};
    {
        ThreadPool pool(3, "test");
        EXPECT_EQ(pool.workerCount(), 3u);
        for (int i = 0; i < 50; ++i) pool.submit(std::make_shared<FnTask>([&] { ++ran; }));
    }
    EXPECT_EQ(ran.load(), 50);
}

TEST(ThreadPoolTest, FailingTaskDoesNotKillWorker) {
    std::atomic<int> ran{0};
    ThreadPool pool(1, "test");
    pool.submit(std::make_shared<FnTask>([] { throw std::runtime_error("task failure"); }));
    pool.submit(std::make_shared<FnTask>([&] { ++ran; }));
    pool.stop();
    EXPECT_EQ(ran.load(), 1);
}

TEST(ThreadPoolTest, RejectsWorkAfterStop) {
    ThreadPool pool(1, "test");
    pool.stop();
    EXPECT_EQ(pool.workerCount(), 0u);
    EXPECT_THROW(pool.submit(std::make_shared<FnTask>([] {})), std::logic_error);
}

TEST(ThreadPoolTest, NeedsAWorker) {
    EXPECT_THROW(ThreadPool(0), std::invalid_argument);
}

TEST(ThreadPoolTest, RepeatedShutdownNeverHangs) {
    std::atomic<int> ran{0};
    for (int cycle = 0; cycle < 200; ++cycle) {
        ThreadPool pool(4, "churn");
        if (cycle % 2 == 0) pool.submit(std::make_shared<FnTask>([&] { ++ran; }));
    }
    EXPECT_EQ(ran.load(), 100);
}
