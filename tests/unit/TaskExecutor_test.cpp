#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <synapse/common/logger.h>
#include <synapse/common/task_executor.h>

using namespace synapse::common;

using std::chrono::milliseconds;
using std::chrono::seconds;

static TaskExecutorFlags flags(std::size_t maxWorkers)
{
    TaskExecutorFlags flags;

    flags.mIdleTime = seconds(1);
    flags.mMaxWorkers = maxWorkers;

    return flags;
}

TEST(TaskExecutor, ExecutesTasks)
{
    TaskExecutor executor(flags(2), logger());

    std::promise<int> result;

    auto task = executor.execute([&](const Task& task) {
        result.set_value(task.cancelled() ? -1 : 42);
    }, true);

    auto future = result.get_future();

    ASSERT_EQ(future.wait_for(seconds(10)), std::future_status::ready);
    EXPECT_EQ(future.get(), 42);
    EXPECT_TRUE(task);
}

TEST(TaskExecutor, DelayedTasksRunInOrder)
{
    TaskExecutor executor(flags(1), logger());

    std::mutex lock;
    std::condition_variable cv;
    std::vector<int> order;

    auto record = [&](int value) {
        return [&, value](const Task&) {
            std::lock_guard<std::mutex> guard(lock);

            order.emplace_back(value);

            cv.notify_all();
        };
    };

    executor.execute(record(3), milliseconds(60), false);
    executor.execute(record(2), milliseconds(30), false);
    executor.execute(record(1), false);

    std::unique_lock<std::mutex> guard(lock);

    ASSERT_TRUE(cv.wait_for(guard, seconds(10), [&]() { return order.size() == 3; }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TaskExecutor, HonorsWorkerLimit)
{
    TaskExecutor executor(flags(3), logger());

    std::atomic<int> active{0};
    std::atomic<int> maximum{0};
    std::atomic<int> finished{0};

    for (auto i = 0; i < 12; ++i)
    {
        executor.execute([&](const Task&) {
            auto now = ++active;
            auto seen = maximum.load();

            while (now > seen && !maximum.compare_exchange_weak(seen, now))
                ;

            std::this_thread::sleep_for(milliseconds(5));

            --active;
            ++finished;
        }, true);
    }

    auto deadline = std::chrono::steady_clock::now() + seconds(10);

    while (finished.load() < 12 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(milliseconds(1));

    EXPECT_EQ(finished.load(), 12);
    EXPECT_LE(maximum.load(), 3);
    EXPECT_LE(executor.workers(), 3u);
}

TEST(TaskExecutor, CancelledTaskStillRuns)
{
    std::promise<bool> cancelled;

    Task task;

    {
        TaskExecutor executor(flags(1), logger());

        // Far enough in the future that it won't run before we cancel it.
        task = executor.execute([&](const Task& self) {
            cancelled.set_value(self.cancelled());
        }, seconds(60), false);

        EXPECT_TRUE(task.cancel());
        EXPECT_FALSE(task.cancel());
    }

    auto future = cancelled.get_future();

    ASSERT_EQ(future.wait_for(seconds(1)), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_TRUE(task.cancelled());
}

TEST(TaskExecutor, QueuedTasksAreCancelledOnDestruction)
{
    std::promise<bool> cancelled;

    {
        TaskExecutor executor(flags(1), logger());

        executor.execute([&](const Task& task) {
            cancelled.set_value(task.cancelled());
        }, seconds(60), false);
    }

    auto future = cancelled.get_future();

    ASSERT_EQ(future.wait_for(seconds(1)), std::future_status::ready);
    EXPECT_TRUE(future.get());
}

TEST(TaskExecutor, ExceptionsAreContained)
{
    TaskExecutor executor(flags(1), logger());

    std::promise<void> ran;

    executor.execute([](const Task&) {
        throw std::runtime_error("task failed");
    }, false);

    executor.execute([&](const Task&) {
        ran.set_value();
    }, false);

    auto future = ran.get_future();

    EXPECT_EQ(future.wait_for(seconds(10)), std::future_status::ready);
}
