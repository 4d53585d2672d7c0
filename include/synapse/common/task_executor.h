#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <synapse/common/logger_forward.h>
#include <synapse/common/task_executor_flags.h>
#include <synapse/common/task_queue.h>

namespace synapse
{
namespace common
{

// Runs tasks on a pool of threads.
//
// Threads are spawned on demand, up to a limit, and retire after
// they've been idle for a while.
class TaskExecutor
{
    using Clock = std::chrono::steady_clock;

    // Executed by each worker thread.
    void loop();

    // Join threads that have retired.
    //
    // The executor's lock must not be held.
    static void reap(std::vector<std::thread> retired);

    // Start a new worker thread.
    //
    // The executor's lock must be held.
    void spawn();

    // Signalled when tasks arrive or workers leave.
    std::condition_variable mCV;

    TaskExecutorFlags mFlags;

    // How many workers are waiting for something to do?
    std::size_t mIdle;

    mutable std::mutex mLock;

    Logger& mLogger;

    TaskQueue mQueue;

    // Workers that have left but haven't been joined.
    std::vector<std::thread> mRetired;

    bool mTerminating;

    std::map<std::thread::id, std::thread> mWorkers;

public:
    TaskExecutor(const TaskExecutorFlags& flags, Logger& logger);

    TaskExecutor(const TaskExecutor& other) = delete;

    // Waits for every worker to leave.
    //
    // Tasks that haven't started are cancelled.
    ~TaskExecutor();

    TaskExecutor& operator=(const TaskExecutor& rhs) = delete;

    // Run function no earlier than when.
    //
    // If spawnWorker is true and every worker is busy, a new worker
    // is started, provided we're below our limit.
    Task execute(TaskFunction function,
                 Clock::time_point when,
                 bool spawnWorker);

    template<typename Rep, typename Period>
    Task execute(TaskFunction function,
                 std::chrono::duration<Rep, Period> delay,
                 bool spawnWorker)
    {
        return execute(std::move(function), Clock::now() + delay, spawnWorker);
    }

    Task execute(TaskFunction function, bool spawnWorker)
    {
        return execute(std::move(function), Clock::now(), spawnWorker);
    }

    // How many worker threads are alive?
    std::size_t workers() const;
}; // TaskExecutor

} // common
} // synapse
