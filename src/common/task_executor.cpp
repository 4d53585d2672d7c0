#include <utility>

#include <synapse/common/logging.h>
#include <synapse/common/task_executor.h>

namespace synapse
{
namespace common
{

void TaskExecutor::loop()
{
    std::unique_lock<std::mutex> lock(mLock);

    LogDebug1(mLogger, "Worker started");

    while (!mTerminating)
    {
        if (!mQueue.ready())
        {
            auto deadline = mQueue.empty() ? Clock::now() + mFlags.mIdleTime
                                           : mQueue.when();

            auto status = mCV.wait_until(lock, deadline);

            // Retire if we've had nothing to do for a while.
            if (status == std::cv_status::timeout
                && mQueue.empty()
                && mWorkers.size() > mFlags.mMinWorkers)
                break;

            continue;
        }

        auto task = mQueue.dequeue();

        --mIdle;

        lock.unlock();

        task.complete();

        lock.lock();

        ++mIdle;
    }

    LogDebugF(mLogger, "Worker leaving (%zu remain)", mWorkers.size() - 1);

    --mIdle;

    // We can't join ourselves so leave that to someone else.
    auto i = mWorkers.find(std::this_thread::get_id());

    mRetired.emplace_back(std::move(i->second));
    mWorkers.erase(i);

    mCV.notify_all();
}

void TaskExecutor::reap(std::vector<std::thread> retired)
{
    for (auto& thread : retired)
        thread.join();
}

void TaskExecutor::spawn()
{
    std::thread thread(&TaskExecutor::loop, this);

    // The worker can't run until we release the lock.
    auto id = thread.get_id();

    mWorkers.emplace(id, std::move(thread));

    ++mIdle;
}

TaskExecutor::TaskExecutor(const TaskExecutorFlags& flags, Logger& logger)
  : mCV()
  , mFlags(flags)
  , mIdle(0u)
  , mLock()
  , mLogger(logger)
  , mQueue()
  , mRetired()
  , mTerminating(false)
  , mWorkers()
{
    LogDebugF(mLogger, "Executor constructed (max workers: %zu)", mFlags.mMaxWorkers);
}

TaskExecutor::~TaskExecutor()
{
    std::unique_lock<std::mutex> lock(mLock);

    mTerminating = true;

    mCV.notify_all();
    mCV.wait(lock, [&]() { return mWorkers.empty(); });

    auto retired = std::move(mRetired);

    mRetired.clear();

    lock.unlock();

    reap(std::move(retired));

    LogDebug1(mLogger, "Executor destroyed");
}

Task TaskExecutor::execute(TaskFunction function,
                           Clock::time_point when,
                           bool spawnWorker)
{
    Task task(std::move(function), mLogger);

    std::unique_lock<std::mutex> lock(mLock);

    if (mTerminating)
    {
        lock.unlock();

        task.cancel();

        return task;
    }

    // Spawn if we have no workers or if every worker will be busy.
    spawnWorker = mWorkers.empty() || (spawnWorker && mIdle <= mQueue.size());

    if (spawnWorker && mWorkers.size() < mFlags.mMaxWorkers)
        spawn();

    mQueue.queue(task, when);

    auto retired = std::move(mRetired);

    mRetired.clear();

    lock.unlock();

    mCV.notify_one();

    reap(std::move(retired));

    return task;
}

std::size_t TaskExecutor::workers() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mWorkers.size();
}

} // common
} // synapse
