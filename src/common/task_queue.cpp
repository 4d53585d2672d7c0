#include <atomic>
#include <stdexcept>
#include <utility>

#include <synapse/common/logging.h>
#include <synapse/common/task_queue.h>

namespace synapse
{
namespace common
{

class TaskContext
{
    enum TaskState : unsigned int
    {
        TS_PENDING,
        TS_COMPLETED,
        TS_CANCELLED
    }; // TaskState

    // Move the task out of the pending state and run its function.
    bool run(TaskState state, const Task& task);

    TaskFunction mFunction;

    // Where do we report exceptions escaping mFunction?
    Logger& mLogger;

    std::atomic<TaskState> mState;

public:
    TaskContext(TaskFunction function, Logger& logger);

    bool cancel(const Task& task)
    {
        return run(TS_CANCELLED, task);
    }

    bool cancelled() const
    {
        return mState.load() == TS_CANCELLED;
    }

    bool complete(const Task& task)
    {
        return run(TS_COMPLETED, task);
    }

    bool completed() const
    {
        return mState.load() != TS_PENDING;
    }
}; // TaskContext

bool TaskContext::run(TaskState state, const Task& task)
{
    auto expected = TS_PENDING;

    // Someone else got here first.
    if (!mState.compare_exchange_strong(expected, state))
        return false;

    try
    {
        mFunction(task);
    }
    catch (std::exception& exception)
    {
        LogWarningF(mLogger,
                    "Task threw an exception: %s",
                    exception.what());
    }
    catch (...)
    {
        LogWarning1(mLogger, "Task threw an unknown exception");
    }

    // Drop whatever the function captured.
    mFunction = nullptr;

    return true;
}

TaskContext::TaskContext(TaskFunction function, Logger& logger)
  : mFunction(std::move(function))
  , mLogger(logger)
  , mState(TS_PENDING)
{
}

Task::Task(TaskFunction function, Logger& logger)
  : mContext(std::make_shared<TaskContext>(std::move(function), logger))
{
}

Task::operator bool() const
{
    return !!mContext;
}

bool Task::operator!() const
{
    return !mContext;
}

bool Task::cancel()
{
    return mContext && mContext->cancel(*this);
}

bool Task::cancelled() const
{
    return mContext && mContext->cancelled();
}

bool Task::complete()
{
    return mContext && mContext->complete(*this);
}

bool Task::completed() const
{
    return mContext && mContext->completed();
}

void Task::reset()
{
    mContext.reset();
}

TaskQueue::~TaskQueue()
{
    while (!mTasks.empty())
        dequeue().cancel();
}

Task TaskQueue::dequeue()
{
    if (mTasks.empty())
        return Task();

    auto i = mTasks.begin();
    auto task = std::move(i->second);

    mTasks.erase(i);

    return task;
}

bool TaskQueue::empty() const
{
    return mTasks.empty();
}

Task TaskQueue::queue(Task task, Clock::time_point when)
{
    // Nothing left to do.
    if (!task || task.completed())
        return task;

    // Equal keys are inserted after those already present.
    mTasks.emplace(when, task);

    return task;
}

bool TaskQueue::ready() const
{
    return !mTasks.empty() && Clock::now() >= when();
}

std::size_t TaskQueue::size() const
{
    return mTasks.size();
}

TaskQueue::Clock::time_point TaskQueue::when() const
{
    if (mTasks.empty())
        return Clock::time_point::max();

    return mTasks.begin()->first;
}

} // common
} // synapse
