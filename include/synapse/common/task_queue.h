#pragma once

#include <chrono>
#include <functional>
#include <map>

#include <synapse/common/logger_forward.h>
#include <synapse/common/task_queue_forward.h>

namespace synapse
{
namespace common
{

using TaskFunction = std::function<void(const Task&)>;

// A handle to some work that will be performed at most once.
//
// Copies of a task refer to the same work.
class Task
{
    TaskContextPtr mContext;

public:
    Task() = default;

    Task(TaskFunction function, Logger& logger);

    operator bool() const;

    bool operator!() const;

    // Run the task's function with cancelled() returning true.
    //
    // The function still runs so that it can release whatever it holds.
    // Returns false if the task has already run.
    bool cancel();

    bool cancelled() const;

    // Run the task's function.
    //
    // Returns false if the task has already run.
    bool complete();

    bool completed() const;

    void reset();
}; // Task

// Tasks ordered by when they're due.
//
// Tasks due at the same time are dequeued in the order they were queued.
class TaskQueue
{
    using Clock = std::chrono::steady_clock;

    std::multimap<Clock::time_point, Task> mTasks;

public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue& other) = delete;

    // Cancels whatever is still queued.
    ~TaskQueue();

    TaskQueue& operator=(const TaskQueue& rhs) = delete;

    // Remove the task that is due first, if any.
    Task dequeue();

    bool empty() const;

    // Queue a task to be run no earlier than when.
    Task queue(Task task, Clock::time_point when);

    // Is the first task due?
    bool ready() const;

    std::size_t size() const;

    // When is the first task due?
    Clock::time_point when() const;
}; // TaskQueue

} // common
} // synapse
