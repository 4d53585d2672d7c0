#pragma once

#include <chrono>
#include <cstddef>

#include <synapse/common/task_executor_flags_forward.h>

namespace synapse
{
namespace common
{

struct TaskExecutorFlags
{
    // How long may a worker idle before it retires?
    std::chrono::seconds mIdleTime{30};

    // How many workers may run at once?
    std::size_t mMaxWorkers = 8u;

    // Workers are never retired below this count.
    std::size_t mMinWorkers = 0u;
}; // TaskExecutorFlags

} // common
} // synapse
