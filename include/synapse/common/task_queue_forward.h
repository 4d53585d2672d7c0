#pragma once

#include <memory>

namespace synapse
{
namespace common
{

class Task;
class TaskContext;
class TaskQueue;

using TaskContextPtr = std::shared_ptr<TaskContext>;

} // common
} // synapse
