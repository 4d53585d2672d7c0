#pragma once

namespace synapse
{
namespace common
{

struct TaskExecutorFlags;

} // common
} // synapse
