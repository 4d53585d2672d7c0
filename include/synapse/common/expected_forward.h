#pragma once

namespace synapse
{
namespace common
{

template<typename E, typename T>
class Expected;

} // common
} // synapse
