#pragma once

namespace synapse
{
namespace common
{

template<typename E>
class Unexpected;

} // common
} // synapse
