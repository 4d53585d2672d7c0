#pragma once

namespace synapse
{
namespace transfer
{

enum TransferResult : unsigned int;

} // transfer
} // synapse
