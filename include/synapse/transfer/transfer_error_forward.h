#pragma once

#include <synapse/common/expected_forward.h>

namespace synapse
{
namespace transfer
{

class TransferError;

template<typename T>
using TransferErrorOr = common::Expected<TransferError, T>;

} // transfer
} // synapse
