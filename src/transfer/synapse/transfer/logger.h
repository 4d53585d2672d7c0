#pragma once

#include <synapse/common/subsystem_logger.h>

namespace synapse
{
namespace transfer
{

// The transfer engine's logger.
common::SubsystemLogger& logger();

} // transfer
} // synapse
