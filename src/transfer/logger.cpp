#include <synapse/transfer/logger.h>

namespace synapse
{
namespace transfer
{

common::SubsystemLogger& logger()
{
    static common::SubsystemLogger logger("Transfer");

    return logger;
}

} // transfer
} // synapse
