#include <iterator>

#include <synapse/transfer/transfer_direction.h>

namespace synapse
{
namespace transfer
{

const char* toString(TransferDirection direction)
{
    static const char* names[] = {
#define DEFINE_NAME(name, description) description,
        DEFINE_TRANSFER_DIRECTIONS(DEFINE_NAME)
#undef DEFINE_NAME
    }; // names

    if (direction < std::size(names))
        return names[direction];

    return "N/A";
}

} // transfer
} // synapse
