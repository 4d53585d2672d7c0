#include <cassert>
#include <iterator>

#include <synapse/transfer/transfer_result.h>

namespace synapse
{
namespace transfer
{

const char* toDescription(TransferResult result)
{
    static const char* descriptions[] = {
#define DEFINE_DESCRIPTION(name, description) description,
        DEFINE_TRANSFER_RESULTS(DEFINE_DESCRIPTION)
#undef DEFINE_DESCRIPTION
    }; // descriptions

    if (result < std::size(descriptions))
        return descriptions[result];

    assert(false && "Unhandled transfer result enumerant");

    return "N/A";
}

const char* toString(TransferResult result)
{
    static const char* names[] = {
#define DEFINE_NAME(name, description) #name,
        DEFINE_TRANSFER_RESULTS(DEFINE_NAME)
#undef DEFINE_NAME
    }; // names

    if (result < std::size(names))
        return names[result];

    assert(false && "Unhandled transfer result enumerant");

    return "N/A";
}

} // transfer
} // synapse
