#include <iterator>

#include <synapse/transfer/session_status.h>

namespace synapse
{
namespace transfer
{

bool terminal(SessionStatus status)
{
    switch (status)
    {
    case SESSION_COMPLETED:
    case SESSION_FAILED:
    case SESSION_CANCELLED:
        return true;
    default:
        return false;
    }
}

const char* toString(SessionStatus status)
{
    static const char* names[] = {
#define DEFINE_NAME(name, description) description,
        DEFINE_SESSION_STATUSES(DEFINE_NAME)
#undef DEFINE_NAME
    }; // names

    if (status < std::size(names))
        return names[status];

    return "N/A";
}

} // transfer
} // synapse
