#pragma once

namespace synapse
{
namespace transfer
{

#define DEFINE_SESSION_STATUSES(expander) \
    expander(PENDING, "pending") \
    expander(IN_PROGRESS, "in progress") \
    expander(COMPLETED, "completed") \
    expander(FAILED, "failed") \
    expander(CANCELLED, "cancelled")

enum SessionStatus : unsigned int
{
#define DEFINE_ENUMERANT(name, description) SESSION_##name,
    DEFINE_SESSION_STATUSES(DEFINE_ENUMERANT)
#undef DEFINE_ENUMERANT
}; // SessionStatus

// Can a session leave this status?
bool terminal(SessionStatus status);

const char* toString(SessionStatus status);

} // transfer
} // synapse
