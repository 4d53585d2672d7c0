#pragma once

#include <synapse/transfer/transfer_result_forward.h>

namespace synapse
{
namespace transfer
{

#define DEFINE_TRANSFER_RESULTS(expander) \
    expander(SUCCESS, "The transfer has succeeded") \
    expander(CANCELLED, "The transfer has been cancelled") \
    expander(TRANSIENT, "A transient network or server error occurred") \
    expander(AUTHORIZATION_EXPIRED, "The signed URL has expired or was rejected") \
    expander(INTEGRITY, "The content does not match its expected digest") \
    expander(FATAL, "The transfer failed and will not be retried") \
    expander(RETRIES_EXHAUSTED, "The transfer failed after exhausting its retries")

enum TransferResult : unsigned int
{
#define DEFINE_ENUMERANT(name, description) TRANSFER_##name,
    DEFINE_TRANSFER_RESULTS(DEFINE_ENUMERANT)
#undef DEFINE_ENUMERANT
}; // TransferResult

const char* toDescription(TransferResult result);

const char* toString(TransferResult result);

} // transfer
} // synapse
