#pragma once

namespace synapse
{
namespace transfer
{

#define DEFINE_TRANSFER_DIRECTIONS(expander) \
    expander(DOWNLOAD, "download") \
    expander(UPLOAD, "upload")

enum TransferDirection : unsigned int
{
#define DEFINE_ENUMERANT(name, description) TD_##name,
    DEFINE_TRANSFER_DIRECTIONS(DEFINE_ENUMERANT)
#undef DEFINE_ENUMERANT
}; // TransferDirection

const char* toString(TransferDirection direction);

} // transfer
} // synapse
