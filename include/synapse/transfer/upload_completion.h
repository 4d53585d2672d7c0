#pragma once

#include <string>

#include <synapse/transfer/chunk_descriptor.h>
#include <synapse/transfer/file_identity.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

// Finalizes a multipart upload once every part has been stored.
class UploadCompletion
{
public:
    virtual ~UploadCompletion() = default;

    // Assemble the uploaded parts into the remote object.
    //
    // Parts are ordered by index and carry the ETag storage returned for
    // each. Returns whatever the backend uses to identify the new object.
    // Transient failures are retried by the engine.
    virtual TransferErrorOr<std::string> complete(const FileIdentity& identity,
                                                  const ChunkDescriptorVector& parts) = 0;
}; // UploadCompletion

} // transfer
} // synapse
