#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <synapse/transfer/file_identity.h>
#include <synapse/transfer/session_status.h>
#include <synapse/transfer/transfer_direction.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

// Identifies a submitted transfer.
using TransferHandle = std::uint64_t;

struct TransferRequest
{
    TransferDirection mDirection = TD_DOWNLOAD;

    // What content is being moved?
    //
    // Uploads may leave the digest empty, in which case it is computed
    // from the local file.
    FileIdentity mIdentity;

    // Destination of a download or source of an upload.
    std::filesystem::path mLocalPath;

    // How should progress refer to this transfer? Empty selects the
    // local path's file name.
    std::string mName;

    // Should downloads consult and populate the local cache?
    bool mUseCache = true;
}; // TransferRequest

struct TransferOutcome
{
    SessionStatus mStatus = SESSION_PENDING;

    // Why did the transfer fail or get cancelled?
    std::optional<TransferError> mError;

    // What content was moved? Uploads carry their computed digest.
    FileIdentity mIdentity;

    std::filesystem::path mPath;

    // What did the backend call the uploaded object?
    std::string mRemoteResult;

    // Was the download satisfied by the local cache?
    bool mFromCache = false;

    // How many chunks were moved over the network by this run?
    std::size_t mChunksTransferred = 0u;
}; // TransferOutcome

} // transfer
} // synapse
