#pragma once

#include <cstdint>
#include <map>
#include <string>

#include <synapse/transfer/file_identity.h>
#include <synapse/transfer/transfer_direction.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

// A short-lived URL authorized to move one chunk.
struct SignedUrl
{
    // Where should the chunk be sent or fetched?
    std::string mUrl;

    // How should we talk to the URL? Empty selects GET for downloads and
    // PUT for uploads.
    std::string mMethod;

    // Headers the URL's signature depends on.
    std::map<std::string, std::string> mHeaders;
}; // SignedUrl

// Supplies signed URLs for individual chunks.
//
// The engine never refreshes URLs itself. An expired URL surfaces as an
// authorization-expired failure that the caller resolves by resubmitting.
class SignedUrlProvider
{
public:
    virtual ~SignedUrlProvider() = default;

    virtual TransferErrorOr<SignedUrl> url(const FileIdentity& identity,
                                           TransferDirection direction,
                                           std::uint32_t chunkIndex) = 0;
}; // SignedUrlProvider

} // transfer
} // synapse
