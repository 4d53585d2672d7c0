#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

#include <synapse/common/cancel_token.h>
#include <synapse/transfer/chunk_descriptor.h>
#include <synapse/transfer/digest.h>
#include <synapse/transfer/file_identity.h>
#include <synapse/transfer/http_client.h>
#include <synapse/transfer/retry_policy.h>
#include <synapse/transfer/signed_url_provider.h>
#include <synapse/transfer/transfer_direction.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

class ProgressReporter;
struct TransferOptions;

// Everything a worker needs to know about the file a chunk belongs to.
struct ChunkContext
{
    TransferDirection mDirection = TD_DOWNLOAD;

    FileIdentity mIdentity;

    // Where is the content being uploaded?
    std::filesystem::path mSource;

    // Where are downloaded chunks staged?
    std::filesystem::path mParts;

    // Interrupts the transfer when triggered.
    common::CancelToken mCancel;

    // Which transfer should progress be attributed to?
    std::uint64_t mProgressID = 0u;
}; // ChunkContext

// Moves a single chunk between local storage and a signed URL.
class ChunkWorker
{
    // Make a single attempt at downloading a chunk.
    TransferErrorOr<ChunkDescriptor> download(const ChunkDescriptor& chunk,
                                              const ChunkContext& context) const;

    // Report progress if anyone's interested.
    void progress(const ChunkContext& context, std::uint64_t delta) const;

    // Populate a request from a signed URL.
    HttpRequest request(const SignedUrl& url,
                        const char* defaultMethod,
                        const ChunkContext& context) const;

    // Make a single attempt at uploading a chunk.
    TransferErrorOr<ChunkDescriptor> upload(const ChunkDescriptor& chunk,
                                            const ChunkContext& context) const;

    HttpClient& mClient;

    std::chrono::milliseconds mConnectTimeout;

    HasherFactory mHasherFactory;

    const RetryPolicy& mPolicy;

    ProgressReporter* mReporter;

    std::chrono::milliseconds mRequestTimeout;

    SignedUrlProvider& mUrls;

public:
    ChunkWorker(HttpClient& client,
                SignedUrlProvider& urls,
                const RetryPolicy& policy,
                const TransferOptions& options,
                ProgressReporter* reporter = nullptr);

    // Where is a chunk staged while it is being downloaded?
    static std::filesystem::path partialPath(const std::filesystem::path& parts,
                                             std::uint32_t index);

    // Where is a chunk staged once it has been downloaded?
    static std::filesystem::path partPath(const std::filesystem::path& parts,
                                          std::uint32_t index);

    // Transfer a chunk, retrying as the policy permits.
    //
    // Uploaded chunks are returned with the ETag storage assigned them.
    TransferErrorOr<ChunkDescriptor> transfer(const ChunkDescriptor& chunk,
                                              const ChunkContext& context) const;
}; // ChunkWorker

} // transfer
} // synapse
