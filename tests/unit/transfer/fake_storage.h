#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include <synapse/transfer/http_client.h>
#include <synapse/transfer/signed_url_provider.h>
#include <synapse/transfer/upload_completion.h>

namespace synapse
{
namespace transfer
{
namespace testing
{

// How should a request misbehave?
struct Fault
{
    // Respond with this status, if nonzero.
    int mStatus = 0;

    // Fail below HTTP instead.
    bool mTransport = false;

    // Deliver only half of the requested content.
    bool mTruncate = false;

    // Hint sent alongside the status.
    std::optional<std::chrono::seconds> mRetryAfter;
}; // Fault

// An in-memory object store reachable through signed URLs.
class FakeStorage
  : public HttpClient
  , public SignedUrlProvider
  , public UploadCompletion
{
    // Identifies a single chunk of a single transfer.
    using ChunkKey = std::tuple<std::string, TransferDirection, std::uint32_t>;

    // Parse a URL we handed out.
    static std::optional<ChunkKey> parse(const std::string& url);

    TransferErrorOr<HttpResponse> download(HttpRequest& request,
                                           const std::string& handle,
                                           const Fault* fault);

    TransferErrorOr<HttpResponse> upload(HttpRequest& request, const ChunkKey& key);

    // Wait until a blocked request is released or cancelled.
    bool wait(HttpRequest& request, std::unique_lock<std::mutex>& lock);

    // Chunks whose requests should block.
    std::set<ChunkKey> mBlocked;

    // How many requests are blocked?
    std::size_t mBlockedCount;

    // How many completion calls have been made?
    std::size_t mCompletions;

    // Faults to inject into completion calls.
    std::vector<Fault> mCompletionFaults;

    std::condition_variable mCV;

    // Faults to inject, consumed one per request.
    std::map<ChunkKey, std::vector<Fault>> mFaults;

    // How many requests are executing?
    std::size_t mInFlight;

    mutable std::mutex mLock;

    // Most requests ever executing at once.
    std::size_t mMaximumInFlight;

    // Complete objects, keyed by handle.
    std::map<std::string, std::string> mObjects;

    // Should storage name uploaded parts?
    bool mOmitETags;

    // Uploaded parts, keyed by handle and index.
    std::map<std::string, std::map<std::uint32_t, std::string>> mParts;

    // Have blocked requests been released?
    bool mReleased;

    // How many requests have been made for each chunk?
    std::map<ChunkKey, std::size_t> mRequests;

    // How many URLs have been requested?
    std::size_t mURLs;

public:
    FakeStorage();

    // Make requests for a chunk block until released.
    void block(const std::string& handle,
               TransferDirection direction,
               std::uint32_t index);

    // Finalize a multipart upload.
    TransferErrorOr<std::string> complete(const FileIdentity& identity,
                                          const ChunkDescriptorVector& parts) override;

    std::size_t completions() const;

    // Inject a fault into the next request for a chunk.
    void fail(const std::string& handle,
              TransferDirection direction,
              std::uint32_t index,
              const Fault& fault,
              std::size_t count = 1u);

    // Inject a fault into the next completion call.
    void failCompletion(const Fault& fault, std::size_t count = 1u);

    std::size_t maximumInFlight() const;

    // Retrieve an object's content.
    std::optional<std::string> object(const std::string& handle) const;

    // Stop naming uploaded parts.
    void omitETags();

    TransferErrorOr<HttpResponse> perform(HttpRequest& request) override;

    // Store an object.
    void put(const std::string& handle, std::string content);

    // Let blocked requests proceed.
    void release();

    // How many requests were made for a chunk?
    std::size_t requests(const std::string& handle,
                         TransferDirection direction,
                         std::uint32_t index) const;

    // How many requests were made in total?
    std::size_t requests() const;

    TransferErrorOr<SignedUrl> url(const FileIdentity& identity,
                                   TransferDirection direction,
                                   std::uint32_t chunkIndex) override;

    std::size_t urls() const;

    // Wait until count requests are blocked.
    bool waitUntilBlocked(std::size_t count, std::chrono::milliseconds timeout);
}; // FakeStorage

} // testing
} // transfer
} // synapse
