#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <synapse/common/task_executor.h>
#include <synapse/transfer/chunk_worker.h>
#include <synapse/transfer/http_client.h>
#include <synapse/transfer/local_cache.h>
#include <synapse/transfer/retry_policy.h>
#include <synapse/transfer/session_store.h>
#include <synapse/transfer/signed_url_provider.h>
#include <synapse/transfer/transfer_options.h>
#include <synapse/transfer/transfer_request.h>
#include <synapse/transfer/upload_completion.h>

namespace synapse
{
namespace transfer
{

class ProgressReporter;

// Moves files through a bounded pool of workers.
//
// Work from every submitted file is interleaved so that a large file
// can't starve smaller ones and so that no more than the configured
// number of work items ever execute at once.
class TransferScheduler
{
    enum WorkKind : unsigned int
    {
        // Consult the cache and plan the transfer.
        WK_PREPARE,
        // Move a single chunk.
        WK_CHUNK,
        // Verify and assemble the file.
        WK_FINALIZE
    }; // WorkKind

    struct WorkItem
    {
        WorkKind mKind;

        // Which chunk should be moved?
        ChunkDescriptor mChunk;
    }; // WorkItem

    struct Context;

    using ContextPtr = std::shared_ptr<Context>;

    // Reserve a session for context's exclusive use.
    //
    // Fails if another live transfer has already claimed key.
    std::optional<TransferError> claim(const ContextPtr& context, std::string key);

    // Record a transfer's outcome and wake anyone waiting for it.
    void conclude(ContextPtr context);

    // Hand ready work to the executor.
    void dispatch();

    // Make sure context's pending work will be dispatched.
    void enqueue(const ContextPtr& context);

    // Process a work item.
    //
    // Returns an error if the item failed.
    std::optional<TransferError> process(ContextPtr context, const WorkItem& item);

    std::optional<TransferError> processChunk(const ContextPtr& context,
                                              const ChunkDescriptor& chunk);

    std::optional<TransferError> processDownloadFinalize(const ContextPtr& context);

    std::optional<TransferError> processDownloadPrepare(const ContextPtr& context);

    std::optional<TransferError> processUploadFinalize(const ContextPtr& context);

    std::optional<TransferError> processUploadPrepare(const ContextPtr& context);

    // Plan a transfer once its session is known.
    std::optional<TransferError> schedule(const ContextPtr& context,
                                          TransferSessionPtr session);

    // Mark context as failed unless it already has.
    //
    // Returns true if the caller should conclude the transfer.
    bool failed(const ContextPtr& context, const TransferError& error);

    // Execute a work item on a pool thread.
    void run(ContextPtr context, WorkItem item, const common::Task& task);

    // Persist a session's progress.
    void save(const TransferSession& session);

    TransferOptions mOptions;

    HttpClient& mClient;

    UploadCompletion& mCompletion;

    ProgressReporter* mReporter;

    SignedUrlProvider& mUrls;

    RetryPolicy mPolicy;

    LocalCache mCache;

    SessionStore mStore;

    ChunkWorker mWorker;

    // Signalled when a transfer concludes or a work item finishes.
    std::condition_variable mCV;

    // How many work items are executing?
    std::size_t mActive;

    // Which transfer is using which session?
    std::map<std::string, TransferHandle> mClaims;

    // Every transfer we know about.
    std::map<TransferHandle, ContextPtr> mContexts;

    // Serializes access to our bookkeeping.
    mutable std::mutex mLock;

    TransferHandle mNextHandle;

    // Transfers with work waiting to be dispatched, in round-robin order.
    std::deque<ContextPtr> mReady;

    // Set when we're being torn down.
    bool mTerminating;

    // Must be destroyed before anything its workers touch.
    common::TaskExecutor mExecutor;

public:
    TransferScheduler(const TransferOptions& options,
                      HttpClient& client,
                      SignedUrlProvider& urls,
                      UploadCompletion& completion,
                      ProgressReporter* reporter = nullptr);

    // Cancels anything outstanding and waits for in-flight work.
    ~TransferScheduler();

    TransferScheduler(const TransferScheduler& other) = delete;

    TransferScheduler& operator=(const TransferScheduler& rhs) = delete;

    // Wait for a transfer to conclude.
    TransferOutcome await(TransferHandle handle);

    // As above but gives up after timeout.
    std::optional<TransferOutcome> await(TransferHandle handle,
                                         std::chrono::milliseconds timeout);

    LocalCache& cache();

    // Request that a transfer stop.
    //
    // Completed chunks are kept so the transfer can later be resumed.
    // Returns false if the transfer had already concluded.
    bool cancel(TransferHandle handle);

    const TransferOptions& options() const;

    // Forget a concluded transfer.
    //
    // Returns false if the transfer is unknown or still outstanding.
    bool release(TransferHandle handle);

    // How many transfers are we tracking?
    std::size_t size() const;

    // What state is a transfer in?
    std::optional<SessionStatus> status(TransferHandle handle) const;

    SessionStore& store();

    // Begin moving a file.
    //
    // A transfer that would share its session with one that's still
    // outstanding fails without touching that session.
    TransferHandle submit(TransferRequest request);
}; // TransferScheduler

} // transfer
} // synapse
