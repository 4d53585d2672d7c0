#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <synapse/common/scoped_helpers.h>
#include <synapse/common/utility.h>
#include <synapse/transfer/file_utilities.h>
#include <synapse/transfer/logging.h>
#include <synapse/transfer/progress_reporter.h>
#include <synapse/transfer/transfer_scheduler.h>

namespace synapse
{
namespace transfer
{

namespace fs = std::filesystem;

// How much content do we shuffle at once when assembling files?
constexpr std::size_t kAssemblyBufferSize = 1u << 16;

struct TransferScheduler::Context
{
    Context(TransferHandle handle, TransferRequest request)
      : mHandle(handle)
      , mRequest(std::move(request))
    {
    }

    TransferHandle mHandle;

    TransferRequest mRequest;

    // Interrupts this transfer's work when triggered.
    common::CancelToken mCancel;

    // What our chunk workers need to know.
    ChunkContext mChunkContext;

    // Created once the transfer has been prepared.
    TransferSessionPtr mSession;

    // Key of the session we've claimed, if any.
    std::string mKey;

    // Work waiting to be dispatched.
    std::deque<WorkItem> mPending;

    // How many of our work items are executing?
    std::size_t mInFlight = 0u;

    // Are we in the scheduler's ready queue?
    bool mQueued = false;

    // Is the transfer being concluded?
    bool mConcluding = false;

    // Why did the transfer fail?
    std::optional<TransferError> mFailure;

    // Has the transfer succeeded?
    bool mSucceeded = false;

    // Has the session's persisted state been thrown away?
    bool mDiscarded = false;

    // Populated as the transfer progresses.
    TransferOutcome mResult;

    // Available once the transfer has concluded.
    std::optional<TransferOutcome> mOutcome;
}; // Context

void TransferScheduler::conclude(ContextPtr context)
{
    auto& result = context->mResult;

    {
        std::lock_guard<std::mutex> guard(mLock);

        if (context->mSucceeded)
        {
            result.mStatus = SESSION_COMPLETED;
        }
        else
        {
            if (!context->mFailure)
                context->mFailure = TransferError(TRANSFER_FATAL,
                                                  "Transfer concluded without success");

            result.mError = context->mFailure;

            if (context->mFailure->result() == TRANSFER_CANCELLED)
                result.mStatus = SESSION_CANCELLED;
            else
                result.mStatus = SESSION_FAILED;
        }
    }

    // Make sure the session reflects how the transfer concluded.
    if (auto& session = context->mSession)
    {
        if (result.mStatus == SESSION_CANCELLED)
            session->cancel();
        else if (result.mStatus == SESSION_FAILED)
            session->fail(*result.mError);

        // Keep completed chunks around for a later attempt.
        if (result.mStatus != SESSION_COMPLETED && !context->mDiscarded)
            save(*session);
    }

    if (result.mStatus == SESSION_COMPLETED)
        TXInfoF("%s of %s completed%s",
                toString(context->mRequest.mDirection),
                result.mIdentity.toString().c_str(),
                result.mFromCache ? " from cache" : "");
    else
        TXWarningF("%s of %s %s: %s",
                   toString(context->mRequest.mDirection),
                   result.mIdentity.toString().c_str(),
                   toString(result.mStatus),
                   result.mError->toString().c_str());

    if (mReporter)
        mReporter->finish(context->mHandle,
                          result.mError ? result.mError->result() : TRANSFER_SUCCESS);

    std::lock_guard<std::mutex> guard(mLock);

    // Let a later transfer pick up where we left off.
    if (!context->mKey.empty())
    {
        auto i = mClaims.find(context->mKey);

        if (i != mClaims.end() && i->second == context->mHandle)
            mClaims.erase(i);
    }

    context->mOutcome = result;

    mCV.notify_all();
}

std::optional<TransferError> TransferScheduler::claim(const ContextPtr& context,
                                                      std::string key)
{
    std::lock_guard<std::mutex> guard(mLock);

    auto i = mClaims.find(key);

    // Two transfers can't share a session's staged parts.
    if (i != mClaims.end() && i->second != context->mHandle)
        return TransferError(TRANSFER_FATAL,
                             common::format("%s is already being transferred by transfer %llu",
                                            context->mRequest.mLocalPath.string().c_str(),
                                            static_cast<unsigned long long>(i->second)));

    mClaims.emplace(key, context->mHandle);

    context->mKey = std::move(key);

    return std::nullopt;
}

void TransferScheduler::dispatch()
{
    std::vector<std::pair<ContextPtr, WorkItem>> items;

    {
        std::lock_guard<std::mutex> guard(mLock);

        while (mActive < mOptions.mConcurrency && !mReady.empty())
        {
            auto context = std::move(mReady.front());

            mReady.pop_front();

            context->mQueued = false;

            if (context->mPending.empty())
                continue;

            auto item = std::move(context->mPending.front());

            context->mPending.pop_front();

            ++context->mInFlight;
            ++mActive;

            // Give other transfers a turn before we take another item.
            enqueue(context);

            items.emplace_back(std::move(context), std::move(item));
        }
    }

    for (auto& i : items)
    {
        auto context = std::move(i.first);
        auto item = std::move(i.second);

        mExecutor.execute([this, context, item](const common::Task& task) {
            run(context, item, task);
        }, true);
    }
}

void TransferScheduler::enqueue(const ContextPtr& context)
{
    if (context->mQueued || context->mPending.empty())
        return;

    context->mQueued = true;

    mReady.emplace_back(context);
}

bool TransferScheduler::failed(const ContextPtr& context, const TransferError& error)
{
    if (!context->mFailure && !context->mSucceeded)
    {
        context->mFailure = error;
        context->mPending.clear();
        context->mCancel.trigger();
    }

    // Conclude once nothing else is executing on the transfer's behalf.
    if (context->mConcluding || context->mInFlight || !context->mPending.empty())
        return false;

    return context->mConcluding = true;
}

std::optional<TransferError> TransferScheduler::process(ContextPtr context,
                                                        const WorkItem& item)
{
    auto direction = context->mRequest.mDirection;

    switch (item.mKind)
    {
    case WK_PREPARE:
        if (direction == TD_DOWNLOAD)
            return processDownloadPrepare(context);
        return processUploadPrepare(context);
    case WK_CHUNK:
        return processChunk(context, item.mChunk);
    case WK_FINALIZE:
        if (direction == TD_DOWNLOAD)
            return processDownloadFinalize(context);
        return processUploadFinalize(context);
    }

    throw TXErrorF("Unknown work item kind: %u", item.mKind);
}

std::optional<TransferError> TransferScheduler::processChunk(const ContextPtr& context,
                                                             const ChunkDescriptor& chunk)
{
    auto& session = *context->mSession;

    auto result = mWorker.transfer(chunk, context->mChunkContext);

    if (!result)
        return std::move(result).error();

    auto last = session.markComplete(chunk.mIndex, result->mETag);

    save(session);

    std::lock_guard<std::mutex> guard(mLock);

    ++context->mResult.mChunksTransferred;

    // Assemble the file once its last chunk has arrived.
    if (last && !context->mFailure)
    {
        context->mPending.push_back(WorkItem{WK_FINALIZE, ChunkDescriptor()});

        enqueue(context);
    }

    return std::nullopt;
}

std::optional<TransferError> TransferScheduler::processDownloadFinalize(const ContextPtr& context)
{
    auto& session = *context->mSession;
    auto& identity = session.identity();
    auto& target = session.path();

    std::error_code error;

    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), error);

    if (error)
        return TransferError(TRANSFER_FATAL,
                             "Couldn't create " + target.parent_path().string()
                             + ": " + error.message());

    auto partial = temporaryPath(target);
    auto hasher = mOptions.mHasherFactory();

    // Assemble the staged chunks, in order, beside the destination.
    {
        std::ofstream output(partial, std::ios::binary | std::ios::trunc);
        std::vector<char> buffer(kAssemblyBufferSize);

        if (!output)
            return TransferError(TRANSFER_FATAL, "Couldn't create " + partial.string());

        for (auto& chunk : session.chunks())
        {
            // Stop at the next chunk boundary if we've been cancelled.
            if (context->mCancel.triggered())
            {
                output.close();
                removeQuietly(partial);

                return TransferError(TRANSFER_CANCELLED, "Assembly was cancelled");
            }

            auto part = mStore.partPath(session.key(), chunk.mIndex);
            std::ifstream input(part, std::ios::binary);
            std::uint64_t copied = 0;

            while (input && copied < chunk.mLength)
            {
                input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));

                auto count = static_cast<std::size_t>(input.gcount());

                hasher->update(buffer.data(), count);
                output.write(buffer.data(), static_cast<std::streamsize>(count));

                copied += count;
            }

            if (copied != chunk.mLength)
            {
                output.close();
                removeQuietly(partial);

                // Make sure a later attempt fetches the chunk again.
                session.discard(chunk.mIndex);

                return TransferError(TRANSFER_FATAL,
                                     common::format("Staged chunk %u is damaged", chunk.mIndex));
            }
        }

        output.flush();

        if (!output)
        {
            output.close();
            removeQuietly(partial);

            return TransferError(TRANSFER_FATAL, "Couldn't write " + partial.string());
        }
    }

    auto digest = hasher->finish();
    auto verified = session.complete(digest);

    if (!verified)
    {
        removeQuietly(partial);

        // Content can't be trusted so throw it all away.
        if (verified.error().result() == TRANSFER_INTEGRITY)
        {
            mStore.remove(session.key());

            std::lock_guard<std::mutex> guard(mLock);

            context->mDiscarded = true;
        }

        return std::move(verified).error();
    }

    fs::rename(partial, target, error);

    if (error)
    {
        removeQuietly(partial);

        return TransferError(TRANSFER_FATAL,
                             "Couldn't move " + partial.string()
                             + " into place: " + error.message());
    }

    if (context->mRequest.mUseCache)
    {
        auto entry = mCache.commit(identity, target);

        // The download's still good even if we couldn't cache it.
        if (!entry)
            TXWarningF("Couldn't cache %s: %s",
                       identity.toString().c_str(),
                       entry.error().toString().c_str());
    }

    mStore.remove(session.key());

    std::lock_guard<std::mutex> guard(mLock);

    context->mDiscarded = true;
    context->mSucceeded = true;

    return std::nullopt;
}

std::optional<TransferError> TransferScheduler::processDownloadPrepare(const ContextPtr& context)
{
    auto& request = context->mRequest;
    auto& identity = request.mIdentity;

    if (!LocalCache::valid(identity))
        return TransferError(TRANSFER_FATAL,
                             "Can't download " + identity.toString()
                             + ": a handle and expected digest are required");

    if (request.mLocalPath.empty())
        return TransferError(TRANSFER_FATAL, "Downloads require a destination");

    auto key = TransferSession::key(identity, TD_DOWNLOAD, request.mLocalPath);

    if (auto error = claim(context, std::move(key)))
        return error;

    std::optional<fs::path> cached;

    if (request.mUseCache)
        cached = mCache.lookup(identity);

    // Satisfy the download from the cache.
    if (cached)
    {
        std::error_code error;

        if (request.mLocalPath.has_parent_path())
            fs::create_directories(request.mLocalPath.parent_path(), error);

        if (error)
            return TransferError(TRANSFER_FATAL,
                                 "Couldn't create "
                                 + request.mLocalPath.parent_path().string()
                                 + ": " + error.message());

        // Destination may already be the cached file.
        if (!fs::equivalent(*cached, request.mLocalPath, error))
        {
            auto copied = copyAtomically(*cached, request.mLocalPath);

            if (!copied)
                return std::move(copied).error();
        }

        TXDebugF("Satisfied download of %s from %s",
                 identity.toString().c_str(),
                 cached->string().c_str());

        if (mReporter)
            mReporter->begin(context->mHandle,
                             context->mRequest.mName,
                             identity.size(),
                             identity.size());

        std::lock_guard<std::mutex> guard(mLock);

        context->mResult.mFromCache = true;
        context->mSucceeded = true;

        return std::nullopt;
    }

    return schedule(context,
                    mStore.open(identity,
                                TD_DOWNLOAD,
                                request.mLocalPath,
                                mOptions.mChunkSize));
}

std::optional<TransferError> TransferScheduler::processUploadFinalize(const ContextPtr& context)
{
    auto& session = *context->mSession;
    auto& identity = session.identity();

    // Make sure the file didn't change while we were uploading it.
    auto hasher = mOptions.mHasherFactory();
    auto digest = digestFile(session.path(), *hasher);

    if (!digest)
        return std::move(digest).error();

    if (*digest != identity.digest())
    {
        // Parts no longer describe the file.
        mStore.remove(session.key());

        std::lock_guard<std::mutex> guard(mLock);

        context->mDiscarded = true;

        return TransferError(TRANSFER_INTEGRITY,
                             "Content of " + session.path().string()
                             + " changed during upload");
    }

    auto parts = session.completedChunks();
    auto what = "Completion of " + identity.toString();

    auto result = mPolicy.run([&](RetryState&) {
        return mCompletion.complete(identity, parts);
    }, context->mCancel, what.c_str());

    if (!result)
        return std::move(result).error();

    auto completed = session.complete(*digest);

    if (!completed)
        return std::move(completed).error();

    mStore.remove(session.key());

    std::lock_guard<std::mutex> guard(mLock);

    context->mDiscarded = true;
    context->mResult.mRemoteResult = std::move(*result);
    context->mSucceeded = true;

    return std::nullopt;
}

std::optional<TransferError> TransferScheduler::processUploadPrepare(const ContextPtr& context)
{
    auto& request = context->mRequest;
    auto& identity = request.mIdentity;
    auto& source = request.mLocalPath;

    if (identity.handle().empty())
        return TransferError(TRANSFER_FATAL, "Uploads require a handle");

    std::error_code error;

    auto size = fs::file_size(source, error);

    if (error)
        return TransferError(TRANSFER_FATAL,
                             "Couldn't inspect " + source.string()
                             + ": " + error.message());

    auto hasher = mOptions.mHasherFactory();
    auto digest = digestFile(source, *hasher);

    if (!digest)
        return std::move(digest).error();

    // Caller told us what content to expect.
    if (!identity.digest().empty()
        && (identity.digest() != *digest || identity.size() != size))
        return TransferError(TRANSFER_INTEGRITY,
                             common::format("%s doesn't match %s",
                                            source.string().c_str(),
                                            identity.toString().c_str()));

    auto actual = identity.withContent(*digest, size);

    if (auto error = claim(context, TransferSession::key(actual, TD_UPLOAD, source)))
        return error;

    {
        std::lock_guard<std::mutex> guard(mLock);

        context->mResult.mIdentity = actual;
    }

    return schedule(context,
                    mStore.open(actual, TD_UPLOAD, source, mOptions.mChunkSize));
}

std::optional<TransferError> TransferScheduler::schedule(const ContextPtr& context,
                                                         TransferSessionPtr session)
{
    session->start();

    auto& chunkContext = context->mChunkContext;

    chunkContext.mCancel = context->mCancel;
    chunkContext.mDirection = session->direction();
    chunkContext.mIdentity = session->identity();
    chunkContext.mParts = mStore.partsPath(session->key());
    chunkContext.mProgressID = context->mHandle;
    chunkContext.mSource = session->path();

    auto pending = session->pendingChunks();

    if (pending.size() < session->chunks().size())
        TXInfoF("Resuming %s: %zu of %zu chunks remain",
                session->identity().toString().c_str(),
                pending.size(),
                session->chunks().size());

    if (mReporter)
        mReporter->begin(context->mHandle,
                         context->mRequest.mName,
                         session->identity().size(),
                         session->bytesCompleted());

    save(*session);

    std::lock_guard<std::mutex> guard(mLock);

    context->mSession = session;

    // Transfer was cancelled while we were preparing it.
    if (context->mFailure)
        return std::nullopt;

    for (auto& chunk : pending)
        context->mPending.push_back(WorkItem{WK_CHUNK, chunk});

    // Every chunk was moved by an earlier run.
    if (pending.empty())
        context->mPending.push_back(WorkItem{WK_FINALIZE, ChunkDescriptor()});

    enqueue(context);

    return std::nullopt;
}

void TransferScheduler::run(ContextPtr context, WorkItem item, const common::Task& task)
{
    std::optional<TransferError> error;

    if (task.cancelled() || context->mCancel.triggered())
    {
        error = TransferError(TRANSFER_CANCELLED, "Transfer was cancelled");
    }
    else
    {
        try
        {
            error = process(context, item);
        }
        catch (std::exception& exception)
        {
            error = TransferError(TRANSFER_FATAL, exception.what());
        }
        catch (...)
        {
            TXWarningF("Transfer %llu threw an unknown exception",
                       static_cast<unsigned long long>(context->mHandle));

            error = TransferError(TRANSFER_FATAL, "Unknown exception");
        }
    }

    {
        // Our slot must be returned even if concluding throws.
        auto slot = common::makeScopedDestructor([this]() {
            std::lock_guard<std::mutex> guard(mLock);

            --mActive;

            mCV.notify_all();
        });

        auto concluding = false;

        {
            std::lock_guard<std::mutex> guard(mLock);

            --context->mInFlight;

            if (error)
                concluding = failed(context, *error);
            else if (!context->mConcluding
                     && !context->mInFlight
                     && context->mPending.empty())
                concluding = context->mConcluding = true;
        }

        if (concluding)
            conclude(context);
    }

    dispatch();
}

void TransferScheduler::save(const TransferSession& session)
{
    auto saved = mStore.save(session);

    // Losing the record only costs us the ability to resume.
    if (!saved)
        TXWarningF("Couldn't persist session %s: %s",
                   session.key().c_str(),
                   saved.error().toString().c_str());
}

TransferScheduler::TransferScheduler(const TransferOptions& options,
                                     HttpClient& client,
                                     SignedUrlProvider& urls,
                                     UploadCompletion& completion,
                                     ProgressReporter* reporter)
  : mOptions(normalize(options))
  , mClient(client)
  , mCompletion(completion)
  , mReporter(reporter)
  , mUrls(urls)
  , mPolicy(mOptions.mRetry)
  , mCache(mOptions.mCacheRoot)
  , mStore(mOptions.mStateDirectory, mOptions.mChunkLimits)
  , mWorker(mClient, mUrls, mPolicy, mOptions, mReporter)
  , mCV()
  , mActive(0u)
  , mClaims()
  , mContexts()
  , mLock()
  , mNextHandle(0u)
  , mReady()
  , mTerminating(false)
  , mExecutor([&]() {
        common::TaskExecutorFlags flags;

        flags.mIdleTime = mOptions.mIdleTime;
        flags.mMaxWorkers = mOptions.mConcurrency;

        return flags;
    }(), logger())
{
    TXInfoF("Scheduler constructed (concurrency: %zu)", mOptions.mConcurrency);
}

TransferScheduler::~TransferScheduler()
{
    std::vector<ContextPtr> concluding;

    std::unique_lock<std::mutex> lock(mLock);

    mTerminating = true;

    // Cancel anything that's still outstanding.
    for (auto& c : mContexts)
    {
        if (c.second->mOutcome)
            continue;

        if (failed(c.second, TransferError(TRANSFER_CANCELLED, "Scheduler is shutting down")))
            concluding.emplace_back(c.second);
    }

    mReady.clear();

    lock.unlock();

    for (auto& context : concluding)
        conclude(context);

    lock.lock();

    // Wait for in-flight work to drain.
    mCV.wait(lock, [&]() { return !mActive; });

    TXDebug1("Scheduler destroyed");
}

TransferOutcome TransferScheduler::await(TransferHandle handle)
{
    std::unique_lock<std::mutex> lock(mLock);

    auto i = mContexts.find(handle);

    if (i == mContexts.end())
        throw TXErrorF("Unknown transfer: %llu",
                       static_cast<unsigned long long>(handle));

    auto context = i->second;

    mCV.wait(lock, [&]() { return context->mOutcome.has_value(); });

    return *context->mOutcome;
}

std::optional<TransferOutcome> TransferScheduler::await(TransferHandle handle,
                                                        std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mLock);

    auto i = mContexts.find(handle);

    if (i == mContexts.end())
        throw TXErrorF("Unknown transfer: %llu",
                       static_cast<unsigned long long>(handle));

    auto context = i->second;

    if (!mCV.wait_for(lock, timeout, [&]() { return context->mOutcome.has_value(); }))
        return std::nullopt;

    return *context->mOutcome;
}

LocalCache& TransferScheduler::cache()
{
    return mCache;
}

bool TransferScheduler::cancel(TransferHandle handle)
{
    std::unique_lock<std::mutex> lock(mLock);

    auto i = mContexts.find(handle);

    if (i == mContexts.end())
        return false;

    auto context = i->second;

    // Transfer's already concluded or is about to.
    if (context->mConcluding || context->mSucceeded || context->mFailure)
        return false;

    TXDebugF("Cancelling transfer %llu",
             static_cast<unsigned long long>(handle));

    if (!failed(context, TransferError(TRANSFER_CANCELLED, "Transfer was cancelled")))
        return true;

    lock.unlock();

    conclude(std::move(context));

    return true;
}

const TransferOptions& TransferScheduler::options() const
{
    return mOptions;
}

bool TransferScheduler::release(TransferHandle handle)
{
    std::lock_guard<std::mutex> guard(mLock);

    auto i = mContexts.find(handle);

    // Outstanding transfers must be awaited or cancelled first.
    if (i == mContexts.end() || !i->second->mOutcome)
        return false;

    mContexts.erase(i);

    TXDebugF("Released transfer %llu",
             static_cast<unsigned long long>(handle));

    return true;
}

std::size_t TransferScheduler::size() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mContexts.size();
}

std::optional<SessionStatus> TransferScheduler::status(TransferHandle handle) const
{
    std::lock_guard<std::mutex> guard(mLock);

    auto i = mContexts.find(handle);

    if (i == mContexts.end())
        return std::nullopt;

    auto& context = *i->second;

    if (context.mOutcome)
        return context.mOutcome->mStatus;

    if (context.mSession)
        return context.mSession->status();

    return SESSION_PENDING;
}

SessionStore& TransferScheduler::store()
{
    return mStore;
}

TransferHandle TransferScheduler::submit(TransferRequest request)
{
    TransferHandle handle;

    {
        std::lock_guard<std::mutex> guard(mLock);

        if (mTerminating)
            throw TXError1("Can't submit transfers while shutting down");

        handle = ++mNextHandle;

        auto context = std::make_shared<Context>(handle, std::move(request));

        context->mResult.mIdentity = context->mRequest.mIdentity;
        context->mResult.mPath = context->mRequest.mLocalPath;

        if (context->mRequest.mName.empty())
            context->mRequest.mName = context->mRequest.mLocalPath.filename().string();

        context->mPending.push_back(WorkItem{WK_PREPARE, ChunkDescriptor()});

        mContexts.emplace(handle, context);

        enqueue(context);

        TXDebugF("Submitted %s of %s as transfer %llu",
                 toString(context->mRequest.mDirection),
                 context->mResult.mIdentity.toString().c_str(),
                 static_cast<unsigned long long>(handle));
    }

    dispatch();

    return handle;
}

} // transfer
} // synapse
