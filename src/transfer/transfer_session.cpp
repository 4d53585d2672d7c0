#include <numeric>
#include <stdexcept>

#include <synapse/common/utility.h>
#include <synapse/serialization.h>
#include <synapse/transfer/digest.h>
#include <synapse/transfer/logging.h>
#include <synapse/transfer/transfer_session.h>

namespace synapse
{
namespace transfer
{

// Bump when the record layout changes incompatibly.
static const std::uint32_t kSessionVersion = 1u;

TransferSession::TransferSession(FileIdentity identity,
                                 TransferDirection direction,
                                 std::filesystem::path path,
                                 std::uint64_t chunkSize,
                                 const ChunkLimits& limits)
  : mCompleted()
  , mChunks(plan(identity.size(), chunkSize, limits))
  , mChunkSize(effectiveChunkSize(identity.size(), chunkSize, limits))
  , mDirection(direction)
  , mError()
  , mIdentity(std::move(identity))
  , mKey(key(mIdentity, direction, path))
  , mLock()
  , mPath(std::move(path))
  , mStatus(SESSION_PENDING)
{
}

bool TransferSession::allChunksComplete() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mCompleted.size() == mChunks.size();
}

std::uint64_t TransferSession::bytesCompleted() const
{
    std::lock_guard<std::mutex> guard(mLock);

    std::uint64_t total = 0;

    for (auto& completed : mCompleted)
        total += mChunks[completed.first - 1].mLength;

    return total;
}

std::uint64_t TransferSession::chunkSize() const
{
    return mChunkSize;
}

const ChunkDescriptorVector& TransferSession::chunks() const
{
    return mChunks;
}

TransferErrorOr<SessionStatus> TransferSession::complete(const std::string& verifiedDigest)
{
    std::lock_guard<std::mutex> guard(mLock);

    switch (mStatus)
    {
    case SESSION_CANCELLED:
        return common::unexpected(TransferError(TRANSFER_CANCELLED,
                                                "Session was cancelled"));
    case SESSION_COMPLETED:
        return mStatus;
    case SESSION_FAILED:
        return common::unexpected(*mError);
    default:
        break;
    }

    // Every chunk must have been transferred.
    if (mCompleted.size() != mChunks.size())
        throw TXErrorF("Can't complete %s: %zu of %zu chunks transferred",
                       mIdentity.toString().c_str(),
                       mCompleted.size(),
                       mChunks.size());

    auto total = std::accumulate(mChunks.begin(),
                                 mChunks.end(),
                                 std::uint64_t(0),
                                 [](std::uint64_t sum, const ChunkDescriptor& chunk) {
                                     return sum + chunk.mLength;
                                 });

    std::optional<TransferError> error;

    if (total != mIdentity.size())
    {
        error = TransferError(TRANSFER_INTEGRITY,
                              common::format("Chunks span %llu bytes, expected %llu",
                                             static_cast<unsigned long long>(total),
                                             static_cast<unsigned long long>(mIdentity.size())));
    }
    else if (verifiedDigest != mIdentity.digest())
    {
        error = TransferError(TRANSFER_INTEGRITY,
                              "Content digest " + verifiedDigest
                              + " doesn't match expected digest "
                              + mIdentity.digest());
    }

    if (error)
    {
        TXWarningF("Session %s failed verification: %s",
                   mKey.c_str(),
                   error->message().c_str());

        mError = error;
        mStatus = SESSION_FAILED;

        return common::unexpected(*error);
    }

    mStatus = SESSION_COMPLETED;

    TXDebugF("Session %s completed", mKey.c_str());

    return mStatus;
}

bool TransferSession::completed(std::uint32_t index) const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mCompleted.count(index) > 0;
}

ChunkDescriptorVector TransferSession::completedChunks() const
{
    std::lock_guard<std::mutex> guard(mLock);

    ChunkDescriptorVector chunks;

    chunks.reserve(mCompleted.size());

    for (auto& completed : mCompleted)
    {
        auto chunk = mChunks[completed.first - 1];

        chunk.mETag = completed.second;

        chunks.emplace_back(std::move(chunk));
    }

    return chunks;
}

std::size_t TransferSession::completedCount() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mCompleted.size();
}

bool TransferSession::cancel()
{
    std::lock_guard<std::mutex> guard(mLock);

    if (terminal(mStatus))
        return false;

    mStatus = SESSION_CANCELLED;

    TXDebugF("Session %s cancelled with %zu of %zu chunks transferred",
             mKey.c_str(),
             mCompleted.size(),
             mChunks.size());

    return true;
}

TransferDirection TransferSession::direction() const
{
    return mDirection;
}

bool TransferSession::discard(std::uint32_t index)
{
    std::lock_guard<std::mutex> guard(mLock);

    return mCompleted.erase(index) > 0;
}

std::optional<TransferError> TransferSession::error() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mError;
}

bool TransferSession::fail(const TransferError& error)
{
    std::lock_guard<std::mutex> guard(mLock);

    if (terminal(mStatus))
        return false;

    mError = error;
    mStatus = SESSION_FAILED;

    TXDebugF("Session %s failed: %s",
             mKey.c_str(),
             error.toString().c_str());

    return true;
}

const FileIdentity& TransferSession::identity() const
{
    return mIdentity;
}

const std::string& TransferSession::key() const
{
    return mKey;
}

bool TransferSession::markComplete(std::uint32_t index, const std::string& etag)
{
    std::lock_guard<std::mutex> guard(mLock);

    if (!index || index > mChunks.size())
        throw TXErrorF("Session %s has no chunk %u",
                       mKey.c_str(),
                       index);

    // A concluded session can't change.
    if (mStatus == SESSION_COMPLETED)
        return false;

    auto result = mCompleted.emplace(index, etag);

    // Chunk was already complete.
    if (!result.second)
        return false;

    return mCompleted.size() == mChunks.size();
}

const std::filesystem::path& TransferSession::path() const
{
    return mPath;
}

ChunkDescriptorVector TransferSession::pendingChunks() const
{
    std::lock_guard<std::mutex> guard(mLock);

    ChunkDescriptorVector chunks;

    for (auto& chunk : mChunks)
    {
        if (!mCompleted.count(chunk.mIndex))
            chunks.emplace_back(chunk);
    }

    return chunks;
}

void TransferSession::reset()
{
    std::lock_guard<std::mutex> guard(mLock);

    mCompleted.clear();
    mError.reset();
    mStatus = SESSION_PENDING;
}

std::string TransferSession::serialize() const
{
    std::lock_guard<std::mutex> guard(mLock);

    std::string data;

    CacheableWriter writer(data);

    writer.serializeu32(kSessionVersion);
    writer.serializeu8(static_cast<std::uint8_t>(mDirection));
    writer.serializestring(mIdentity.handle());
    writer.serializestring(mIdentity.digest());
    writer.serializeu64(mIdentity.size());
    writer.serializestring_u32(mPath.string());
    writer.serializeu64(mChunkSize);
    writer.serializeu32(static_cast<std::uint32_t>(mCompleted.size()));

    for (auto& completed : mCompleted)
    {
        writer.serializeu32(completed.first);
        writer.serializestring(completed.second);
    }

    writer.serializeexpansionflags();

    return data;
}

void TransferSession::start()
{
    std::lock_guard<std::mutex> guard(mLock);

    if (mStatus == SESSION_IN_PROGRESS)
        return;

    if (mStatus != SESSION_PENDING)
        throw TXErrorF("Can't start session %s: it is %s",
                       mKey.c_str(),
                       toString(mStatus));

    mStatus = SESSION_IN_PROGRESS;
}

SessionStatus TransferSession::status() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mStatus;
}

std::string TransferSession::key(const FileIdentity& identity,
                                 TransferDirection direction,
                                 const std::filesystem::path& path)
{
    auto absolute = path;
    std::error_code error;

    // Relative paths are keyed by where they lead.
    if (path.is_relative())
    {
        absolute = std::filesystem::absolute(path, error);

        if (error)
            absolute = path;
    }

    return md5Hex(common::format("%s|%s|%s|%llu|%s",
                                 toString(direction),
                                 identity.handle().c_str(),
                                 identity.digest().c_str(),
                                 static_cast<unsigned long long>(identity.size()),
                                 absolute.lexically_normal().string().c_str()));
}

TransferSessionPtr TransferSession::unserialize(const std::string& data,
                                                const ChunkLimits& limits)
{
    CacheableReader reader(data);

    std::uint32_t version;
    std::uint8_t direction;
    std::string handle;
    std::string digest;
    std::uint64_t size;
    std::string path;
    std::uint64_t chunkSize;
    std::uint32_t count;

    if (!reader.unserializeu32(version)
        || version != kSessionVersion
        || !reader.unserializeu8(direction)
        || direction > TD_UPLOAD
        || !reader.unserializestring(handle)
        || !reader.unserializestring(digest)
        || !reader.unserializeu64(size)
        || !reader.unserializestring_u32(path)
        || !reader.unserializeu64(chunkSize)
        || !reader.unserializeu32(count))
        return nullptr;

    auto session =
      std::make_shared<TransferSession>(FileIdentity(std::move(handle),
                                                     std::move(digest),
                                                     size),
                                        static_cast<TransferDirection>(direction),
                                        std::move(path),
                                        chunkSize,
                                        limits);

    // The plan has changed since this record was written.
    if (session->mChunkSize != chunkSize)
        return nullptr;

    for (std::uint32_t i = 0; i < count; ++i)
    {
        std::uint32_t index;
        std::string etag;

        if (!reader.unserializeu32(index) || !reader.unserializestring(etag))
            return nullptr;

        // Drop indices that fall outside the plan.
        if (!index || index > session->mChunks.size())
            continue;

        session->mCompleted.emplace(index, std::move(etag));
    }

    unsigned char expansions[kExpansionFlagCount];

    if (!reader.unserializeexpansionflags(expansions, 0))
        return nullptr;

    return session;
}

} // transfer
} // synapse
