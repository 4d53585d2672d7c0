#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <synapse/transfer/chunk_plan.h>
#include <synapse/transfer/file_identity.h>
#include <synapse/transfer/session_status.h>
#include <synapse/transfer/transfer_direction.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

class TransferSession;

using TransferSessionPtr = std::shared_ptr<TransferSession>;

// Tracks a single file's progress through its chunks.
//
// Sessions are shared between the scheduler and its workers and so are
// safe to use from several threads at once.
class TransferSession
{
    // Which chunks have been transferred and what did storage call them?
    std::map<std::uint32_t, std::string> mCompleted;

    // The plan computed from our identity and chunk size.
    ChunkDescriptorVector mChunks;

    // The chunk size our plan was computed with.
    std::uint64_t mChunkSize;

    TransferDirection mDirection;

    // Why did the session fail?
    std::optional<TransferError> mError;

    FileIdentity mIdentity;

    // Identifies this session's persisted state.
    std::string mKey;

    // Serializes access to our mutable members.
    mutable std::mutex mLock;

    // Where is the content locally?
    std::filesystem::path mPath;

    SessionStatus mStatus;

public:
    TransferSession(FileIdentity identity,
                    TransferDirection direction,
                    std::filesystem::path path,
                    std::uint64_t chunkSize,
                    const ChunkLimits& limits = ChunkLimits());

    // Have all of our chunks been transferred?
    bool allChunksComplete() const;

    // How many bytes have been transferred by completed chunks?
    std::uint64_t bytesCompleted() const;

    // What chunk size was our plan computed with?
    std::uint64_t chunkSize() const;

    const ChunkDescriptorVector& chunks() const;

    // Conclude the session.
    //
    // Succeeds only if every chunk has been transferred, the chunks account
    // for every byte of content and verifiedDigest matches our identity's
    // digest. An integrity failure moves the session to the failed state.
    TransferErrorOr<SessionStatus> complete(const std::string& verifiedDigest);

    // Has the specified chunk been transferred?
    bool completed(std::uint32_t index) const;

    // Which chunks have been transferred, in index order?
    //
    // Each descriptor carries the ETag storage returned for it.
    ChunkDescriptorVector completedChunks() const;

    std::size_t completedCount() const;

    // Request cancellation.
    //
    // Returns false if the session had already concluded.
    bool cancel();

    TransferDirection direction() const;

    // Forget that a chunk was transferred.
    bool discard(std::uint32_t index);

    std::optional<TransferError> error() const;

    // Mark the session as failed.
    //
    // Completed chunks are retained so a later session can resume.
    // Returns false if the session had already concluded.
    bool fail(const TransferError& error);

    const FileIdentity& identity() const;

    const std::string& key() const;

    // Record that a chunk has been transferred.
    //
    // Returns true if this call completed the session's last chunk.
    // Chunks finishing after the session was cancelled or failed are still
    // recorded so that a resumed session needn't transfer them again.
    bool markComplete(std::uint32_t index, const std::string& etag = std::string());

    const std::filesystem::path& path() const;

    // Which chunks still need to be transferred, in index order?
    ChunkDescriptorVector pendingChunks() const;

    // Forget all progress and return to the pending state.
    void reset();

    // Serialize the session's resumable state.
    std::string serialize() const;

    // Note that the session has begun dispatching work.
    void start();

    SessionStatus status() const;

    // Compute the key under which a session's state is persisted.
    static std::string key(const FileIdentity& identity,
                           TransferDirection direction,
                           const std::filesystem::path& path);

    // Restore a session from its serialized form.
    //
    // Returns nullptr if data can't be parsed.
    static TransferSessionPtr unserialize(const std::string& data,
                                          const ChunkLimits& limits = ChunkLimits());
}; // TransferSession

} // transfer
} // synapse
