#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include <synapse/transfer/chunk_plan.h>
#include <synapse/transfer/transfer_session.h>

namespace synapse
{
namespace transfer
{

// Persists sessions so that interrupted transfers can be resumed.
//
// Each session is stored as:
//   <directory>/<key>.session
//
// Downloaded chunks are staged beside the session's record:
//   <directory>/<key>.parts/<index>
class SessionStore
{
    // Where are records kept?
    std::filesystem::path mDirectory;

    // What part constraints were sessions planned with?
    ChunkLimits mLimits;

    // Serializes writes to the store.
    std::mutex mLock;

public:
    explicit SessionStore(std::filesystem::path directory,
                          const ChunkLimits& limits = ChunkLimits());

    const std::filesystem::path& directory() const;

    // Reload a previously persisted session.
    //
    // Returns nullptr if no usable record exists. A record that no longer
    // describes the requested transfer is removed along with its parts.
    // Completed chunks that can't be accounted for are forgotten.
    TransferSessionPtr load(const FileIdentity& identity,
                            TransferDirection direction,
                            const std::filesystem::path& path,
                            std::uint64_t chunkSize);

    // Reload a session or create a new one if none exists.
    TransferSessionPtr open(const FileIdentity& identity,
                            TransferDirection direction,
                            const std::filesystem::path& path,
                            std::uint64_t chunkSize);

    // Where is a chunk staged once fully downloaded?
    std::filesystem::path partPath(const std::string& key, std::uint32_t index) const;

    // Where are a session's chunks staged?
    std::filesystem::path partsPath(const std::string& key) const;

    std::filesystem::path recordPath(const std::string& key) const;

    // Remove a session's record and any staged chunks.
    bool remove(const std::string& key);

    // Persist the session's current state.
    //
    // Returns the size of the record written.
    TransferErrorOr<std::uint64_t> save(const TransferSession& session);
}; // SessionStore

} // transfer
} // synapse
