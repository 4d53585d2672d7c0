#include <fstream>
#include <iterator>

#include <synapse/transfer/chunk_worker.h>
#include <synapse/transfer/file_utilities.h>
#include <synapse/transfer/logging.h>
#include <synapse/transfer/session_store.h>

namespace synapse
{
namespace transfer
{

namespace fs = std::filesystem;

SessionStore::SessionStore(fs::path directory, const ChunkLimits& limits)
  : mDirectory(std::move(directory))
  , mLimits(limits)
  , mLock()
{
}

const fs::path& SessionStore::directory() const
{
    return mDirectory;
}

TransferSessionPtr SessionStore::load(const FileIdentity& identity,
                                      TransferDirection direction,
                                      const fs::path& path,
                                      std::uint64_t chunkSize)
{
    auto key = TransferSession::key(identity, direction, path);
    auto record = recordPath(key);

    std::string data;

    {
        std::ifstream stream(record, std::ios::binary);

        // No record, nothing to resume.
        if (!stream)
            return nullptr;

        data.assign(std::istreambuf_iterator<char>(stream),
                    std::istreambuf_iterator<char>());

        if (stream.bad())
        {
            TXWarningF("Couldn't read session record %s",
                       record.string().c_str());

            return nullptr;
        }
    }

    auto session = TransferSession::unserialize(data, mLimits);

    if (!session)
    {
        TXWarningF("Discarding unreadable session record %s",
                   record.string().c_str());

        remove(key);

        return nullptr;
    }

    // Make sure the record describes what we've been asked to transfer.
    if (session->key() != key
        || session->identity() != identity
        || session->direction() != direction
        || session->chunkSize() != effectiveChunkSize(identity.size(), chunkSize, mLimits))
    {
        TXInfoF("Discarding stale session record %s",
                record.string().c_str());

        remove(key);

        return nullptr;
    }

    // Make sure each completed chunk's content is still present.
    if (direction == TD_DOWNLOAD)
    {
        for (auto& chunk : session->completedChunks())
        {
            std::error_code error;

            auto part = partPath(key, chunk.mIndex);
            auto size = fs::file_size(part, error);

            if (!error && size == chunk.mLength)
                continue;

            TXDebugF("Session %s lost chunk %u",
                     key.c_str(),
                     chunk.mIndex);

            session->discard(chunk.mIndex);
        }
    }

    TXInfoF("Resuming %s of %s with %zu of %zu chunks complete",
            toString(direction),
            identity.toString().c_str(),
            session->completedCount(),
            session->chunks().size());

    return session;
}

TransferSessionPtr SessionStore::open(const FileIdentity& identity,
                                      TransferDirection direction,
                                      const fs::path& path,
                                      std::uint64_t chunkSize)
{
    if (auto session = load(identity, direction, path, chunkSize))
        return session;

    return std::make_shared<TransferSession>(identity,
                                             direction,
                                             path,
                                             chunkSize,
                                             mLimits);
}

fs::path SessionStore::partPath(const std::string& key, std::uint32_t index) const
{
    return ChunkWorker::partPath(partsPath(key), index);
}

fs::path SessionStore::partsPath(const std::string& key) const
{
    return mDirectory / (key + ".parts");
}

fs::path SessionStore::recordPath(const std::string& key) const
{
    return mDirectory / (key + ".session");
}

bool SessionStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> guard(mLock);

    std::error_code error;

    auto removed = fs::remove(recordPath(key), error);

    if (error)
        TXWarningF("Couldn't remove session record %s: %s",
                   key.c_str(),
                   error.message().c_str());

    fs::remove_all(partsPath(key), error);

    if (error)
        TXWarningF("Couldn't remove staged chunks for %s: %s",
                   key.c_str(),
                   error.message().c_str());

    return removed;
}

TransferErrorOr<std::uint64_t> SessionStore::save(const TransferSession& session)
{
    std::lock_guard<std::mutex> guard(mLock);

    std::error_code error;

    fs::create_directories(mDirectory, error);

    if (error)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't create " + mDirectory.string()
                                                + ": " + error.message()));

    return writeAtomically(recordPath(session.key()), session.serialize());
}

} // transfer
} // synapse
