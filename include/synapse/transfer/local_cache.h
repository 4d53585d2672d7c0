#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <synapse/transfer/file_identity.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

struct CacheEntry
{
    // What content does this entry hold?
    FileIdentity mIdentity;

    // Where does the content live?
    std::filesystem::path mPath;

    // Digest the content was verified against before it was committed.
    std::string mDigest;

    // When was the entry committed?
    std::filesystem::file_time_type mModified;
}; // CacheEntry

using CacheEntryPredicate = std::function<bool(const CacheEntry&)>;

using CacheEntryVector = std::vector<CacheEntry>;

// Content addressed store of verified downloads.
//
// Entries are keyed by remote handle and content digest and live at:
//   <root>/<bucket>/<handle>/<digest>
//
// Entries are written to a temporary file beside their final location and
// renamed into place so a concurrent lookup never observes a partial entry.
class LocalCache
{
    // Which directory holds entries for identity?
    std::filesystem::path directory(const FileIdentity& identity) const;

    // How many buckets are handles spread across?
    std::uint32_t mFanout;

    // Where does the cache keep its content?
    std::filesystem::path mRoot;

public:
    explicit LocalCache(std::filesystem::path root,
                        std::uint32_t fanout = 1000u);

    // Which bucket does a handle belong in?
    std::string bucket(const std::string& handle) const;

    // Move a verified file into the cache.
    //
    // The source is copied, not moved. Committing an identity that is
    // already present replaces the entry atomically.
    TransferErrorOr<CacheEntry> commit(const FileIdentity& identity,
                                       const std::filesystem::path& source);

    // Is content for identity present?
    bool contains(const FileIdentity& identity) const;

    // Enumerate every committed entry.
    CacheEntryVector entries() const;

    // Where is identity's content, if we have it?
    //
    // Content committed under a different digest is never returned.
    std::optional<std::filesystem::path> lookup(const FileIdentity& identity) const;

    // Where would identity's content live?
    std::filesystem::path path(const FileIdentity& identity) const;

    // Remove every entry matching predicate.
    //
    // Returns the number of entries removed, or that would have been
    // removed had dryRun been false.
    std::size_t purge(const CacheEntryPredicate& predicate, bool dryRun = false);

    // Remove entries committed within a window of time.
    //
    // An entry matches if it was committed before before and after after.
    // Omitting a bound leaves that side of the window open but at least
    // one bound must be given and before must not precede after.
    //
    // Throws std::invalid_argument if the window is malformed.
    std::size_t purge(std::optional<std::filesystem::file_time_type> before,
                      std::optional<std::filesystem::file_time_type> after,
                      bool dryRun = false);

    // Remove identity's content from the cache.
    bool remove(const FileIdentity& identity);

    const std::filesystem::path& root() const;

    // Could identity be stored in the cache?
    static bool valid(const FileIdentity& identity);
}; // LocalCache

} // transfer
} // synapse
