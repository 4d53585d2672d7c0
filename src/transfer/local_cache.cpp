#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <synapse/common/utility.h>
#include <synapse/transfer/digest.h>
#include <synapse/transfer/file_utilities.h>
#include <synapse/transfer/local_cache.h>
#include <synapse/transfer/logging.h>

namespace synapse
{
namespace transfer
{

namespace fs = std::filesystem;

static bool hidden(const fs::path& path)
{
    auto leaf = path.filename().string();

    return leaf.empty() || leaf.front() == '.';
}

static bool hexadecimal(const std::string& value)
{
    return !value.empty()
           && std::all_of(value.begin(), value.end(), [](unsigned char c) {
                  return std::isxdigit(c);
              });
}

static bool numeric(const std::string& value)
{
    return !value.empty()
           && value.size() < 20
           && std::all_of(value.begin(), value.end(), [](unsigned char c) {
                  return std::isdigit(c);
              });
}

// Remove directory and any empty parents up to but excluding root.
static void prune(fs::path directory, const fs::path& root)
{
    std::error_code error;

    while (directory != root && directory.has_parent_path())
    {
        if (!fs::is_empty(directory, error) || error)
            return;

        if (!fs::remove(directory, error) || error)
            return;

        directory = directory.parent_path();
    }
}

fs::path LocalCache::directory(const FileIdentity& identity) const
{
    return mRoot / bucket(identity.handle()) / identity.handle();
}

LocalCache::LocalCache(fs::path root, std::uint32_t fanout)
  : mFanout(std::max(fanout, 1u))
  , mRoot(std::move(root))
{
    TXDebugF("Cache rooted at %s", mRoot.string().c_str());
}

std::string LocalCache::bucket(const std::string& handle) const
{
    // Numeric handles are spread evenly by value.
    if (numeric(handle))
        return std::to_string(std::stoull(handle) % mFanout);

    // Anything else is spread by digest.
    return md5Hex(handle).substr(0, 3);
}

TransferErrorOr<CacheEntry> LocalCache::commit(const FileIdentity& identity,
                                               const fs::path& source)
{
    if (!valid(identity))
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Can't cache " + identity.toString()));

    std::error_code error;

    auto size = fs::file_size(source, error);

    if (error)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't inspect " + source.string()
                                                + ": " + error.message()));

    if (size != identity.size())
        return common::unexpected(
          TransferError(TRANSFER_INTEGRITY,
                        common::format("Refusing to cache %s: content is %llu bytes",
                                       identity.toString().c_str(),
                                       static_cast<unsigned long long>(size))));

    auto target = path(identity);

    fs::create_directories(target.parent_path(), error);

    if (error)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't create "
                                                + target.parent_path().string()
                                                + ": " + error.message()));

    auto copied = copyAtomically(source, target);

    if (!copied)
        return common::unexpected(std::move(copied).error());

    CacheEntry entry;

    entry.mDigest = identity.digest();
    entry.mIdentity = identity;
    entry.mModified = fs::last_write_time(target, error);
    entry.mPath = target;

    if (error)
        entry.mModified = fs::file_time_type::clock::now();

    TXDebugF("Cached %s at %s",
             identity.toString().c_str(),
             target.string().c_str());

    return entry;
}

bool LocalCache::contains(const FileIdentity& identity) const
{
    return lookup(identity).has_value();
}

CacheEntryVector LocalCache::entries() const
{
    CacheEntryVector entries;
    std::error_code error;

    // Cache hasn't been populated yet.
    if (!fs::is_directory(mRoot, error))
        return entries;

    // Visits each non-hidden directory below path.
    auto children = [](const fs::path& path, bool directories) {
        std::vector<fs::path> result;
        std::error_code error;

        for (fs::directory_iterator i(path, error), end; !error && i != end; i.increment(error))
        {
            if (hidden(i->path()))
                continue;

            std::error_code statusError;

            auto isDirectory = i->is_directory(statusError);

            if (statusError)
                continue;

            if (directories == isDirectory)
                result.emplace_back(i->path());
        }

        return result;
    }; // children

    for (auto& bucket : children(mRoot, true))
    {
        for (auto& handle : children(bucket, true))
        {
            for (auto& file : children(handle, false))
            {
                std::error_code error;

                auto size = fs::file_size(file, error);

                if (error)
                    continue;

                auto modified = fs::last_write_time(file, error);

                if (error)
                    continue;

                CacheEntry entry;

                entry.mDigest = file.filename().string();
                entry.mIdentity = FileIdentity(handle.filename().string(),
                                               entry.mDigest,
                                               size);
                entry.mModified = modified;
                entry.mPath = file;

                entries.emplace_back(std::move(entry));
            }
        }
    }

    return entries;
}

std::optional<fs::path> LocalCache::lookup(const FileIdentity& identity) const
{
    if (!valid(identity))
        return std::nullopt;

    auto target = path(identity);

    std::error_code error;

    if (!fs::is_regular_file(target, error) || error)
        return std::nullopt;

    auto size = fs::file_size(target, error);

    // Content's been truncated or replaced behind our back.
    if (error || size != identity.size())
    {
        TXWarningF("Ignoring cache entry %s: unexpected size",
                   target.string().c_str());

        return std::nullopt;
    }

    return target;
}

fs::path LocalCache::path(const FileIdentity& identity) const
{
    return directory(identity) / identity.digest();
}

std::size_t LocalCache::purge(const CacheEntryPredicate& predicate, bool dryRun)
{
    std::size_t count = 0;

    for (auto& entry : entries())
    {
        if (!predicate(entry))
            continue;

        ++count;

        if (dryRun)
        {
            TXInfoF("Would purge %s", entry.mPath.string().c_str());
            continue;
        }

        std::error_code error;

        fs::remove(entry.mPath, error);

        if (error)
        {
            TXWarningF("Couldn't purge %s: %s",
                       entry.mPath.string().c_str(),
                       error.message().c_str());

            --count;
            continue;
        }

        prune(entry.mPath.parent_path(), mRoot);
    }

    TXInfoF("%s %zu cache entries", dryRun ? "Would purge" : "Purged", count);

    return count;
}

std::size_t LocalCache::purge(std::optional<fs::file_time_type> before,
                              std::optional<fs::file_time_type> after,
                              bool dryRun)
{
    // An open window on both sides would match everything.
    if (!before && !after)
        throw std::invalid_argument("Either before or after must be provided");

    if (before && after && *before < *after)
        throw std::invalid_argument("Before must not precede after");

    return purge([&](const CacheEntry& entry) {
        return (!before || entry.mModified < *before)
               && (!after || entry.mModified > *after);
    }, dryRun);
}

bool LocalCache::remove(const FileIdentity& identity)
{
    if (!valid(identity))
        return false;

    auto target = path(identity);

    std::error_code error;

    if (!fs::remove(target, error) || error)
        return false;

    prune(target.parent_path(), mRoot);

    return true;
}

const fs::path& LocalCache::root() const
{
    return mRoot;
}

bool LocalCache::valid(const FileIdentity& identity)
{
    auto& handle = identity.handle();

    if (handle.empty() || handle.front() == '.')
        return false;

    if (handle.find_first_of("/\\") != std::string::npos)
        return false;

    return hexadecimal(identity.digest());
}

} // transfer
} // synapse
