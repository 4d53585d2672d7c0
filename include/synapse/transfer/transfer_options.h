#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <synapse/transfer/chunk_plan.h>
#include <synapse/transfer/digest.h>
#include <synapse/transfer/retry_policy.h>

namespace synapse
{
namespace transfer
{

struct TransferOptions
{
    // Preferred chunk size, zero selects the default.
    std::uint64_t mChunkSize = kDefaultChunkSize;

    // Part constraints imposed by storage.
    ChunkLimits mChunkLimits;

    // How many work items may execute at once? Zero selects the default.
    std::size_t mConcurrency = 0u;

    // How long may a pool worker idle before it retires?
    std::chrono::seconds mIdleTime{30};

    RetryOptions mRetry;

    // Where are verified downloads cached? Empty selects the default.
    std::filesystem::path mCacheRoot;

    // Where are sessions persisted? Empty selects <cacheRoot>/.sessions.
    std::filesystem::path mStateDirectory;

    // How long may a single HTTP request take?
    std::chrono::milliseconds mRequestTimeout{60000};

    // How long may we spend establishing a connection?
    std::chrono::milliseconds mConnectTimeout{20000};

    // Minimum distance between two progress snapshots.
    std::chrono::milliseconds mProgressInterval{250};

    // Creates the hashers used to verify whole files and parts.
    HasherFactory mHasherFactory = md5Hasher;
}; // TransferOptions

// Where do we cache downloads by default?
std::filesystem::path defaultCacheRoot();

// How many work items do we execute at once by default?
std::size_t defaultConcurrency();

// Validate options and fill in any derived defaults.
//
// Throws std::invalid_argument if the options can't be satisfied.
TransferOptions normalize(TransferOptions options);

} // transfer
} // synapse
