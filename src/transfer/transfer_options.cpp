#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>

#include <synapse/transfer/logging.h>
#include <synapse/transfer/transfer_options.h>

namespace synapse
{
namespace transfer
{

// How many extra workers to keep beyond the machine's parallelism.
constexpr std::size_t kConcurrencyHeadroom = 4u;

// The most workers we'll ever run by default.
constexpr std::size_t kMaximumDefaultConcurrency = 32u;

std::filesystem::path defaultCacheRoot()
{
    auto home = std::getenv("HOME");

    if (!home || !*home)
        return std::filesystem::temp_directory_path() / ".synapseCache";

    return std::filesystem::path(home) / ".synapseCache";
}

std::size_t defaultConcurrency()
{
    std::size_t parallelism = std::thread::hardware_concurrency();

    return std::min(kMaximumDefaultConcurrency, parallelism + kConcurrencyHeadroom);
}

TransferOptions normalize(TransferOptions options)
{
    auto& limits = options.mChunkLimits;

    if (!limits.mMaximumSize || limits.mMinimumSize > limits.mMaximumSize)
        throw std::invalid_argument("Chunk size limits are inconsistent");

    if (!options.mRetry.mMaximumAttempts)
        throw std::invalid_argument("At least one attempt must be permitted");

    if (!options.mConcurrency)
        options.mConcurrency = defaultConcurrency();

    if (options.mCacheRoot.empty())
        options.mCacheRoot = defaultCacheRoot();

    if (options.mStateDirectory.empty())
        options.mStateDirectory = options.mCacheRoot / ".sessions";

    if (!options.mHasherFactory)
        options.mHasherFactory = md5Hasher;

    TXDebugF("Concurrency: %zu, chunk size: %llu, cache: %s",
             options.mConcurrency,
             static_cast<unsigned long long>(options.mChunkSize),
             options.mCacheRoot.string().c_str());

    return options;
}

} // transfer
} // synapse
