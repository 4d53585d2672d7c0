#include <algorithm>

#include <synapse/transfer/chunk_plan.h>

namespace synapse
{
namespace transfer
{

std::uint32_t chunkCount(std::uint64_t totalSize, std::uint64_t chunkSize)
{
    // Empty files are transferred as a single empty chunk.
    if (!totalSize || !chunkSize)
        return 1u;

    return static_cast<std::uint32_t>((totalSize + chunkSize - 1) / chunkSize);
}

std::uint64_t effectiveChunkSize(std::uint64_t totalSize,
                                 std::uint64_t chunkSize,
                                 const ChunkLimits& limits)
{
    if (!chunkSize)
        chunkSize = kDefaultChunkSize;

    // Respect the backend's part size bounds.
    chunkSize = std::max(chunkSize, limits.mMinimumSize);
    chunkSize = std::min(chunkSize, limits.mMaximumSize);

    // Make sure we never need more parts than the backend allows.
    if (limits.mMaximumCount)
    {
        auto count = static_cast<std::uint64_t>(limits.mMaximumCount);

        chunkSize = std::max(chunkSize, (totalSize + count - 1) / count);
    }

    return std::max<std::uint64_t>(chunkSize, 1u);
}

ChunkDescriptorVector plan(std::uint64_t totalSize,
                           std::uint64_t chunkSize,
                           const ChunkLimits& limits)
{
    chunkSize = effectiveChunkSize(totalSize, chunkSize, limits);

    auto count = chunkCount(totalSize, chunkSize);

    ChunkDescriptorVector chunks;

    chunks.reserve(count);

    for (std::uint32_t i = 0; i < count; ++i)
    {
        ChunkDescriptor chunk;

        chunk.mIndex = i + 1;
        chunk.mOffset = static_cast<std::uint64_t>(i) * chunkSize;
        chunk.mLength = std::min(chunkSize, totalSize - chunk.mOffset);

        chunks.emplace_back(std::move(chunk));
    }

    return chunks;
}

} // transfer
} // synapse
