#pragma once

#include <cstdint>

#include <synapse/transfer/chunk_descriptor.h>

namespace synapse
{
namespace transfer
{

// Chunk size used when the caller doesn't specify one.
constexpr std::uint64_t kDefaultChunkSize = 8ull << 20;

// Part size constraints imposed by the storage backend.
struct ChunkLimits
{
    // Smallest part the backend will accept, other than the last.
    std::uint64_t mMinimumSize = 5ull << 20;

    // Largest part the backend will accept.
    std::uint64_t mMaximumSize = 5ull << 30;

    // How many parts may a single object have?
    std::uint32_t mMaximumCount = 10000u;
}; // ChunkLimits

// How many chunks does a file of totalSize need?
//
// Zero byte files still need a single (empty) chunk.
std::uint32_t chunkCount(std::uint64_t totalSize, std::uint64_t chunkSize);

// Compute the chunk size actually used for a file.
std::uint64_t effectiveChunkSize(std::uint64_t totalSize,
                                 std::uint64_t chunkSize,
                                 const ChunkLimits& limits = ChunkLimits());

// Split a file into contiguous chunks.
//
// The result depends only on the arguments so that a reloaded session
// reproduces the plan it was originally transferred with.
ChunkDescriptorVector plan(std::uint64_t totalSize,
                           std::uint64_t chunkSize,
                           const ChunkLimits& limits = ChunkLimits());

} // transfer
} // synapse
