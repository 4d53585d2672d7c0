#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace synapse
{
namespace transfer
{

struct ChunkDescriptor
{
    bool operator==(const ChunkDescriptor& rhs) const
    {
        return mIndex == rhs.mIndex
               && mOffset == rhs.mOffset
               && mLength == rhs.mLength
               && mETag == rhs.mETag;
    }

    bool operator!=(const ChunkDescriptor& rhs) const
    {
        return !(*this == rhs);
    }

    // One past the chunk's last byte.
    std::uint64_t end() const
    {
        return mOffset + mLength;
    }

    // Position of this chunk within its file, starting from one.
    std::uint32_t mIndex = 0u;

    // Where does the chunk begin?
    std::uint64_t mOffset = 0u;

    // How many bytes does the chunk span?
    std::uint64_t mLength = 0u;

    // What did storage call this chunk once it was uploaded?
    std::string mETag;
}; // ChunkDescriptor

using ChunkDescriptorVector = std::vector<ChunkDescriptor>;

} // transfer
} // synapse
