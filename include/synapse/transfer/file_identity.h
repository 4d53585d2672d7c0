#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace synapse
{
namespace transfer
{

// Identifies what content is being moved, independent of where it lives.
class FileIdentity
{
    // Remote content handle.
    std::string mHandle;

    // Expected content digest as lower case hex, possibly empty for uploads
    // whose digest has yet to be computed.
    std::string mDigest;

    // Total size of the content in bytes.
    std::uint64_t mSize;

public:
    FileIdentity();

    FileIdentity(std::string handle, std::string digest, std::uint64_t size);

    bool operator==(const FileIdentity& rhs) const;

    bool operator!=(const FileIdentity& rhs) const;

    const std::string& digest() const;

    const std::string& handle() const;

    std::uint64_t size() const;

    std::string toString() const;

    // Same handle, different content.
    FileIdentity withContent(std::string digest, std::uint64_t size) const;
}; // FileIdentity

std::ostream& operator<<(std::ostream& ostream, const FileIdentity& identity);

} // transfer
} // synapse
