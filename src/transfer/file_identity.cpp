#include <algorithm>
#include <cctype>

#include <synapse/common/utility.h>
#include <synapse/transfer/file_identity.h>

namespace synapse
{
namespace transfer
{

static std::string lowercase(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    return value;
}

FileIdentity::FileIdentity()
  : mHandle()
  , mDigest()
  , mSize(0)
{
}

FileIdentity::FileIdentity(std::string handle, std::string digest, std::uint64_t size)
  : mHandle(std::move(handle))
  , mDigest(lowercase(std::move(digest)))
  , mSize(size)
{
}

bool FileIdentity::operator==(const FileIdentity& rhs) const
{
    return mHandle == rhs.mHandle
           && mDigest == rhs.mDigest
           && mSize == rhs.mSize;
}

bool FileIdentity::operator!=(const FileIdentity& rhs) const
{
    return !(*this == rhs);
}

const std::string& FileIdentity::digest() const
{
    return mDigest;
}

const std::string& FileIdentity::handle() const
{
    return mHandle;
}

std::uint64_t FileIdentity::size() const
{
    return mSize;
}

std::string FileIdentity::toString() const
{
    return common::format("%s/%s/%llu",
                          mHandle.c_str(),
                          mDigest.empty() ? "-" : mDigest.c_str(),
                          static_cast<unsigned long long>(mSize));
}

FileIdentity FileIdentity::withContent(std::string digest, std::uint64_t size) const
{
    return FileIdentity(mHandle, std::move(digest), size);
}

std::ostream& operator<<(std::ostream& ostream, const FileIdentity& identity)
{
    return ostream << identity.toString();
}

} // transfer
} // synapse
