#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include <synapse/transfer/transfer_error_forward.h>

namespace synapse
{
namespace transfer
{

// Computes a content digest incrementally.
class Hasher
{
public:
    virtual ~Hasher() = default;

    // Feed more content into the digest.
    virtual void update(const void* data, std::size_t length) = 0;

    // Conclude the digest and return it as lower case hex.
    //
    // The hasher may not be updated after it has been finished.
    virtual std::string finish() = 0;

    // What algorithm does this hasher implement?
    virtual const char* name() const = 0;
}; // Hasher

using HasherPtr = std::unique_ptr<Hasher>;

// Creates hashers for a particular digest algorithm.
using HasherFactory = std::function<HasherPtr()>;

// MD5, as used by the storage backend for whole files and parts.
class Md5Hasher
  : public Hasher
{
    class Context;

    std::unique_ptr<Context> mContext;

public:
    Md5Hasher();

    ~Md5Hasher();

    void update(const void* data, std::size_t length) override;

    std::string finish() override;

    const char* name() const override;
}; // Md5Hasher

HasherPtr md5Hasher();

// Compute the MD5 digest of a string.
std::string md5Hex(const std::string& data);

// Compute the digest of a file's content.
//
// Fails with a fatal error if the file can't be read.
TransferErrorOr<std::string> digestFile(const std::filesystem::path& path,
                                        Hasher& hasher);

// Convert raw bytes to lower case hex.
std::string toHex(const unsigned char* data, std::size_t length);

} // transfer
} // synapse
