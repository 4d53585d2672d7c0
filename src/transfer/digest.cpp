#include <fstream>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

#include <synapse/transfer/digest.h>
#include <synapse/transfer/logging.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

class Md5Hasher::Context
{
public:
    Context()
      : mContext(EVP_MD_CTX_new(), EVP_MD_CTX_free)
      , mFinished(false)
    {
        if (!mContext)
            throw TXError1("Couldn't allocate digest context");

        if (EVP_DigestInit_ex(mContext.get(), EVP_md5(), nullptr) != 1)
            throw TXError1("Couldn't initialize MD5 digest");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mContext;

    bool mFinished;
}; // Context

Md5Hasher::Md5Hasher()
  : mContext(std::make_unique<Context>())
{
}

Md5Hasher::~Md5Hasher() = default;

void Md5Hasher::update(const void* data, std::size_t length)
{
    // Sanity.
    if (mContext->mFinished)
        throw TXError1("Digest updated after it was finished");

    if (!length)
        return;

    if (EVP_DigestUpdate(mContext->mContext.get(), data, length) != 1)
        throw TXError1("Couldn't update MD5 digest");
}

std::string Md5Hasher::finish()
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (mContext->mFinished)
        throw TXError1("Digest finished twice");

    mContext->mFinished = true;

    if (EVP_DigestFinal_ex(mContext->mContext.get(), digest, &length) != 1)
        throw TXError1("Couldn't finish MD5 digest");

    return toHex(digest, length);
}

const char* Md5Hasher::name() const
{
    return "MD5";
}

HasherPtr md5Hasher()
{
    return std::make_unique<Md5Hasher>();
}

std::string md5Hex(const std::string& data)
{
    Md5Hasher hasher;

    hasher.update(data.data(), data.size());

    return hasher.finish();
}

TransferErrorOr<std::string> digestFile(const std::filesystem::path& path,
                                        Hasher& hasher)
{
    std::ifstream stream(path, std::ios::binary);

    if (!stream)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't open " + path.string()));

    std::vector<char> buffer(1u << 20);

    while (stream)
    {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));

        hasher.update(buffer.data(), static_cast<std::size_t>(stream.gcount()));
    }

    if (stream.bad())
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't read " + path.string()));

    return hasher.finish();
}

std::string toHex(const unsigned char* data, std::size_t length)
{
    static const char digits[] = "0123456789abcdef";

    std::string result;

    result.reserve(length * 2);

    for (std::size_t i = 0; i < length; ++i)
    {
        result.push_back(digits[data[i] >> 4]);
        result.push_back(digits[data[i] & 0xf]);
    }

    return result;
}

} // transfer
} // synapse
