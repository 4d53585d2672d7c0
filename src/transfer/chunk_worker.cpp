#include <fstream>

#include <synapse/common/utility.h>
#include <synapse/transfer/chunk_worker.h>
#include <synapse/transfer/logging.h>
#include <synapse/transfer/progress_reporter.h>
#include <synapse/transfer/transfer_options.h>

namespace synapse
{
namespace transfer
{

namespace fs = std::filesystem;

// Strip the quotes storage likes to wrap ETags in.
static std::string unquote(std::string value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);

    return value;
}

// Translate an unsuccessful response into an error.
static TransferError failure(const HttpResponse& response)
{
    std::optional<std::chrono::seconds> retryAfter;

    if (auto value = response.header("Retry-After"))
        retryAfter = parseRetryAfter(*value);

    auto message = response.mBody.empty()
                   ? common::format("Storage responded with HTTP %d", response.mStatus)
                   : response.mBody;

    return errorFromStatus(response.mStatus, message, retryAfter);
}

TransferErrorOr<ChunkDescriptor> ChunkWorker::download(const ChunkDescriptor& chunk,
                                                       const ChunkContext& context) const
{
    auto partial = partialPath(context.mParts, chunk.mIndex);
    auto target = partPath(context.mParts, chunk.mIndex);

    std::error_code error;

    fs::create_directories(context.mParts, error);

    if (error)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't create " + context.mParts.string()
                                                + ": " + error.message()));

    // Chunk was downloaded by an earlier run.
    if (auto size = fs::file_size(target, error); !error && size == chunk.mLength)
        return chunk;

    // How much of the chunk do we already have?
    std::uint64_t present = fs::file_size(partial, error);

    if (error)
        present = 0;

    // Something's gone wrong, start over.
    if (present > chunk.mLength)
    {
        fs::remove(partial, error);
        present = 0;
    }

    // Whole chunk's present, it just wasn't moved into place.
    if (present && present == chunk.mLength)
    {
        fs::rename(partial, target, error);

        if (error)
            return common::unexpected(TransferError(TRANSFER_FATAL,
                                                    "Couldn't move " + partial.string()
                                                    + " into place: " + error.message()));

        return chunk;
    }

    auto url = mUrls.url(context.mIdentity, TD_DOWNLOAD, chunk.mIndex);

    if (!url)
        return common::unexpected(std::move(url).error());

    auto request = this->request(*url, "GET", context);

    // Only ask for what we don't already have.
    if (chunk.mLength)
        request.mHeaders["Range"] =
          common::format("bytes=%llu-%llu",
                         static_cast<unsigned long long>(chunk.mOffset + present),
                         static_cast<unsigned long long>(chunk.end() - 1));

    std::ofstream stream(partial, std::ios::binary | std::ios::app);

    if (!stream)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't open " + partial.string()));

    std::uint64_t received = 0;
    bool overflowed = false;
    bool unwritable = false;

    request.mBodySink = [&](const char* data, std::size_t length) {
        // Storage has sent more than we asked for.
        if (present + received + length > chunk.mLength)
        {
            overflowed = true;
            return false;
        }

        if (!stream.write(data, static_cast<std::streamsize>(length)))
        {
            unwritable = true;
            return false;
        }

        received += length;

        progress(context, length);

        return true;
    }; // mBodySink

    auto response = mClient.perform(request);

    stream.close();

    if (overflowed)
    {
        fs::remove(partial, error);

        return common::unexpected(
          TransferError(TRANSFER_FATAL,
                        common::format("Storage sent more than the %llu bytes of chunk %u",
                                       static_cast<unsigned long long>(chunk.mLength),
                                       chunk.mIndex)));
    }

    if (unwritable || stream.fail())
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't write " + partial.string()));

    if (!response)
        return common::unexpected(std::move(response).error());

    if (!response->successful())
        return common::unexpected(failure(*response));

    // A plain 200 is only acceptable when we asked for the whole object.
    auto whole = !chunk.mLength
                 || (!present && !chunk.mOffset && chunk.mLength == context.mIdentity.size());

    if (response->mStatus != 206 && !whole)
    {
        fs::remove(partial, error);

        return common::unexpected(
          TransferError(TRANSFER_FATAL,
                        common::format("Storage ignored the range request for chunk %u",
                                       chunk.mIndex),
                        response->mStatus));
    }

    // Connection was cut short, resume from where we are next time.
    if (present + received < chunk.mLength)
        return common::unexpected(
          TransferError(TRANSFER_TRANSIENT,
                        common::format("Chunk %u is short: received %llu of %llu bytes",
                                       chunk.mIndex,
                                       static_cast<unsigned long long>(present + received),
                                       static_cast<unsigned long long>(chunk.mLength))));

    fs::rename(partial, target, error);

    if (error)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't move " + partial.string()
                                                + " into place: " + error.message()));

    return chunk;
}

void ChunkWorker::progress(const ChunkContext& context, std::uint64_t delta) const
{
    if (mReporter && delta)
        mReporter->report(context.mProgressID, delta);
}

HttpRequest ChunkWorker::request(const SignedUrl& url,
                                 const char* defaultMethod,
                                 const ChunkContext& context) const
{
    HttpRequest request;

    request.mCancel = context.mCancel;
    request.mConnectTimeout = mConnectTimeout;
    request.mHeaders = url.mHeaders;
    request.mMethod = url.mMethod.empty() ? defaultMethod : url.mMethod;
    request.mTimeout = mRequestTimeout;
    request.mUrl = url.mUrl;

    return request;
}

TransferErrorOr<ChunkDescriptor> ChunkWorker::upload(const ChunkDescriptor& chunk,
                                                     const ChunkContext& context) const
{
    auto url = mUrls.url(context.mIdentity, TD_UPLOAD, chunk.mIndex);

    if (!url)
        return common::unexpected(std::move(url).error());

    std::ifstream stream(context.mSource, std::ios::binary);

    if (stream)
        stream.seekg(static_cast<std::streamoff>(chunk.mOffset));

    if (!stream)
        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't read " + context.mSource.string()));

    auto hasher = mHasherFactory();
    auto request = this->request(*url, "PUT", context);
    std::uint64_t sent = 0;

    request.mBodyLength = chunk.mLength;

    request.mBodySource = [&](char* buffer, std::size_t length) -> std::size_t {
        stream.read(buffer, static_cast<std::streamsize>(length));

        auto count = static_cast<std::size_t>(stream.gcount());

        hasher->update(buffer, count);
        sent += count;

        return count;
    }; // mBodySource

    auto response = mClient.perform(request);

    if (!response)
        return common::unexpected(std::move(response).error());

    if (!response->successful())
        return common::unexpected(failure(*response));

    if (sent != chunk.mLength)
        return common::unexpected(
          TransferError(TRANSFER_FATAL,
                        common::format("Only %llu bytes of chunk %u were sent",
                                       static_cast<unsigned long long>(sent),
                                       chunk.mIndex)));

    auto uploaded = chunk;

    // Fall back to our own digest if storage didn't name the part.
    uploaded.mETag = unquote(response->header("ETag").value_or(std::string()));

    if (uploaded.mETag.empty())
        uploaded.mETag = hasher->finish();

    progress(context, chunk.mLength);

    return uploaded;
}

ChunkWorker::ChunkWorker(HttpClient& client,
                         SignedUrlProvider& urls,
                         const RetryPolicy& policy,
                         const TransferOptions& options,
                         ProgressReporter* reporter)
  : mClient(client)
  , mConnectTimeout(options.mConnectTimeout)
  , mHasherFactory(options.mHasherFactory ? options.mHasherFactory : md5Hasher)
  , mPolicy(policy)
  , mReporter(reporter)
  , mRequestTimeout(options.mRequestTimeout)
  , mUrls(urls)
{
}

fs::path ChunkWorker::partialPath(const fs::path& parts, std::uint32_t index)
{
    return parts / (std::to_string(index) + ".partial");
}

fs::path ChunkWorker::partPath(const fs::path& parts, std::uint32_t index)
{
    return parts / std::to_string(index);
}

TransferErrorOr<ChunkDescriptor> ChunkWorker::transfer(const ChunkDescriptor& chunk,
                                                       const ChunkContext& context) const
{
    auto what = common::format("%s of chunk %u of %s",
                               toString(context.mDirection),
                               chunk.mIndex,
                               context.mIdentity.toString().c_str());

    return mPolicy.run([&](RetryState&) {
        if (context.mDirection == TD_DOWNLOAD)
            return download(chunk, context);

        return upload(chunk, context);
    }, context.mCancel, what.c_str());
}

} // transfer
} // synapse
