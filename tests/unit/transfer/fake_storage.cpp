#include <algorithm>
#include <cstdio>

#include <synapse/transfer/digest.h>

#include <transfer/fake_storage.h>

namespace synapse
{
namespace transfer
{
namespace testing
{

static const std::string kPrefix = "fake://storage/";

// How much content is handed to a sink at once?
constexpr std::size_t kDeliverySize = 4096u;

// Decrements a counter when we leave scope.
class InFlight
{
    std::size_t& mCount;
    std::mutex& mLock;

public:
    InFlight(std::size_t& count, std::mutex& lock)
      : mCount(count)
      , mLock(lock)
    {
    }

    ~InFlight()
    {
        std::lock_guard<std::mutex> guard(mLock);

        --mCount;
    }
}; // InFlight

static TransferErrorOr<HttpResponse> injected(const Fault& fault)
{
    if (fault.mTransport)
        return common::unexpected(errorFromTransport("Connection reset by peer", true));

    HttpResponse response;

    response.mBody = "Injected failure";
    response.mStatus = fault.mStatus;

    if (fault.mRetryAfter)
        response.mHeaders["retry-after"] = std::to_string(fault.mRetryAfter->count());

    return response;
}

std::optional<FakeStorage::ChunkKey> FakeStorage::parse(const std::string& url)
{
    if (url.compare(0, kPrefix.size(), kPrefix))
        return std::nullopt;

    auto path = url.substr(kPrefix.size());
    auto first = path.find('/');
    auto second = path.find('/', first + 1);

    if (first == std::string::npos || second == std::string::npos)
        return std::nullopt;

    auto handle = path.substr(0, first);
    auto direction = path.substr(first + 1, second - first - 1);
    auto index = static_cast<std::uint32_t>(std::stoul(path.substr(second + 1)));

    return ChunkKey(handle, direction == "upload" ? TD_UPLOAD : TD_DOWNLOAD, index);
}

TransferErrorOr<HttpResponse> FakeStorage::download(HttpRequest& request,
                                                    const std::string& handle,
                                                    const Fault* fault)
{
    std::string content;

    {
        std::lock_guard<std::mutex> guard(mLock);

        auto i = mObjects.find(handle);

        if (i == mObjects.end())
        {
            HttpResponse response;

            response.mBody = "No such object";
            response.mStatus = 404;

            return response;
        }

        content = i->second;
    }

    HttpResponse response;

    response.mStatus = 200;

    auto range = request.mHeaders.find("Range");

    if (range != request.mHeaders.end())
    {
        unsigned long long begin = 0;
        unsigned long long end = 0;

        if (std::sscanf(range->second.c_str(), "bytes=%llu-%llu", &begin, &end) != 2
            || begin > end
            || begin >= content.size())
        {
            response.mStatus = 416;
            response.mBody = "Range not satisfiable";

            return response;
        }

        end = std::min<unsigned long long>(end, content.size() - 1);

        content = content.substr(begin, end - begin + 1);

        response.mStatus = 206;
    }

    if (fault && fault->mTruncate)
        content.resize(content.size() / 2);

    if (!request.mBodySink)
    {
        response.mBody = content;
        response.mBodyLength = content.size();

        return response;
    }

    for (std::size_t offset = 0; offset < content.size(); offset += kDeliverySize)
    {
        auto length = std::min(kDeliverySize, content.size() - offset);

        if (!request.mBodySink(content.data() + offset, length))
            return common::unexpected(TransferError(TRANSFER_FATAL,
                                                    "Response body was rejected"));

        response.mBodyLength += length;
    }

    return response;
}

TransferErrorOr<HttpResponse> FakeStorage::upload(HttpRequest& request, const ChunkKey& key)
{
    auto length = static_cast<std::size_t>(request.mBodyLength);

    std::string body(length, '\0');

    if (length)
    {
        auto provided = request.mBodySource ? request.mBodySource(body.data(), length) : 0u;

        if (provided != length)
            return common::unexpected(TransferError(TRANSFER_FATAL,
                                                    "Couldn't read request body"));
    }

    HttpResponse response;

    response.mStatus = 200;

    std::lock_guard<std::mutex> guard(mLock);

    mParts[std::get<0>(key)][std::get<2>(key)] = body;

    if (!mOmitETags)
        response.mHeaders["etag"] = "\"" + md5Hex(body) + "\"";

    return response;
}

bool FakeStorage::wait(HttpRequest& request, std::unique_lock<std::mutex>& lock)
{
    ++mBlockedCount;

    mCV.notify_all();

    while (!mReleased)
    {
        if (request.mCancel.triggered())
        {
            --mBlockedCount;
            return false;
        }

        mCV.wait_for(lock, std::chrono::milliseconds(1));
    }

    --mBlockedCount;

    return true;
}

FakeStorage::FakeStorage()
  : mBlocked()
  , mBlockedCount(0u)
  , mCompletions(0u)
  , mCompletionFaults()
  , mCV()
  , mFaults()
  , mInFlight(0u)
  , mLock()
  , mMaximumInFlight(0u)
  , mObjects()
  , mOmitETags(false)
  , mParts()
  , mReleased(false)
  , mRequests()
  , mURLs(0u)
{
}

void FakeStorage::block(const std::string& handle,
                        TransferDirection direction,
                        std::uint32_t index)
{
    std::lock_guard<std::mutex> guard(mLock);

    mBlocked.emplace(handle, direction, index);
    mReleased = false;
}

TransferErrorOr<std::string> FakeStorage::complete(const FileIdentity& identity,
                                                   const ChunkDescriptorVector& parts)
{
    std::lock_guard<std::mutex> guard(mLock);

    ++mCompletions;

    if (!mCompletionFaults.empty())
    {
        auto fault = mCompletionFaults.front();

        mCompletionFaults.erase(mCompletionFaults.begin());

        if (fault.mTransport)
            return common::unexpected(errorFromTransport("Connection timed out", true));

        return common::unexpected(errorFromStatus(fault.mStatus,
                                                  "Injected failure",
                                                  fault.mRetryAfter));
    }

    auto& stored = mParts[identity.handle()];

    std::string content;

    for (auto& part : parts)
    {
        auto i = stored.find(part.mIndex);

        if (i == stored.end())
            return common::unexpected(errorFromStatus(400, "Missing part"));

        if (part.mETag != md5Hex(i->second))
            return common::unexpected(errorFromStatus(400, "ETag mismatch"));

        content += i->second;
    }

    if (md5Hex(content) != identity.digest() || content.size() != identity.size())
        return common::unexpected(errorFromStatus(400, "Digest mismatch"));

    mObjects[identity.handle()] = std::move(content);
    mParts.erase(identity.handle());

    return "object:" + identity.handle();
}

std::size_t FakeStorage::completions() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mCompletions;
}

void FakeStorage::fail(const std::string& handle,
                       TransferDirection direction,
                       std::uint32_t index,
                       const Fault& fault,
                       std::size_t count)
{
    std::lock_guard<std::mutex> guard(mLock);

    auto& faults = mFaults[ChunkKey(handle, direction, index)];

    faults.insert(faults.end(), count, fault);
}

void FakeStorage::failCompletion(const Fault& fault, std::size_t count)
{
    std::lock_guard<std::mutex> guard(mLock);

    mCompletionFaults.insert(mCompletionFaults.end(), count, fault);
}

std::size_t FakeStorage::maximumInFlight() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mMaximumInFlight;
}

std::optional<std::string> FakeStorage::object(const std::string& handle) const
{
    std::lock_guard<std::mutex> guard(mLock);

    auto i = mObjects.find(handle);

    if (i == mObjects.end())
        return std::nullopt;

    return i->second;
}

void FakeStorage::omitETags()
{
    std::lock_guard<std::mutex> guard(mLock);

    mOmitETags = true;
}

TransferErrorOr<HttpResponse> FakeStorage::perform(HttpRequest& request)
{
    auto key = parse(request.mUrl);

    if (!key)
        return common::unexpected(errorFromTransport("Couldn't resolve host", false));

    std::unique_lock<std::mutex> lock(mLock);

    ++mRequests[*key];

    mMaximumInFlight = std::max(mMaximumInFlight, ++mInFlight);

    InFlight inFlight(mInFlight, mLock);

    std::optional<Fault> fault;

    auto faults = mFaults.find(*key);

    if (faults != mFaults.end() && !faults->second.empty())
    {
        fault = faults->second.front();
        faults->second.erase(faults->second.begin());
    }

    if (mBlocked.count(*key) && !wait(request, lock))
    {
        lock.unlock();

        return common::unexpected(TransferError(TRANSFER_CANCELLED,
                                                "Request was cancelled"));
    }

    lock.unlock();

    if (fault && (fault->mTransport || fault->mStatus))
        return injected(*fault);

    if (std::get<1>(*key) == TD_DOWNLOAD)
        return download(request, std::get<0>(*key), fault ? &*fault : nullptr);

    return upload(request, *key);
}

void FakeStorage::put(const std::string& handle, std::string content)
{
    std::lock_guard<std::mutex> guard(mLock);

    mObjects[handle] = std::move(content);
}

void FakeStorage::release()
{
    std::lock_guard<std::mutex> guard(mLock);

    mBlocked.clear();
    mReleased = true;

    mCV.notify_all();
}

std::size_t FakeStorage::requests(const std::string& handle,
                                  TransferDirection direction,
                                  std::uint32_t index) const
{
    std::lock_guard<std::mutex> guard(mLock);

    auto i = mRequests.find(ChunkKey(handle, direction, index));

    if (i == mRequests.end())
        return 0u;

    return i->second;
}

std::size_t FakeStorage::requests() const
{
    std::lock_guard<std::mutex> guard(mLock);

    std::size_t total = 0;

    for (auto& r : mRequests)
        total += r.second;

    return total;
}

TransferErrorOr<SignedUrl> FakeStorage::url(const FileIdentity& identity,
                                            TransferDirection direction,
                                            std::uint32_t chunkIndex)
{
    std::lock_guard<std::mutex> guard(mLock);

    ++mURLs;

    SignedUrl url;

    url.mHeaders["x-signature"] = "fake";
    url.mUrl = kPrefix + identity.handle() + "/" + toString(direction)
               + "/" + std::to_string(chunkIndex);

    return url;
}

std::size_t FakeStorage::urls() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mURLs;
}

bool FakeStorage::waitUntilBlocked(std::size_t count, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mLock);

    return mCV.wait_for(lock, timeout, [&]() { return mBlockedCount >= count; });
}

} // testing
} // transfer
} // synapse
