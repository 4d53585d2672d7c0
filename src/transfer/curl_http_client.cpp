#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <curl/curl.h>

#include <synapse/transfer/curl_http_client.h>
#include <synapse/transfer/logging.h>

namespace synapse
{
namespace transfer
{
namespace
{

// Largest error body we'll keep around for diagnostics.
constexpr std::size_t kMaximumErrorBody = 1u << 16;

// Owns a libcurl easy handle.
class EasyCurl
{
    CURL* mCurl;

public:
    EasyCurl()
      : mCurl(curl_easy_init())
    {
        if (!mCurl)
            throw std::runtime_error("curl_easy_init returned null");
    }

    EasyCurl(EasyCurl&& other)
      : mCurl(std::exchange(other.mCurl, nullptr))
    {
    }

    EasyCurl(const EasyCurl& other) = delete;

    ~EasyCurl()
    {
        if (mCurl)
            curl_easy_cleanup(mCurl);
    }

    EasyCurl& operator=(EasyCurl&& rhs)
    {
        using std::swap;

        swap(mCurl, rhs.mCurl);

        return *this;
    }

    EasyCurl& operator=(const EasyCurl& rhs) = delete;

    CURL* get() const
    {
        return mCurl;
    }
}; // EasyCurl

// State shared with libcurl's callbacks.
struct CurlTransfer
{
    explicit CurlTransfer(HttpRequest& request, CURL* handle)
      : mHandle(handle)
      , mRequest(request)
      , mResponse()
      , mSent(0u)
      , mSinkFailed(false)
      , mSourceFailed(false)
    {
    }

    CURL* mHandle;
    HttpRequest& mRequest;
    HttpResponse mResponse;
    std::uint64_t mSent;
    bool mSinkFailed;
    bool mSourceFailed;
}; // CurlTransfer

std::string trim(const std::string& value)
{
    auto space = [](unsigned char c) { return std::isspace(c); };

    auto begin = std::find_if_not(value.begin(), value.end(), space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), space).base();

    if (begin >= end)
        return std::string();

    return std::string(begin, end);
}

std::size_t onHeader(char* buffer, std::size_t size, std::size_t count, void* context)
{
    auto& transfer = *static_cast<CurlTransfer*>(context);
    auto length = size * count;

    std::string line(buffer, length);

    // A new response has begun (redirects, interim responses.)
    if (line.compare(0, 5, "HTTP/") == 0)
    {
        transfer.mResponse.mHeaders.clear();
        return length;
    }

    auto colon = line.find(':');

    if (colon == std::string::npos)
        return length;

    auto name = canonicalHeader(trim(line.substr(0, colon)));

    transfer.mResponse.mHeaders[name] = trim(line.substr(colon + 1));

    return length;
}

std::size_t onWrite(char* data, std::size_t size, std::size_t count, void* context)
{
    auto& transfer = *static_cast<CurlTransfer*>(context);
    auto length = size * count;
    long status = 0;

    curl_easy_getinfo(transfer.mHandle, CURLINFO_RESPONSE_CODE, &status);

    transfer.mResponse.mBodyLength += length;

    // Successful content goes to the caller's sink.
    if (status >= 200 && status < 300 && transfer.mRequest.mBodySink)
    {
        if (transfer.mRequest.mBodySink(data, length))
            return length;

        transfer.mSinkFailed = true;

        // Any value other than length aborts the transfer.
        return 0;
    }

    auto& body = transfer.mResponse.mBody;

    if (body.size() < kMaximumErrorBody)
        body.append(data, std::min(length, kMaximumErrorBody - body.size()));

    return length;
}

std::size_t onRead(char* buffer, std::size_t size, std::size_t count, void* context)
{
    auto& transfer = *static_cast<CurlTransfer*>(context);
    auto& request = transfer.mRequest;

    auto remaining = request.mBodyLength - transfer.mSent;
    auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(size * count, remaining));

    if (!wanted)
        return 0;

    if (!request.mBodySource)
    {
        transfer.mSourceFailed = true;
        return CURL_READFUNC_ABORT;
    }

    auto provided = request.mBodySource(buffer, wanted);

    if (provided != wanted)
    {
        transfer.mSourceFailed = true;
        return CURL_READFUNC_ABORT;
    }

    transfer.mSent += provided;

    return provided;
}

int onProgress(void* context, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto& transfer = *static_cast<CurlTransfer*>(context);

    // Non-zero aborts the transfer.
    return transfer.mRequest.mCancel.triggered() ? 1 : 0;
}

bool transient(CURLcode result)
{
    switch (result)
    {
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_GOT_NOTHING:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_PARTIAL_FILE:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_SSL_CONNECT_ERROR:
        return true;
    default:
        return false;
    }
}

using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // anonymous

CurlHttpClient::CurlHttpClient()
{
    static std::once_flag initialized;

    std::call_once(initialized, []() {
        auto result = curl_global_init(CURL_GLOBAL_DEFAULT);

        if (result != CURLE_OK)
            throw TXErrorF("Couldn't initialize libcurl: %s",
                           curl_easy_strerror(result));
    });

    TXDebugF("HTTP client constructed (%s)", curl_version());
}

CurlHttpClient::~CurlHttpClient()
{
}

TransferErrorOr<HttpResponse> CurlHttpClient::perform(HttpRequest& request)
{
    EasyCurl curl;
    CurlTransfer transfer(request, curl.get());
    HeaderList headers(nullptr, curl_slist_free_all);

    auto* handle = curl.get();

    // Assemble request headers.
    for (const auto& [name, value] : request.mHeaders)
    {
        auto line = name + ": " + value;
        auto* list = curl_slist_append(headers.get(), line.c_str());

        if (!list)
            return common::unexpected(TransferError(TRANSFER_FATAL,
                                                    "Couldn't allocate request headers"));

        headers.release();
        headers.reset(list);
    }

    // Don't wait for permission to send a body.
    if (auto* list = curl_slist_append(headers.get(), "Expect:"))
    {
        headers.release();
        headers.reset(list);
    }

    curl_easy_setopt(handle, CURLOPT_URL, request.mUrl.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.mConnectTimeout.count()));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.mTimeout.count()));
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, onWrite);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);

    auto bodyLength = static_cast<curl_off_t>(request.mBodyLength);

    if (request.mMethod == "GET")
    {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }
    else if (request.mMethod == "PUT")
    {
        curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, bodyLength);
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, onRead);
        curl_easy_setopt(handle, CURLOPT_READDATA, &transfer);
    }
    else if (request.mMethod == "POST")
    {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, bodyLength);
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, onRead);
        curl_easy_setopt(handle, CURLOPT_READDATA, &transfer);
    }
    else
    {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.mMethod.c_str());
    }

    auto result = curl_easy_perform(handle);

    if (result != CURLE_OK)
    {
        std::string message = curl_easy_strerror(result);

        TXDebugF("%s %s failed: %s",
                 request.mMethod.c_str(),
                 request.mUrl.c_str(),
                 message.c_str());

        if (request.mCancel.triggered() || result == CURLE_ABORTED_BY_CALLBACK)
            return common::unexpected(TransferError(TRANSFER_CANCELLED,
                                                    "Request was cancelled"));

        if (transfer.mSinkFailed)
            return common::unexpected(TransferError(TRANSFER_FATAL,
                                                    "Response body was rejected"));

        if (transfer.mSourceFailed)
            return common::unexpected(TransferError(TRANSFER_FATAL,
                                                    "Couldn't read request body"));

        return common::unexpected(errorFromTransport(message, transient(result)));
    }

    long status = 0;

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);

    transfer.mResponse.mStatus = static_cast<int>(status);

    return std::move(transfer.mResponse);
}

} // transfer
} // synapse
