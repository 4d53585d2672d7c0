#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include <synapse/common/cancel_token.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

struct HttpRequest
{
    // What method should we use?
    std::string mMethod = "GET";

    // Where should the request be sent?
    std::string mUrl;

    // Additional request headers.
    std::map<std::string, std::string> mHeaders;

    // Supplies the request's body, if any.
    //
    // Called repeatedly to fill buffer with at most length bytes. Returns
    // the number of bytes provided. Returning fewer bytes than remain in
    // the body aborts the request.
    std::function<std::size_t(char* buffer, std::size_t length)> mBodySource;

    // How large is the request's body?
    std::uint64_t mBodyLength = 0u;

    // Receives the response's body when the response is successful.
    //
    // Returning false aborts the request. Bodies of unsuccessful responses
    // are always collected into HttpResponse::mBody.
    std::function<bool(const char* data, std::size_t length)> mBodySink;

    // How long may the whole request take?
    std::chrono::milliseconds mTimeout{60000};

    // How long may we take to establish a connection?
    std::chrono::milliseconds mConnectTimeout{20000};

    // Aborts the request when triggered.
    common::CancelToken mCancel;
}; // HttpRequest

struct HttpResponse
{
    // Retrieve a response header by case insensitive name.
    std::optional<std::string> header(const std::string& name) const;

    // Did the server report success?
    bool successful() const
    {
        return mStatus >= 200 && mStatus < 300;
    }

    // The response's HTTP status.
    int mStatus = 0;

    // Response headers keyed by lower case name.
    std::map<std::string, std::string> mHeaders;

    // Body of the response if no sink consumed it.
    std::string mBody;

    // How many body bytes were received?
    std::uint64_t mBodyLength = 0u;
}; // HttpResponse

// Performs HTTP requests on behalf of the engine.
//
// Implementations must be safe to use from several threads at once.
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    // Perform a request.
    //
    // Any response from the server, whatever its status, is returned as a
    // value. Failures below HTTP (timeouts, resets, cancellation) are
    // returned as errors.
    virtual TransferErrorOr<HttpResponse> perform(HttpRequest& request) = 0;
}; // HttpClient

// Lower case a header name.
std::string canonicalHeader(const std::string& name);

} // transfer
} // synapse
