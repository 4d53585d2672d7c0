#pragma once

#include <synapse/transfer/http_client.h>

namespace synapse
{
namespace transfer
{

// Performs requests using libcurl.
//
// Each request uses its own easy handle so the client can be shared
// freely between threads.
class CurlHttpClient
  : public HttpClient
{
public:
    CurlHttpClient();

    CurlHttpClient(const CurlHttpClient& other) = delete;

    ~CurlHttpClient();

    CurlHttpClient& operator=(const CurlHttpClient& rhs) = delete;

    TransferErrorOr<HttpResponse> perform(HttpRequest& request) override;
}; // CurlHttpClient

} // transfer
} // synapse
