#include <algorithm>
#include <cctype>

#include <synapse/transfer/http_client.h>

namespace synapse
{
namespace transfer
{

std::optional<std::string> HttpResponse::header(const std::string& name) const
{
    auto i = mHeaders.find(canonicalHeader(name));

    if (i != mHeaders.end())
        return i->second;

    return std::nullopt;
}

std::string canonicalHeader(const std::string& name)
{
    std::string result(name);

    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    return result;
}

} // transfer
} // synapse
