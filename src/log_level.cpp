#include <algorithm>
#include <cctype>

#include <synapse/log_level.h>

namespace synapse
{

static bool equalsIgnoringCase(const std::string& lhs, const char* rhs)
{
    std::string other(rhs);

    return std::equal(lhs.begin(), lhs.end(), other.begin(), other.end(), [](char l, char r) {
        return std::toupper(static_cast<unsigned char>(l))
               == std::toupper(static_cast<unsigned char>(r));
    });
}

LogLevel toLogLevel(const std::string& level)
{
#define SYNAPSE_LOG_LEVEL_CLAUSE(name) \
    if (equalsIgnoringCase(level, #name)) \
        return log ## name;

    SYNAPSE_LOG_LEVELS(SYNAPSE_LOG_LEVEL_CLAUSE)

#undef SYNAPSE_LOG_LEVEL_CLAUSE

    // Unrecognized levels fall back to the default.
    return logInfo;
}

const char* toString(LogLevel level)
{
    switch (level)
    {
#define SYNAPSE_LOG_LEVEL_CLAUSE(name) \
    case log ## name: \
        return #name;

        SYNAPSE_LOG_LEVELS(SYNAPSE_LOG_LEVEL_CLAUSE)

#undef SYNAPSE_LOG_LEVEL_CLAUSE
    }

    return "N/A";
}

} // synapse
