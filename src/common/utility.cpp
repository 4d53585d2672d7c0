#include <cstdio>
#include <iterator>

#include <synapse/common/utility.h>

namespace synapse
{
namespace common
{

std::string format(const char* format, ...)
{
    std::va_list arguments;

    va_start(arguments, format);

    auto result = formatv(arguments, format);

    va_end(arguments);

    return result;
}

std::string formatv(std::va_list arguments, const char* format)
{
    // Most messages fit without a second pass.
    char buffer[256];
    std::va_list copy;

    va_copy(copy, arguments);

    auto length = std::vsnprintf(buffer, sizeof(buffer), format, copy);

    va_end(copy);

    if (length < 0)
        return std::string();

    if (static_cast<std::size_t>(length) < sizeof(buffer))
        return std::string(buffer, static_cast<std::size_t>(length));

    std::string result(static_cast<std::size_t>(length), '\0');

    va_copy(copy, arguments);

    // vsnprintf always writes a terminator.
    std::vsnprintf(result.data(), result.size() + 1, format, copy);

    va_end(copy);

    return result;
}

std::string humanize(std::uint64_t bytes)
{
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};

    auto value = static_cast<double>(bytes);
    auto unit = 0u;

    while (value >= 1024.0 && unit + 1 < std::size(units))
    {
        value /= 1024.0;
        ++unit;
    }

    // Bytes are always whole.
    if (!unit)
        return format("%llu B", static_cast<unsigned long long>(bytes));

    return format("%.2f %s", value, units[unit]);
}

} // common
} // synapse
