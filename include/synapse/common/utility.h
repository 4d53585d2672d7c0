#pragma once

#include <cstdarg>
#include <cstdint>
#include <string>

namespace synapse
{
namespace common
{

// printf into a std::string.
std::string format(const char* format, ...);

std::string formatv(std::va_list arguments, const char* format);

// Render a byte count such as 1536 as "1.50 KiB".
std::string humanize(std::uint64_t bytes);

} // common
} // synapse
