#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

// Copy source to target by way of a temporary file beside target.
//
// Returns the number of bytes copied.
TransferErrorOr<std::uint64_t> copyAtomically(const std::filesystem::path& source,
                                              const std::filesystem::path& target);

// Remove a file or an empty directory, ignoring failure.
void removeQuietly(const std::filesystem::path& path);

// Compute a temporary name for target, in the same directory.
//
// Only a prefix of target's name is used so that the result stays a
// legal name however long target's is.
std::filesystem::path temporaryPath(const std::filesystem::path& target);

// Write data to target by way of a temporary file beside target.
//
// Returns the number of bytes written.
TransferErrorOr<std::uint64_t> writeAtomically(const std::filesystem::path& target,
                                               const std::string& data);

} // transfer
} // synapse
