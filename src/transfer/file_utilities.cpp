#include <atomic>
#include <chrono>
#include <fstream>
#include <random>

#include <synapse/common/utility.h>
#include <synapse/transfer/file_utilities.h>
#include <synapse/transfer/logging.h>

namespace synapse
{
namespace transfer
{

namespace fs = std::filesystem;

static const std::string kTemporarySuffix = ".tmp";

// Longest prefix of the target's name we'll embed in a temporary name.
constexpr std::size_t kTemporaryLeafLength = 64u;

TransferErrorOr<std::uint64_t> copyAtomically(const fs::path& source,
                                              const fs::path& target)
{
    std::error_code error;

    auto temporary = temporaryPath(target);

    fs::copy_file(source, temporary, fs::copy_options::overwrite_existing, error);

    if (error)
    {
        removeQuietly(temporary);

        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't copy " + source.string()
                                                + ": " + error.message()));
    }

    auto size = fs::file_size(temporary, error);

    if (!error)
        fs::rename(temporary, target, error);

    if (error)
    {
        removeQuietly(temporary);

        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't move " + temporary.string()
                                                + " into place: " + error.message()));
    }

    return size;
}

void removeQuietly(const fs::path& path)
{
    std::error_code error;

    fs::remove(path, error);

    if (error)
        TXDebugF("Couldn't remove %s: %s",
                 path.string().c_str(),
                 error.message().c_str());
}

fs::path temporaryPath(const fs::path& target)
{
    static std::atomic<std::uint64_t> counter{0};
    static const auto seed = std::random_device()();

    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    auto leaf = target.filename().string();

    // Keep the name well clear of NAME_MAX.
    if (leaf.size() > kTemporaryLeafLength)
    {
        auto length = kTemporaryLeafLength;

        // Don't split a UTF-8 sequence.
        while (length && (static_cast<unsigned char>(leaf[length]) & 0xc0) == 0x80)
            --length;

        leaf.resize(length);
    }

    auto name = common::format(".%s.%x%llx%llx",
                               leaf.c_str(),
                               seed,
                               static_cast<unsigned long long>(ticks),
                               static_cast<unsigned long long>(counter++));

    return target.parent_path() / (name + kTemporarySuffix);
}

TransferErrorOr<std::uint64_t> writeAtomically(const fs::path& target,
                                               const std::string& data)
{
    auto temporary = temporaryPath(target);

    {
        std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);

        if (stream)
            stream.write(data.data(), static_cast<std::streamsize>(data.size()));

        if (stream)
            stream.flush();

        if (!stream)
        {
            stream.close();

            removeQuietly(temporary);

            return common::unexpected(TransferError(TRANSFER_FATAL,
                                                    "Couldn't write " + temporary.string()));
        }
    }

    std::error_code error;

    fs::rename(temporary, target, error);

    if (error)
    {
        removeQuietly(temporary);

        return common::unexpected(TransferError(TRANSFER_FATAL,
                                                "Couldn't move " + temporary.string()
                                                + " into place: " + error.message()));
    }

    return static_cast<std::uint64_t>(data.size());
}

} // transfer
} // synapse
