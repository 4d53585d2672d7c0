#include <atomic>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>

#include <unistd.h>

#include <transfer/test_utilities.h>

namespace synapse
{
namespace transfer
{
namespace testing
{

namespace fs = std::filesystem;

TemporaryDirectory::TemporaryDirectory()
  : mPath()
{
    static std::atomic<unsigned int> counter{0u};

    std::random_device device;

    mPath = fs::temp_directory_path()
            / ("synapse_test_" + std::to_string(::getpid())
               + "_" + std::to_string(counter++)
               + "_" + std::to_string(device()));

    fs::create_directories(mPath);
}

TemporaryDirectory::~TemporaryDirectory()
{
    std::error_code error;

    fs::remove_all(mPath, error);
}

fs::path TemporaryDirectory::operator/(const std::string& name) const
{
    return mPath / name;
}

const fs::path& TemporaryDirectory::path() const
{
    return mPath;
}

std::string randomContent(std::size_t length, unsigned int seed)
{
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);

    std::string content(length, '\0');

    for (auto& c : content)
        c = static_cast<char>(distribution(generator));

    return content;
}

std::string readFile(const fs::path& path)
{
    std::ifstream stream(path, std::ios::binary);

    if (!stream)
        throw std::runtime_error("Couldn't open " + path.string());

    return std::string(std::istreambuf_iterator<char>(stream),
                       std::istreambuf_iterator<char>());
}

TransferOptions testOptions(const fs::path& root)
{
    TransferOptions options;

    options.mCacheRoot = root / "cache";
    options.mChunkLimits.mMinimumSize = 1u;
    options.mChunkLimits.mMaximumSize = 1u << 30;
    options.mChunkLimits.mMaximumCount = 10000u;
    options.mChunkSize = 1024u;
    options.mConcurrency = 4u;
    options.mProgressInterval = std::chrono::milliseconds(0);
    options.mRetry.mMaximumAttempts = 3u;
    options.mRetry.mInitialDelay = std::chrono::milliseconds(1);
    options.mRetry.mMaximumDelay = std::chrono::milliseconds(4);
    options.mStateDirectory = root / "state";

    return options;
}

void writeFile(const fs::path& path, const std::string& content)
{
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());

    std::ofstream stream(path, std::ios::binary | std::ios::trunc);

    stream.write(content.data(), static_cast<std::streamsize>(content.size()));

    if (!stream)
        throw std::runtime_error("Couldn't write " + path.string());
}

} // testing
} // transfer
} // synapse
