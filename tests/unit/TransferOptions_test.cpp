#include <stdexcept>
#include <utility>

#include <gtest/gtest.h>

#include <synapse/transfer/transfer_options.h>

using namespace synapse::transfer;

TEST(TransferOptions, Defaults)
{
    TransferOptions options;

    EXPECT_EQ(options.mChunkSize, 8ull << 20);
    EXPECT_EQ(options.mChunkLimits.mMinimumSize, 5ull << 20);
    EXPECT_EQ(options.mChunkLimits.mMaximumSize, 5ull << 30);
    EXPECT_EQ(options.mChunkLimits.mMaximumCount, 10000u);
    EXPECT_EQ(options.mRetry.mMaximumAttempts, 7u);
    EXPECT_EQ(options.mProgressInterval.count(), 250);

    auto concurrency = defaultConcurrency();

    EXPECT_GE(concurrency, 4u);
    EXPECT_LE(concurrency, 32u);

    EXPECT_EQ(defaultCacheRoot().filename().string(), ".synapseCache");
}

TEST(TransferOptions, NormalizeFillsDerivedDefaults)
{
    auto options = normalize(TransferOptions());

    EXPECT_EQ(options.mConcurrency, defaultConcurrency());
    EXPECT_EQ(options.mCacheRoot.string(), defaultCacheRoot().string());
    EXPECT_EQ(options.mStateDirectory.string(), (defaultCacheRoot() / ".sessions").string());
    ASSERT_TRUE(options.mHasherFactory);
    EXPECT_TRUE(options.mHasherFactory());
}

TEST(TransferOptions, NormalizeKeepsExplicitValues)
{
    TransferOptions options;

    options.mCacheRoot = "/tmp/cache";
    options.mConcurrency = 3;
    options.mStateDirectory = "/tmp/state";

    options = normalize(std::move(options));

    EXPECT_EQ(options.mCacheRoot.string(), "/tmp/cache");
    EXPECT_EQ(options.mConcurrency, 3u);
    EXPECT_EQ(options.mStateDirectory.string(), "/tmp/state");

    options.mStateDirectory.clear();

    EXPECT_EQ(normalize(options).mStateDirectory.string(), "/tmp/cache/.sessions");
}

TEST(TransferOptions, NormalizeRejectsInconsistentOptions)
{
    TransferOptions options;

    options.mChunkLimits.mMinimumSize = 2u << 20;
    options.mChunkLimits.mMaximumSize = 1u << 20;

    EXPECT_THROW(normalize(options), std::invalid_argument);

    options = TransferOptions();
    options.mChunkLimits.mMaximumSize = 0u;

    EXPECT_THROW(normalize(options), std::invalid_argument);

    options = TransferOptions();
    options.mRetry.mMaximumAttempts = 0u;

    EXPECT_THROW(normalize(options), std::invalid_argument);
}
