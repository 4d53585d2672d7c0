#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include <synapse/transfer/progress_reporter.h>

using namespace synapse::transfer;

using std::chrono::milliseconds;

TEST(ProgressReporter, AggregatesFiles)
{
    ProgressReporter reporter(milliseconds(0));

    reporter.begin(1u, "first", 1000u);
    reporter.begin(2u, "second", 3000u, 1000u);

    reporter.report(1u, 250u);
    reporter.report(2u, 500u);

    auto snapshot = reporter.snapshot();

    ASSERT_EQ(snapshot.mFiles.size(), 2u);
    EXPECT_EQ(snapshot.mTotal, 4000u);
    EXPECT_EQ(snapshot.mTransferred, 1750u);

    EXPECT_EQ(snapshot.mFiles[0].mName, "first");
    EXPECT_EQ(snapshot.mFiles[0].mTransferred, 250u);
    EXPECT_FALSE(snapshot.mFiles[0].mResult);

    EXPECT_EQ(snapshot.mFiles[1].mResumed, 1000u);
    EXPECT_EQ(snapshot.mFiles[1].mTransferred, 1500u);
}

TEST(ProgressReporter, ProgressIsClampedToSize)
{
    ProgressReporter reporter(milliseconds(0));

    reporter.begin(1u, "file", 100u, 500u);

    EXPECT_EQ(reporter.snapshot().mFiles[0].mResumed, 100u);

    reporter.begin(2u, "other", 100u);
    reporter.report(2u, 250u);

    EXPECT_EQ(reporter.snapshot().mFiles[1].mTransferred, 100u);

    // Unknown transfers are ignored.
    reporter.report(3u, 10u);

    EXPECT_EQ(reporter.snapshot().mFiles.size(), 2u);
}

TEST(ProgressReporter, FinishPublishesTerminalSnapshot)
{
    ProgressReporter reporter(milliseconds(0));

    std::vector<ProgressSnapshot> snapshots;

    reporter.subscribe([&](const ProgressSnapshot& snapshot) {
        snapshots.emplace_back(snapshot);
    });

    reporter.begin(1u, "done", 100u);
    reporter.begin(2u, "failed", 100u);

    reporter.report(1u, 40u);
    reporter.report(2u, 40u);

    reporter.finish(1u, TRANSFER_SUCCESS);

    ASSERT_EQ(snapshots.back().mFiles.size(), 2u);
    EXPECT_EQ(snapshots.back().mFiles[0].mResult, TRANSFER_SUCCESS);
    EXPECT_EQ(snapshots.back().mFiles[0].mTransferred, 100u);
    EXPECT_EQ(snapshots.back().mTransferred, 140u);

    reporter.finish(2u, TRANSFER_FATAL);

    // The concluded transfer was forgotten once its snapshot was built.
    ASSERT_EQ(snapshots.back().mFiles.size(), 1u);
    EXPECT_EQ(snapshots.back().mFiles[0].mID, 2u);
    EXPECT_EQ(snapshots.back().mFiles[0].mResult, TRANSFER_FATAL);
    EXPECT_EQ(snapshots.back().mFiles[0].mTransferred, 40u);

    auto published = snapshots.size();

    // Late reports change nothing.
    reporter.report(2u, 10u);
    reporter.finish(2u, TRANSFER_FATAL);

    EXPECT_EQ(snapshots.size(), published);
}

TEST(ProgressReporter, ConcludedTransfersAreForgotten)
{
    ProgressReporter reporter(milliseconds(0));

    for (std::uint64_t id = 1; id <= 100; ++id)
    {
        reporter.begin(id, "file", 10u);
        reporter.report(id, 10u);
        reporter.finish(id, TRANSFER_SUCCESS);
    }

    auto snapshot = reporter.snapshot();

    EXPECT_TRUE(snapshot.mFiles.empty());
    EXPECT_EQ(snapshot.mTotal, 0u);
    EXPECT_EQ(snapshot.mTransferred, 0u);
    EXPECT_EQ(snapshot.mElapsed.count(), 0);

    // Only what's outstanding contributes to the totals.
    reporter.begin(101u, "active", 50u);
    reporter.begin(102u, "finished", 20u);
    reporter.finish(102u, TRANSFER_SUCCESS);

    snapshot = reporter.snapshot();

    ASSERT_EQ(snapshot.mFiles.size(), 1u);
    EXPECT_EQ(snapshot.mFiles[0].mID, 101u);
    EXPECT_EQ(snapshot.mTotal, 50u);
}

TEST(ProgressReporter, PublishesToSubscribers)
{
    ProgressReporter reporter(milliseconds(0));

    std::vector<std::uint64_t> transferred;

    auto id = reporter.subscribe([&](const ProgressSnapshot& snapshot) {
        transferred.emplace_back(snapshot.mTransferred);
    });

    reporter.begin(1u, "file", 100u);
    reporter.report(1u, 10u);
    reporter.report(1u, 20u);

    EXPECT_EQ(transferred, (std::vector<std::uint64_t>{0u, 10u, 30u}));

    EXPECT_TRUE(reporter.unsubscribe(id));
    EXPECT_FALSE(reporter.unsubscribe(id));

    reporter.report(1u, 5u);

    EXPECT_EQ(transferred.size(), 3u);
}

TEST(ProgressReporter, PublicationIsRateLimited)
{
    ProgressReporter reporter(milliseconds(60000));

    std::size_t published = 0;

    reporter.subscribe([&](const ProgressSnapshot&) {
        ++published;
    });

    reporter.begin(1u, "file", 100u);

    for (auto i = 0; i < 10; ++i)
        reporter.report(1u, 1u);

    EXPECT_EQ(published, 1u);

    // Conclusions are always published.
    reporter.finish(1u, TRANSFER_SUCCESS);

    EXPECT_EQ(published, 2u);

    reporter.publish();

    EXPECT_EQ(published, 3u);
}

TEST(ProgressReporter, MisbehavingSubscribersAreIgnored)
{
    ProgressReporter reporter(milliseconds(0));

    std::size_t published = 0;

    reporter.subscribe([](const ProgressSnapshot&) {
        throw std::runtime_error("subscriber failed");
    });

    reporter.subscribe([&](const ProgressSnapshot&) {
        ++published;
    });

    EXPECT_NO_THROW(reporter.begin(1u, "file", 100u));
    EXPECT_NO_THROW(reporter.report(1u, 50u));
    EXPECT_EQ(published, 2u);
}

TEST(ProgressReporter, SubscribersThrowingAnythingAreIgnored)
{
    ProgressReporter reporter(milliseconds(0));

    std::size_t published = 0;

    reporter.subscribe([](const ProgressSnapshot&) {
        throw 42;
    });

    reporter.subscribe([&](const ProgressSnapshot&) {
        ++published;
    });

    EXPECT_NO_THROW(reporter.begin(1u, "file", 100u));
    EXPECT_NO_THROW(reporter.report(1u, 50u));
    EXPECT_NO_THROW(reporter.finish(1u, TRANSFER_SUCCESS));
    EXPECT_EQ(published, 3u);
}

TEST(ProgressReporter, Describe)
{
    ProgressSnapshot snapshot;

    FileProgress first;

    first.mName = "alpha";
    first.mTotal = 2048u;
    first.mTransferred = 1024u;

    FileProgress second;

    second.mName = "beta";
    second.mTotal = 100u;
    second.mTransferred = 100u;
    second.mResult = TRANSFER_SUCCESS;

    FileProgress third;

    third.mName = "gamma";
    third.mTotal = 10u;
    third.mResult = TRANSFER_INTEGRITY;

    snapshot.mFiles = {first, second, third};
    snapshot.mTotal = 2158u;
    snapshot.mTransferred = 1124u;

    auto description = ProgressReporter::describe(snapshot);

    EXPECT_EQ(description,
              "alpha: 50.0% (1.00 KiB of 2.00 KiB) at 0 B/s\n"
              "beta: 100.0% (100 B of 100 B) at 0 B/s done\n"
              "gamma: 0.0% (0 B of 10 B) at 0 B/s INTEGRITY: "
              "The content does not match its expected digest\n"
              "Total: 3 files, 52.1% (1.10 KiB of 2.11 KiB) at 0 B/s");
}
