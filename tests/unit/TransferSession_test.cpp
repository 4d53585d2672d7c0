/**
 * @file TransferSession_test.cpp
 * @brief Checks the session state machine and its persistence.
 */

#include <gtest/gtest.h>

#include <synapse/transfer/digest.h>
#include <synapse/transfer/session_store.h>
#include <synapse/transfer/transfer_session.h>

#include <transfer/test_utilities.h>

using namespace synapse::transfer;
using namespace synapse::transfer::testing;

namespace fs = std::filesystem;

namespace
{

ChunkLimits smallLimits()
{
    ChunkLimits limits;

    limits.mMinimumSize = 1;

    return limits;
}

FileIdentity identityOf(const std::string& content)
{
    return FileIdentity("syn42", md5Hex(content), content.size());
}

} // anonymous

TEST(TransferSession, StartsPendingWithEveryChunkOutstanding)
{
    TransferSession session(FileIdentity("syn1", md5Hex("x"), 1000),
                            TD_DOWNLOAD,
                            "/tmp/file",
                            100,
                            smallLimits());

    EXPECT_EQ(session.status(), SESSION_PENDING);
    EXPECT_EQ(session.chunks().size(), 10u);
    EXPECT_EQ(session.pendingChunks().size(), 10u);
    EXPECT_EQ(session.completedCount(), 0u);
    EXPECT_EQ(session.bytesCompleted(), 0u);
    EXPECT_FALSE(session.allChunksComplete());
}

TEST(TransferSession, CompletesOnlyWhenEveryChunkIsVerified)
{
    auto content = randomContent(250);
    auto identity = identityOf(content);

    TransferSession session(identity, TD_DOWNLOAD, "/tmp/file", 100, smallLimits());

    session.start();

    EXPECT_EQ(session.status(), SESSION_IN_PROGRESS);

    // Chunks may complete in any order.
    EXPECT_FALSE(session.markComplete(3));
    EXPECT_FALSE(session.markComplete(1));
    EXPECT_FALSE(session.markComplete(1));
    EXPECT_TRUE(session.markComplete(2));

    EXPECT_TRUE(session.allChunksComplete());
    EXPECT_EQ(session.bytesCompleted(), 250u);

    auto status = session.complete(identity.digest());

    ASSERT_TRUE(status);
    EXPECT_EQ(*status, SESSION_COMPLETED);
    EXPECT_EQ(session.status(), SESSION_COMPLETED);
}

TEST(TransferSession, DigestMismatchFailsWithIntegrityError)
{
    auto identity = identityOf("expected");

    TransferSession session(identity, TD_DOWNLOAD, "/tmp/file", 100, smallLimits());

    session.start();
    session.markComplete(1);

    auto status = session.complete(md5Hex("something else"));

    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().result(), TRANSFER_INTEGRITY);
    EXPECT_EQ(session.status(), SESSION_FAILED);
    ASSERT_TRUE(session.error());
    EXPECT_EQ(session.error()->result(), TRANSFER_INTEGRITY);
}

TEST(TransferSession, CompletingEarlyIsAnError)
{
    TransferSession session(identityOf(randomContent(300)),
                            TD_UPLOAD,
                            "/tmp/file",
                            100,
                            smallLimits());

    session.start();
    session.markComplete(1);

    EXPECT_THROW(session.complete(session.identity().digest()), std::runtime_error);
    EXPECT_THROW(session.markComplete(4), std::runtime_error);
    EXPECT_THROW(session.markComplete(0), std::runtime_error);
}

TEST(TransferSession, FailureKeepsCompletedChunks)
{
    TransferSession session(identityOf(randomContent(500)),
                            TD_DOWNLOAD,
                            "/tmp/file",
                            100,
                            smallLimits());

    session.start();
    session.markComplete(1);
    session.markComplete(2);

    EXPECT_TRUE(session.fail(errorFromStatus(500, "broken")));
    EXPECT_FALSE(session.fail(errorFromStatus(500, "broken again")));
    EXPECT_FALSE(session.cancel());

    EXPECT_EQ(session.status(), SESSION_FAILED);
    EXPECT_EQ(session.completedCount(), 2u);

    // Concluded sessions can't be restarted.
    EXPECT_THROW(session.start(), std::runtime_error);
}

TEST(TransferSession, CancellationKeepsCompletedChunks)
{
    TransferSession session(identityOf(randomContent(1000)),
                            TD_DOWNLOAD,
                            "/tmp/file",
                            100,
                            smallLimits());

    session.start();

    for (std::uint32_t i = 1; i <= 4; ++i)
        session.markComplete(i);

    EXPECT_TRUE(session.cancel());
    EXPECT_EQ(session.status(), SESSION_CANCELLED);
    EXPECT_EQ(session.completedCount(), 4u);

    auto result = session.complete(session.identity().digest());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().result(), TRANSFER_CANCELLED);
}

TEST(TransferSession, CompletedChunksCarryTheirETags)
{
    TransferSession session(identityOf(randomContent(300)),
                            TD_UPLOAD,
                            "/tmp/file",
                            100,
                            smallLimits());

    session.markComplete(2, "etag2");
    session.markComplete(1, "etag1");

    auto chunks = session.completedChunks();

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].mIndex, 1u);
    EXPECT_EQ(chunks[0].mETag, "etag1");
    EXPECT_EQ(chunks[1].mIndex, 2u);
    EXPECT_EQ(chunks[1].mETag, "etag2");

    auto pending = session.pendingChunks();

    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].mIndex, 3u);
}

TEST(TransferSession, KeyDependsOnDirectionIdentityAndPath)
{
    auto identity = identityOf("content");

    auto key = TransferSession::key(identity, TD_DOWNLOAD, "/tmp/a");

    EXPECT_EQ(key, TransferSession::key(identity, TD_DOWNLOAD, "/tmp/a"));
    EXPECT_EQ(key, TransferSession::key(identity, TD_DOWNLOAD, "/tmp/./a"));
    EXPECT_NE(key, TransferSession::key(identity, TD_UPLOAD, "/tmp/a"));
    EXPECT_NE(key, TransferSession::key(identity, TD_DOWNLOAD, "/tmp/b"));
    EXPECT_NE(key, TransferSession::key(identity.withContent(md5Hex("other"), 5),
                                        TD_DOWNLOAD,
                                        "/tmp/a"));
}

TEST(TransferSession, SerializationPreservesProgress)
{
    TransferSession session(identityOf(randomContent(1000)),
                            TD_UPLOAD,
                            "/tmp/file",
                            100,
                            smallLimits());

    session.markComplete(1, "a");
    session.markComplete(7, "b");

    auto restored = TransferSession::unserialize(session.serialize(), smallLimits());

    ASSERT_TRUE(restored);

    EXPECT_EQ(restored->identity(), session.identity());
    EXPECT_EQ(restored->direction(), TD_UPLOAD);
    EXPECT_EQ(restored->path(), session.path());
    EXPECT_EQ(restored->chunkSize(), 100u);
    EXPECT_EQ(restored->status(), SESSION_PENDING);
    EXPECT_EQ(restored->completedChunks(), session.completedChunks());
}

TEST(TransferSession, GarbageIsRejected)
{
    EXPECT_FALSE(TransferSession::unserialize(""));
    EXPECT_FALSE(TransferSession::unserialize("definitely not a session"));
}

class SessionStoreTest
  : public ::testing::Test
{
protected:
    TemporaryDirectory mDirectory;
    SessionStore mStore{mDirectory / "state", smallLimits()};
}; // SessionStoreTest

TEST_F(SessionStoreTest, MissingRecordLoadsNothing)
{
    EXPECT_FALSE(mStore.load(identityOf("x"), TD_DOWNLOAD, mDirectory / "file", 100));
}

TEST_F(SessionStoreTest, ResumedUploadKeepsCompletedChunks)
{
    auto identity = identityOf(randomContent(500));
    auto path = mDirectory / "file";

    TransferSession session(identity, TD_UPLOAD, path, 100, smallLimits());

    for (std::uint32_t i = 1; i <= 3; ++i)
        session.markComplete(i, "etag" + std::to_string(i));

    ASSERT_TRUE(mStore.save(session));
    EXPECT_TRUE(fs::exists(mStore.recordPath(session.key())));

    auto restored = mStore.load(identity, TD_UPLOAD, path, 100);

    ASSERT_TRUE(restored);

    auto pending = restored->pendingChunks();

    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].mIndex, 4u);
    EXPECT_EQ(pending[1].mIndex, 5u);
}

TEST_F(SessionStoreTest, ResumedDownloadForgetsMissingParts)
{
    auto content = randomContent(300);
    auto identity = identityOf(content);
    auto path = mDirectory / "file";

    TransferSession session(identity, TD_DOWNLOAD, path, 100, smallLimits());

    session.markComplete(1);
    session.markComplete(2);
    session.markComplete(3);

    // Only chunks one and three were staged properly.
    writeFile(mStore.partPath(session.key(), 1), content.substr(0, 100));
    writeFile(mStore.partPath(session.key(), 2), content.substr(100, 10));
    writeFile(mStore.partPath(session.key(), 3), content.substr(200, 100));

    ASSERT_TRUE(mStore.save(session));

    auto restored = mStore.load(identity, TD_DOWNLOAD, path, 100);

    ASSERT_TRUE(restored);

    EXPECT_TRUE(restored->completed(1));
    EXPECT_FALSE(restored->completed(2));
    EXPECT_TRUE(restored->completed(3));
}

TEST_F(SessionStoreTest, ChangedChunkSizeDiscardsRecord)
{
    auto identity = identityOf(randomContent(500));
    auto path = mDirectory / "file";

    TransferSession session(identity, TD_UPLOAD, path, 100, smallLimits());

    session.markComplete(1, "etag");

    ASSERT_TRUE(mStore.save(session));

    EXPECT_FALSE(mStore.load(identity, TD_UPLOAD, path, 250));
    EXPECT_FALSE(fs::exists(mStore.recordPath(session.key())));
}

TEST_F(SessionStoreTest, OpenCreatesFreshSession)
{
    auto identity = identityOf(randomContent(500));

    auto session = mStore.open(identity, TD_UPLOAD, mDirectory / "file", 100);

    ASSERT_TRUE(session);
    EXPECT_EQ(session->pendingChunks().size(), 5u);
}

TEST_F(SessionStoreTest, RemoveDeletesRecordAndParts)
{
    auto identity = identityOf("abc");
    auto path = mDirectory / "file";

    TransferSession session(identity, TD_DOWNLOAD, path, 100, smallLimits());

    writeFile(mStore.partPath(session.key(), 1), "abc");

    ASSERT_TRUE(mStore.save(session));

    EXPECT_TRUE(mStore.remove(session.key()));
    EXPECT_FALSE(fs::exists(mStore.recordPath(session.key())));
    EXPECT_FALSE(fs::exists(mStore.partsPath(session.key())));
}
