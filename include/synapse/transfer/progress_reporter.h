#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <synapse/transfer/transfer_result.h>

namespace synapse
{
namespace transfer
{

struct FileProgress
{
    // Which transfer does this describe?
    std::uint64_t mID = 0u;

    // What should we call the transfer when describing it?
    std::string mName;

    // How large is the file?
    std::uint64_t mTotal = 0u;

    // How many bytes have been transferred, including resumed bytes?
    std::uint64_t mTransferred = 0u;

    // How many bytes had been transferred before this run began?
    std::uint64_t mResumed = 0u;

    // Bytes per second moved during this run.
    double mRate = 0.0;

    // How did the transfer conclude, if it has?
    std::optional<TransferResult> mResult;
}; // FileProgress

struct ProgressSnapshot
{
    std::vector<FileProgress> mFiles;

    // Sum of every file's size.
    std::uint64_t mTotal = 0u;

    // Sum of every file's transferred bytes.
    std::uint64_t mTransferred = 0u;

    // Aggregate bytes per second.
    double mRate = 0.0;

    // How long have we been reporting?
    std::chrono::milliseconds mElapsed{0};
}; // ProgressSnapshot

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

// Aggregates byte level progress into rate limited snapshots.
//
// Reporting is purely observational: misbehaving subscribers are logged
// and otherwise ignored.
class ProgressReporter
{
    struct Entry
    {
        FileProgress mProgress;

        // When did this run begin?
        std::chrono::steady_clock::time_point mStarted;
    }; // Entry

    // Compute the current snapshot.
    ProgressSnapshot build(std::chrono::steady_clock::time_point now) const;

    // Hand snapshot to every subscriber.
    //
    // Releases lock.
    void deliver(std::unique_lock<std::mutex>& lock, const ProgressSnapshot& snapshot);

    // Deliver a snapshot to subscribers if appropriate.
    void maybePublish(std::unique_lock<std::mutex>& lock, bool force);

    // Tracked transfers.
    std::map<std::uint64_t, Entry> mEntries;

    // Minimum distance between two snapshots.
    std::chrono::milliseconds mInterval;

    // When did we last publish a snapshot?
    std::optional<std::chrono::steady_clock::time_point> mLastPublished;

    // Serializes access to our state.
    mutable std::mutex mLock;

    // Who should we hand out to the next subscriber?
    std::uint64_t mNextSubscriberID;

    // Makes sure snapshots are delivered in order.
    std::mutex mPublishLock;

    // Bytes moved by transfers that have concluded since mStarted.
    std::uint64_t mRetired;

    // When did we begin tracking our first transfer?
    std::optional<std::chrono::steady_clock::time_point> mStarted;

    std::map<std::uint64_t, ProgressCallback> mSubscribers;

public:
    explicit ProgressReporter(std::chrono::milliseconds interval = std::chrono::milliseconds(250));

    // Begin tracking a transfer.
    //
    // Bytes moved by an earlier run count as progress but not throughput.
    void begin(std::uint64_t id,
               std::string name,
               std::uint64_t total,
               std::uint64_t alreadyTransferred = 0u);

    // Record a transfer's conclusion.
    //
    // Always publishes a snapshot. That snapshot is the last to mention
    // the transfer: it is forgotten once the snapshot has been built.
    void finish(std::uint64_t id, TransferResult result);

    // Publish a snapshot now.
    void publish();

    // Record that some bytes have been moved.
    void report(std::uint64_t id, std::uint64_t delta);

    ProgressSnapshot snapshot() const;

    // Receive snapshots as they're published.
    std::uint64_t subscribe(ProgressCallback callback);

    bool unsubscribe(std::uint64_t id);

    // Render a snapshot as one line per file and a total.
    static std::string describe(const ProgressSnapshot& snapshot);
}; // ProgressReporter

} // transfer
} // synapse
