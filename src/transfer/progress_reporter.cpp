#include <algorithm>

#include <synapse/common/utility.h>
#include <synapse/transfer/logging.h>
#include <synapse/transfer/progress_reporter.h>

namespace synapse
{
namespace transfer
{

using std::chrono::steady_clock;

static double rate(std::uint64_t bytes, steady_clock::duration elapsed)
{
    auto seconds = std::chrono::duration<double>(elapsed).count();

    if (seconds <= 0.0)
        return 0.0;

    return static_cast<double>(bytes) / seconds;
}

static double percentage(std::uint64_t transferred, std::uint64_t total)
{
    if (!total)
        return 100.0;

    return 100.0 * static_cast<double>(transferred) / static_cast<double>(total);
}

ProgressSnapshot ProgressReporter::build(steady_clock::time_point now) const
{
    ProgressSnapshot snapshot;

    auto moved = mRetired;

    for (auto& e : mEntries)
    {
        auto progress = e.second.mProgress;
        auto delta = progress.mTransferred - progress.mResumed;

        // Concluded transfers keep the rate they last reported.
        if (!progress.mResult)
            progress.mRate = rate(delta, now - e.second.mStarted);

        moved += delta;

        snapshot.mTotal += progress.mTotal;
        snapshot.mTransferred += progress.mTransferred;
        snapshot.mFiles.emplace_back(std::move(progress));
    }

    if (mStarted)
    {
        auto elapsed = now - *mStarted;

        snapshot.mElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
        snapshot.mRate = rate(moved, elapsed);
    }

    return snapshot;
}

void ProgressReporter::maybePublish(std::unique_lock<std::mutex>& lock, bool force)
{
    auto now = steady_clock::now();

    // Too soon since the last snapshot.
    if (!force && mLastPublished && now - *mLastPublished < mInterval)
        return;

    mLastPublished = now;

    // Nobody's listening.
    if (mSubscribers.empty())
        return;

    deliver(lock, build(now));
}

void ProgressReporter::deliver(std::unique_lock<std::mutex>& lock,
                               const ProgressSnapshot& snapshot)
{
    auto subscribers = mSubscribers;

    // Acquire the publish lock before releasing our state so that
    // snapshots are delivered in the order they were built.
    std::lock_guard<std::mutex> guard(mPublishLock);

    lock.unlock();

    for (auto& s : subscribers)
    {
        try
        {
            s.second(snapshot);
        }
        catch (std::exception& exception)
        {
            TXWarningF("Progress subscriber %llu threw: %s",
                       static_cast<unsigned long long>(s.first),
                       exception.what());
        }
        catch (...)
        {
            TXWarningF("Progress subscriber %llu threw an unknown exception",
                       static_cast<unsigned long long>(s.first));
        }
    }
}

ProgressReporter::ProgressReporter(std::chrono::milliseconds interval)
  : mEntries()
  , mInterval(interval)
  , mLastPublished()
  , mLock()
  , mNextSubscriberID(0u)
  , mPublishLock()
  , mRetired(0u)
  , mStarted()
  , mSubscribers()
{
}

void ProgressReporter::begin(std::uint64_t id,
                             std::string name,
                             std::uint64_t total,
                             std::uint64_t alreadyTransferred)
{
    std::unique_lock<std::mutex> lock(mLock);

    auto now = steady_clock::now();

    if (!mStarted)
        mStarted = now;

    Entry entry;

    alreadyTransferred = std::min(alreadyTransferred, total);

    entry.mProgress.mID = id;
    entry.mProgress.mName = std::move(name);
    entry.mProgress.mResumed = alreadyTransferred;
    entry.mProgress.mTotal = total;
    entry.mProgress.mTransferred = alreadyTransferred;
    entry.mStarted = now;

    mEntries[id] = std::move(entry);

    maybePublish(lock, false);
}

void ProgressReporter::finish(std::uint64_t id, TransferResult result)
{
    std::unique_lock<std::mutex> lock(mLock);

    auto i = mEntries.find(id);

    if (i == mEntries.end())
        return;

    auto& progress = i->second.mProgress;

    // Freeze the transfer's rate.
    progress.mRate = rate(progress.mTransferred - progress.mResumed,
                          steady_clock::now() - i->second.mStarted);

    progress.mResult = result;

    if (result == TRANSFER_SUCCESS)
        progress.mTransferred = progress.mTotal;

    auto now = steady_clock::now();

    mLastPublished = now;

    // The terminal snapshot is the last to mention this transfer.
    auto snapshot = build(now);

    mRetired += progress.mTransferred - progress.mResumed;

    mEntries.erase(i);

    // Throughput is measured per batch of concurrent transfers.
    if (mEntries.empty())
    {
        mRetired = 0u;
        mStarted.reset();
    }

    if (!mSubscribers.empty())
        deliver(lock, snapshot);
}

void ProgressReporter::publish()
{
    std::unique_lock<std::mutex> lock(mLock);

    maybePublish(lock, true);
}

void ProgressReporter::report(std::uint64_t id, std::uint64_t delta)
{
    std::unique_lock<std::mutex> lock(mLock);

    auto i = mEntries.find(id);

    if (i == mEntries.end())
        return;

    auto& progress = i->second.mProgress;

    // Late reports can't change a concluded transfer.
    if (progress.mResult)
        return;

    progress.mTransferred = std::min(progress.mTransferred + delta, progress.mTotal);

    maybePublish(lock, false);
}

ProgressSnapshot ProgressReporter::snapshot() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return build(steady_clock::now());
}

std::uint64_t ProgressReporter::subscribe(ProgressCallback callback)
{
    std::lock_guard<std::mutex> guard(mLock);

    auto id = mNextSubscriberID++;

    mSubscribers.emplace(id, std::move(callback));

    return id;
}

bool ProgressReporter::unsubscribe(std::uint64_t id)
{
    std::lock_guard<std::mutex> guard(mLock);

    return mSubscribers.erase(id) > 0;
}

std::string ProgressReporter::describe(const ProgressSnapshot& snapshot)
{
    std::string description;

    for (auto& file : snapshot.mFiles)
    {
        description += common::format("%s: %.1f%% (%s of %s) at %s/s",
                                      file.mName.c_str(),
                                      percentage(file.mTransferred, file.mTotal),
                                      common::humanize(file.mTransferred).c_str(),
                                      common::humanize(file.mTotal).c_str(),
                                      common::humanize(static_cast<std::uint64_t>(file.mRate)).c_str());

        if (file.mResult == TRANSFER_SUCCESS)
            description += " done";
        else if (file.mResult)
            description += common::format(" %s: %s",
                                          toString(*file.mResult),
                                          toDescription(*file.mResult));

        description += "\n";
    }

    description += common::format("Total: %zu files, %.1f%% (%s of %s) at %s/s",
                                  snapshot.mFiles.size(),
                                  percentage(snapshot.mTransferred, snapshot.mTotal),
                                  common::humanize(snapshot.mTransferred).c_str(),
                                  common::humanize(snapshot.mTotal).c_str(),
                                  common::humanize(static_cast<std::uint64_t>(snapshot.mRate)).c_str());

    return description;
}

} // transfer
} // synapse
