// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "progress_tracker.h"
#include <algorithm>

using namespace xfer;


namespace
{
double getPercentage(uint64_t bytesTransferred, uint64_t totalBytes)
{
    if (totalBytes == 0) //empty file: nothing to do is all done
        return 100;
    return std::min(100.0, 100.0 * static_cast<double>(bytesTransferred) / static_cast<double>(totalBytes));
}
}


ThrottleProfile xfer::getThrottleProfile(uint64_t totalBytes)
{
    const auto it = std::find_if(throttleTiers.begin(), throttleTiers.end(),
    [totalBytes](const ThrottleTier& tier) { return totalBytes < tier.sizeLimit; });

    return it != throttleTiers.end() ? it->profile : throttleTiers.back().profile; //UINT64_MAX itself
}


ProgressTracker::ProgressTracker(uint64_t totalBytes, Clock::time_point now) :
    totalBytes_(totalBytes),
    profile_(xfer::getThrottleProfile(totalBytes)),
    startTime_(now),
    lastCommitTime_(now) {}


bool ProgressTracker::update(uint64_t bytesDelta, Clock::time_point now)
{
    bytesTransferred_ += bytesDelta;

    return now - lastCommitTime_ >= profile_.minInterval ||
           bytesTransferred_ - lastCommitBytes_ >= profile_.minBytes;
}


ProgressSample ProgressTracker::sample(Clock::time_point now) const
{
    const double timeDelta = std::chrono::duration<double>(now - lastCommitTime_).count();

    return
    {
        .bytesTransferred = bytesTransferred_,
        .totalBytes       = totalBytes_,
        .percentage       = getPercentage(bytesTransferred_, totalBytes_),
        .bytesPerSec      = timeDelta > 0 ? static_cast<double>(bytesTransferred_ - lastCommitBytes_) / timeDelta : 0,
    };
}


void ProgressTracker::commit(Clock::time_point now)
{
    lastCommitTime_  = now;
    lastCommitBytes_ = bytesTransferred_;
}


ProgressSample ProgressTracker::getFinalSample(Clock::time_point now) const
{
    return
    {
        .bytesTransferred = bytesTransferred_,
        .totalBytes       = totalBytes_,
        .percentage       = getPercentage(bytesTransferred_, totalBytes_),
        .bytesPerSec      = getAverageBytesPerSec(now).value_or(0),
    };
}


std::optional<double> ProgressTracker::getAverageBytesPerSec(Clock::time_point now) const
{
    const double timeElapsed = std::chrono::duration<double>(now - startTime_).count();
    if (timeElapsed <= 0)
        return std::nullopt;

    return static_cast<double>(bytesTransferred_) / timeElapsed;
}


std::optional<double> ProgressTracker::getRemainingSec(Clock::time_point now) const
{
    if (isComplete())
        return 0.0;

    const std::optional<double> bps = getAverageBytesPerSec(now);
    if (!bps || *bps <= 0)
        return std::nullopt; //no data yet

    return static_cast<double>(totalBytes_ - bytesTransferred_) / *bps;
}


void ProgressTracker::reset(std::optional<uint64_t> totalBytes, Clock::time_point now)
{
    if (totalBytes)
    {
        totalBytes_ = *totalBytes;
        profile_ = xfer::getThrottleProfile(totalBytes_);
    }
    startTime_ = lastCommitTime_ = now;
    bytesTransferred_ = lastCommitBytes_ = 0;
}
