// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef PROGRESS_TRACKER_H_7612093845761209
#define PROGRESS_TRACKER_H_7612093845761209

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>


namespace xfer
{
struct ProgressSample
{
    uint64_t bytesTransferred = 0;
    uint64_t totalBytes = 0;
    double percentage = 0;   //[0, 100]
    double bytesPerSec = 0;  //instantaneous: since last commit
};


//report when minInterval has passed OR minBytes were transferred since the last report
struct ThrottleProfile
{
    std::chrono::milliseconds minInterval{};
    uint64_t minBytes = 0;
};

struct ThrottleTier
{
    uint64_t sizeLimit = 0; //exclusive upper bound of the item's total size
    ThrottleProfile profile;
};

//binary units: MiB, GiB
const uint64_t MB = 1024 * 1024;
const uint64_t GB = 1024 * MB;

//ordered by sizeLimit; last tier catches everything else
const std::array<ThrottleTier, 4> throttleTiers
{{
    //@formatter:off
    {100 * MB,         {std::chrono::milliseconds( 200),   2 * MB}}, //small
    {  1 * GB,         {std::chrono::milliseconds( 500),  10 * MB}}, //medium
    { 10 * GB,         {std::chrono::milliseconds(1000),  50 * MB}}, //large
    {UINT64_MAX,       {std::chrono::milliseconds(2000), 100 * MB}}, //huge
    //@formatter:on
}};

ThrottleProfile getThrottleProfile(uint64_t totalBytes);


class ProgressTracker
{
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(uint64_t totalBytes, Clock::time_point now = Clock::now());

    //returns true if a report is due: caller reports sample() and then calls commit()
    bool update(uint64_t bytesDelta, Clock::time_point now = Clock::now());

    ProgressSample sample(Clock::time_point now = Clock::now()) const;
    void commit(Clock::time_point now = Clock::now()); //reset the throttle baseline

    //final report after completion: speed averaged over the whole transfer
    ProgressSample getFinalSample(Clock::time_point now = Clock::now()) const;

    bool isComplete () const { return bytesTransferred_ >= totalBytes_; }
    bool hasOverflow() const { return bytesTransferred_ >  totalBytes_; } //more data than declared: corruption!

    uint64_t getBytesTransferred() const { return bytesTransferred_; }
    uint64_t getTotalBytes      () const { return totalBytes_; }
    const ThrottleProfile& getProfile() const { return profile_; }

    //since construction, not since last report:
    std::chrono::nanoseconds getElapsedTime       (Clock::time_point now = Clock::now()) const { return now - startTime_; }
    std::optional<double>    getAverageBytesPerSec(Clock::time_point now = Clock::now()) const;
    std::optional<double>    getRemainingSec      (Clock::time_point now = Clock::now()) const; //ETA

    void reset(std::optional<uint64_t> totalBytes = std::nullopt, Clock::time_point now = Clock::now());

private:
    uint64_t totalBytes_;
    ThrottleProfile profile_;
    Clock::time_point startTime_;

    uint64_t bytesTransferred_ = 0;

    Clock::time_point lastCommitTime_;
    uint64_t lastCommitBytes_ = 0;
};
}

#endif //PROGRESS_TRACKER_H_7612093845761209
