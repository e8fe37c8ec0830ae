// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef STOP_WATCH_H_61239480576123098
#define STOP_WATCH_H_61239480576123098

#include <chrono>


namespace tbx
{
//don't use the system clock for durations: it may jump
class StopWatch
{
public:
    std::chrono::nanoseconds elapsed() const { return std::chrono::steady_clock::now() - startTime_; }

    std::chrono::milliseconds elapsedMs() const { return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()); }

private:
    const std::chrono::steady_clock::time_point startTime_ = std::chrono::steady_clock::now();
};
}

#endif //STOP_WATCH_H_61239480576123098
