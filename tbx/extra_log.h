// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef EXTRA_LOG_H_12093847561092384
#define EXTRA_LOG_H_12093847561092384

#include <mutex>
#include <utility>
#include "error_log.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors inside destructors

    whoever owns a user-visible log should fetchExtraLog() regularly and merge it   */

namespace tbx
{
namespace impl
{
struct ExtraLog
{
    std::mutex lock;
    ErrorLog log;
};

inline
ExtraLog& getExtraLog()
{
    static ExtraLog extraLog;
    return extraLog;
}
}


inline
ErrorLog fetchExtraLog()
{
    impl::ExtraLog& el = impl::getExtraLog();
    std::lock_guard dummy(el.lock);
    return std::exchange(el.log, ErrorLog());
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::ExtraLog& el = impl::getExtraLog();
    std::lock_guard dummy(el.lock);
    logMsg(el.log, msg, MSG_TYPE_ERROR);
}
}

#endif //EXTRA_LOG_H_12093847561092384
