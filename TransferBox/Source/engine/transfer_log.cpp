// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "transfer_log.h"
#include <tbx/extra_log.h>

using namespace tbx;
using namespace xfer;


void TransferLog::logMessage(const std::wstring& msg, MessageType type)
{
    log_.access([&](ErrorLog& log)
    {
        logMsg(log, msg, type);
        notifyEntry(log.back());
    });
}


void TransferLog::notifyEntry(const LogEntry& entry)
{
    if (onEntry_)
        onEntry_(entry);
}


void TransferLog::mergeExtraLog()
{
    const ErrorLog extraLog = fetchExtraLog();

    log_.access([&](ErrorLog& log)
    {
        for (const LogEntry& entry : extraLog)
        {
            //cleanup errors never decide the outcome of a transfer => warning
            log.push_back({entry.time, MSG_TYPE_WARNING, entry.message});
            notifyEntry(log.back());
        }
    });
}


ErrorLog TransferLog::getEntries() const
{
    return log_.access([](const ErrorLog& log) { return log; });
}


ErrorLogStats TransferLog::getStats() const
{
    return log_.access([](const ErrorLog& log) { return tbx::getStats(log); });
}


std::string TransferLog::formatLog(int typeFilter) const
{
    return log_.access([&](const ErrorLog& log)
    {
        std::string output;
        for (const LogEntry& entry : log)
            if (entry.type & typeFilter)
                output += formatMessage(entry);
        return output;
    });
}
