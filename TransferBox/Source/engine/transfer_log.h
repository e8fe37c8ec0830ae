// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSFER_LOG_H_5091283746509182
#define TRANSFER_LOG_H_5091283746509182

#include <functional>
#include <tbx/error_log.h>
#include <tbx/thread.h>


namespace xfer
{
//thread-safe: written from all transfer workers
class TransferLog
{
public:
    //onEntry: called for each new entry, serialized; must not call back into this log!
    explicit TransferLog(const std::function<void(const tbx::LogEntry& entry)>& onEntry = nullptr) : onEntry_(onEntry) {}

    void logInfo   (const std::wstring& msg) { logMessage(msg, tbx::MSG_TYPE_INFO); }
    void logWarning(const std::wstring& msg) { logMessage(msg, tbx::MSG_TYPE_WARNING); }
    void logError  (const std::wstring& msg) { logMessage(msg, tbx::MSG_TYPE_ERROR); }

    void logMessage(const std::wstring& msg, tbx::MessageType type);

    //take over errors logged where no other log was available (e.g. cleanup inside destructors)
    void mergeExtraLog();

    tbx::ErrorLog getEntries() const;
    tbx::ErrorLogStats getStats() const;

    //plain text, one formatted entry per message; optionally only entries matching typeFilter (bit mask)
    std::string formatLog(int typeFilter = tbx::MSG_TYPE_INFO | tbx::MSG_TYPE_WARNING | tbx::MSG_TYPE_ERROR) const;

private:
    TransferLog           (const TransferLog&) = delete;
    TransferLog& operator=(const TransferLog&) = delete;

    void notifyEntry(const tbx::LogEntry& entry); //called inside log_.access()

    mutable tbx::Protected<tbx::ErrorLog> log_;
    const std::function<void(const tbx::LogEntry& entry)> onEntry_; //optional
};
}

#endif //TRANSFER_LOG_H_5091283746509182
