// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef ERROR_LOG_H_41239087561239847
#define ERROR_LOG_H_41239087561239847

#include <cassert>
#include <ctime>
#include <string_view>
#include <vector>
#include "i18n.h"
#include "zstring.h"


namespace tbx
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message; //UTF-8
};

std::string formatMessage(const LogEntry& entry);

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
        ++(entry.type == MSG_TYPE_INFO    ? stats.info :
           entry.type == MSG_TYPE_WARNING ? stats.warning : stats.error);
    return stats;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            return _("Error");
    }
    assert(false);
    return std::wstring();
}


inline
std::string formatMessage(const LogEntry& entry)
{
    char timeTag[16] = {};
    if (std::tm localTime = {};
        ::localtime_r(&entry.time, &localTime))
        std::strftime(timeTag, sizeof(timeTag), "%H:%M:%S", &localTime);

    const std::string prefix = '[' + std::string(timeTag) + "]  " + utfTo<std::string>(getMessageTypeLabel(entry.type)) + ":  ";
    const std::string indent(utfTo<std::wstring>(prefix).size(), ' '); //count characters, not bytes

    std::string output = prefix;
    std::string_view msg = trimCpy(std::string_view(entry.message));

    //continuation lines are aligned with the first; blank lines are dropped
    for (bool firstLine = true; !msg.empty(); firstLine = false)
    {
        const size_t pos = msg.find('\n');
        const std::string_view line = msg.substr(0, pos);
        if (!firstLine)
            output += '\n' + indent;
        output += line;

        msg = pos == std::string_view::npos ? std::string_view() : msg.substr(pos + 1);
        while (!msg.empty() && msg.front() == '\n')
            msg.remove_prefix(1);
    }
    output += '\n';
    return output;
}
}

#endif //ERROR_LOG_H_41239087561239847
