// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef FILE_ERROR_H_12097834509127834
#define FILE_ERROR_H_12097834509127834

#include "sys_error.h"


namespace tbx
{
//error message for the user: what failed (msg) followed by the system details
class FileError
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    FileError(const std::wstring& msg, const SysError& details) : FileError(msg, details.toString(), details.getErrorCode()) {}
    FileError(const std::wstring& msg, const std::wstring& details, ErrorCode ec) : msg_(msg + L"\n\n" + details), errorCode_(ec) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

    //errno of the failed system call; 0: not caused by a system call
    ErrorCode getErrorCode() const { return errorCode_; }

private:
    std::wstring msg_;
    ErrorCode errorCode_ = 0;
};

struct ErrorTargetExisting  : public FileError { using FileError::FileError; };
struct ErrorMoveUnsupported : public FileError { using FileError::FileError; }; //e.g. across devices


//read errno before anything else can overwrite it
#define THROW_LAST_FILE_ERROR(msg, functionName) \
    do { const tbx::ErrorCode ecInternal = tbx::getLastError(); throw tbx::FileError(msg, tbx::formatSystemError(functionName, ecInternal), ecInternal); } while (false)


inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); }
}

#endif //FILE_ERROR_H_12097834509127834
