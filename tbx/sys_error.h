// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef SYS_ERROR_H_87230457129384570112
#define SYS_ERROR_H_87230457129384570112

#include <cerrno>
#include "scope_guard.h"
#include "i18n.h"
#include "zstring.h"


namespace tbx
{
using ErrorCode = int; //errno

inline ErrorCode getLastError() { return errno; } //errno is a macro: no "::"

//"ENOSPC: No space left on device [write]"
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);
std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);

std::wstring getSystemErrorDescription(ErrorCode ec); //empty if unknown


//detail of a failed system call; FileError adds the user context
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    SysError(const std::wstring& msg, ErrorCode ec) : msg_(msg), errorCode_(ec) {}

    const std::wstring& toString() const { return msg_; }
    ErrorCode getErrorCode() const { return errorCode_; } //0: no system call involved

private:
    std::wstring msg_;
    ErrorCode errorCode_ = 0;
};


//macro: errno must be read before any further system call
#define THROW_LAST_SYS_ERROR(functionName) \
    do { const tbx::ErrorCode ecInternal = tbx::getLastError(); throw tbx::SysError(tbx::formatSystemError(functionName, ecInternal), ecInternal); } while (false)


//ASSERT_SYSERROR(::fstat(fd, &st) == 0); throws SysError naming the failed expression
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr)
#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    { if (!tbx::impl::validateBool(expr)) throw tbx::SysError(L"Assertion failed: \"" L ## exprStr L"\""); }

namespace impl
{
inline bool validateBool(bool  b) { return b; }
inline bool validateBool(void* b) { return b; }
bool validateBool(int) = delete; //no silent int => bool
}
}

#endif //SYS_ERROR_H_87230457129384570112
