// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#include "sys_error.h"
#include <glib.h>

using namespace tbx;


namespace
{
//symbolic name for the codes a copy job runs into; anything else is printed as a number
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec)
    {
        //access
        TBX_CHECK_CASE_FOR_CONSTANT(EPERM);
        TBX_CHECK_CASE_FOR_CONSTANT(EACCES);
        //items
        TBX_CHECK_CASE_FOR_CONSTANT(ENOENT);
        TBX_CHECK_CASE_FOR_CONSTANT(EEXIST);
        TBX_CHECK_CASE_FOR_CONSTANT(EISDIR);
        TBX_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
        TBX_CHECK_CASE_FOR_CONSTANT(ELOOP);
        TBX_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
        TBX_CHECK_CASE_FOR_CONSTANT(EXDEV);
        //transient
        TBX_CHECK_CASE_FOR_CONSTANT(EINTR);
        TBX_CHECK_CASE_FOR_CONSTANT(EAGAIN);
        TBX_CHECK_CASE_FOR_CONSTANT(EBUSY);
        TBX_CHECK_CASE_FOR_CONSTANT(ECANCELED);
        //device
        TBX_CHECK_CASE_FOR_CONSTANT(EIO);
        TBX_CHECK_CASE_FOR_CONSTANT(ENXIO);
        TBX_CHECK_CASE_FOR_CONSTANT(ENODEV);
        TBX_CHECK_CASE_FOR_CONSTANT(ENOMEDIUM);
        TBX_CHECK_CASE_FOR_CONSTANT(EROFS);
        //space
        TBX_CHECK_CASE_FOR_CONSTANT(ENOSPC);
        TBX_CHECK_CASE_FOR_CONSTANT(EDQUOT);
        TBX_CHECK_CASE_FOR_CONSTANT(EFBIG);
        //network
        TBX_CHECK_CASE_FOR_CONSTANT(ESTALE);
        TBX_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
        TBX_CHECK_CASE_FOR_CONSTANT(ESHUTDOWN);
        TBX_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
        TBX_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
        TBX_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
        TBX_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
        TBX_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
        TBX_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
        TBX_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
        TBX_CHECK_CASE_FOR_CONSTANT(EREMOTEIO);

        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring tbx::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    TBX_ON_SCOPE_EXIT(errno = ecCurrent);

    //g_strerror() vs strerror(): thread-safe and always UTF-8
    return trimCpy(utfTo<std::wstring>(std::string(::g_strerror(ec))));
}


std::wstring tbx::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring tbx::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
