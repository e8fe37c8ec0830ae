// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "transfer_error.h"
#include <tbx/format_unit.h>

using namespace tbx;
using namespace xfer;


bool xfer::isRetryable(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::sourceDisconnected:
        case ErrorKind::networkError:
            return true;

        case ErrorKind::permissionDenied:
        case ErrorKind::insufficientSpace:
        case ErrorKind::checksumMismatch: //will not resolve by waiting: the data path is broken
        case ErrorKind::cancelled:
        case ErrorKind::unknown:
            return false;
    }
    assert(false);
    return false;
}


ErrorKind xfer::classifyError(ErrorCode ec)
{
    switch (ec)
    {
        case EACCES:
        case EPERM:
            return ErrorKind::permissionDenied;

        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return ErrorKind::insufficientSpace;

        //device unplugged or unmounted while reading
        case ENOENT:
        case EIO:
        case EROFS:
        case ENXIO:
        case ENODEV:
        case ENOTCONN:
        case ESHUTDOWN:
        case ENOMEDIUM:
        case ESTALE: //NFS handle invalidated by server
            return ErrorKind::sourceDisconnected;

        case ETIMEDOUT:
        case ECONNRESET:
        case ECONNABORTED:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case ENETDOWN:
        case EHOSTDOWN:
        case EREMOTEIO:
            return ErrorKind::networkError;
    }
    return ErrorKind::unknown;
}


std::wstring xfer::getErrorKindLabel(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::permissionDenied:
            return _("Permission denied");
        case ErrorKind::insufficientSpace:
            return _("Not enough free disk space");
        case ErrorKind::checksumMismatch:
            return _("Data verification error");
        case ErrorKind::sourceDisconnected:
            return _("Source device disconnected");
        case ErrorKind::networkError:
            return _("Network error");
        case ErrorKind::cancelled:
            return _("Cancelled");
        case ErrorKind::unknown:
            return _("Error");
    }
    assert(false);
    return std::wstring();
}


const char* xfer::getErrorKindName(ErrorKind kind)
{
    switch (kind)
    {
        //@formatter:off
        case ErrorKind::permissionDenied:   return "PermissionDenied";
        case ErrorKind::insufficientSpace:  return "InsufficientSpace";
        case ErrorKind::checksumMismatch:   return "ChecksumMismatch";
        case ErrorKind::sourceDisconnected: return "SourceDisconnected";
        case ErrorKind::networkError:       return "NetworkError";
        case ErrorKind::cancelled:          return "Cancelled";
        case ErrorKind::unknown:            return "Unknown";
        //@formatter:on
    }
    assert(false);
    return "Unknown";
}


TransferError xfer::wrapError(const FileError& e)
{
    if (const auto te = dynamic_cast<const TransferError*>(&e))
        return *te;
    return TransferError(e, classifyError(e.getErrorCode()));
}


TransferError xfer::checksumMismatch(const Zstring& filePath, const std::string& sourceHash, const std::string& targetHash)
{
    return TransferError(replaceCpy(_("Data verification error: %x does not have the same content as its source."), L"%x", fmtPath(filePath)),
                         replaceCpy(replaceCpy(_("Source: %x") + L'\n' + _("Target: %y"), L"%x", utfTo<std::wstring>(sourceHash)), L"%y", utfTo<std::wstring>(targetHash)),
                         ErrorKind::checksumMismatch);
}


TransferError xfer::sizeMismatch(const Zstring& filePath, uint64_t bytesExpected, uint64_t bytesActual)
{
    return TransferError(replaceCpy(_("Data verification error: Unexpected size of %x."), L"%x", fmtPath(filePath)),
                         replaceCpy(replaceCpy(_("Expected: %x bytes, actual: %y bytes"),
                                               L"%x", numberTo<std::wstring>(bytesExpected)),
                                    L"%y", numberTo<std::wstring>(bytesActual)),
                         ErrorKind::checksumMismatch);
}


TransferError xfer::insufficientSpace(const Zstring& folderPath, uint64_t bytesRequired, uint64_t bytesAvailable)
{
    return TransferError(replaceCpy(_("Not enough free disk space available in %x."), L"%x", fmtPath(folderPath)),
                         replaceCpy(replaceCpy(_("Required: %x, available: %y"),
                                               L"%x", formatFilesizeShort(static_cast<int64_t>(bytesRequired))),
                                    L"%y", formatFilesizeShort(static_cast<int64_t>(bytesAvailable))),
                         ErrorKind::insufficientSpace, ENOSPC);
}


TransferError xfer::cancelled()
{
    return TransferError(_("Operation cancelled."), ErrorKind::cancelled);
}
