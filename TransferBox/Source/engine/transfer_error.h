// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSFER_ERROR_H_4398127650192837
#define TRANSFER_ERROR_H_4398127650192837

#include <cstdint>
#include <tbx/file_error.h>


namespace xfer
{
//closed set: each kind has a fixed retry policy
enum class ErrorKind
{
    permissionDenied,
    insufficientSpace,
    checksumMismatch,
    sourceDisconnected,
    networkError,
    cancelled,
    unknown,
};

bool isRetryable(ErrorKind kind);

ErrorKind classifyError(tbx::ErrorCode ec); //0 => unknown

std::wstring getErrorKindLabel(ErrorKind kind); //translated, for the UI
const char* getErrorKindName(ErrorKind kind);   //stable identifier, e.g. for persisted history


class TransferError : public tbx::FileError
{
public:
    TransferError(const std::wstring& msg, ErrorKind kind) : FileError(msg), kind_(kind) {}
    TransferError(const std::wstring& msg, const std::wstring& details, ErrorKind kind, tbx::ErrorCode ec = 0) : FileError(msg, details, ec), kind_(kind) {}
    TransferError(const tbx::FileError& e, ErrorKind kind) : FileError(e), kind_(kind) {}

    ErrorKind getKind() const { return kind_; }
    bool isRetryable() const { return xfer::isRetryable(kind_); }

private:
    ErrorKind kind_;
};

//keep TransferError as is, classify plain FileError by its errno
TransferError wrapError(const tbx::FileError& e);

TransferError checksumMismatch(const Zstring& filePath, const std::string& sourceHash, const std::string& targetHash);
TransferError sizeMismatch    (const Zstring& filePath, uint64_t bytesExpected, uint64_t bytesActual); //silent corruption => checksumMismatch kind
TransferError insufficientSpace(const Zstring& folderPath, uint64_t bytesRequired, uint64_t bytesAvailable);
TransferError cancelled();
}

#endif //TRANSFER_ERROR_H_4398127650192837
