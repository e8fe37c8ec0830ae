// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "test_context.h"
#include "../TransferBox/Source/engine/transfer_error.h"

using namespace tbx;
using namespace xfer;
using test::TestContext;


namespace
{
void test_classification_table(TestContext& t)
{
    t.check(classifyError(EACCES) == ErrorKind::permissionDenied, "EACCES => PermissionDenied");
    t.check(classifyError(EPERM)  == ErrorKind::permissionDenied, "EPERM => PermissionDenied");

    t.check(classifyError(ENOSPC) == ErrorKind::insufficientSpace, "ENOSPC => InsufficientSpace");
    t.check(classifyError(EDQUOT) == ErrorKind::insufficientSpace, "EDQUOT => InsufficientSpace");
    t.check(classifyError(EFBIG)  == ErrorKind::insufficientSpace, "EFBIG => InsufficientSpace");

    for (const ErrorCode ec : {ENOENT, EIO, EROFS, ENXIO, ENODEV, ENOTCONN, ESHUTDOWN, ENOMEDIUM, ESTALE})
        t.check(classifyError(ec) == ErrorKind::sourceDisconnected, "errno " + numberTo<std::string>(ec) + " => SourceDisconnected");

    for (const ErrorCode ec : {ETIMEDOUT, ECONNRESET, ECONNABORTED, EHOSTUNREACH, ENETUNREACH, ENETDOWN, EHOSTDOWN, EREMOTEIO})
        t.check(classifyError(ec) == ErrorKind::networkError, "errno " + numberTo<std::string>(ec) + " => NetworkError");

    t.check(classifyError(0)      == ErrorKind::unknown, "no errno => Unknown");
    t.check(classifyError(EINVAL) == ErrorKind::unknown, "EINVAL => Unknown");
    t.check(classifyError(EBUSY)  == ErrorKind::unknown, "EBUSY => Unknown");
}


void test_retryable_flag(TestContext& t)
{
    t.check( isRetryable(ErrorKind::networkError),       "NetworkError is retryable");
    t.check( isRetryable(ErrorKind::sourceDisconnected), "SourceDisconnected is retryable");
    t.check(!isRetryable(ErrorKind::permissionDenied),   "PermissionDenied is not retryable");
    t.check(!isRetryable(ErrorKind::insufficientSpace),  "InsufficientSpace is not retryable");
    t.check(!isRetryable(ErrorKind::checksumMismatch),   "ChecksumMismatch is not retryable");
    t.check(!isRetryable(ErrorKind::cancelled),          "Cancelled is not retryable");
    t.check(!isRetryable(ErrorKind::unknown),            "Unknown is not retryable");

    const TransferError e(L"msg", L"details", ErrorKind::networkError, ECONNRESET);
    t.check(e.isRetryable(), "TransferError follows the kind's retry flag");
    t.check(e.getErrorCode() == ECONNRESET, "TransferError keeps errno");
}


void test_wrap_error(TestContext& t)
{
    const FileError plain(L"Cannot write file.", L"ENOSPC: No space left on device [write]", ENOSPC);
    const TransferError wrapped = wrapError(plain);
    t.check(wrapped.getKind() == ErrorKind::insufficientSpace, "plain FileError is classified by its errno");
    t.check(wrapped.toString() == plain.toString(), "wrapping keeps the message");
    t.check(wrapped.getErrorCode() == ENOSPC, "wrapping keeps errno");

    const TransferError typed(L"Verification failed", ErrorKind::checksumMismatch);
    const FileError& asBase = typed;
    t.check(wrapError(asBase).getKind() == ErrorKind::checksumMismatch, "TransferError keeps its kind when wrapped again");

    t.check(wrapError(FileError(L"no errno")).getKind() == ErrorKind::unknown, "FileError without errno => Unknown");
}


void test_factories(TestContext& t)
{
    const TransferError e = checksumMismatch(Zstr("/media/DCIM/IMG_0001.JPG"), "aaaa1111", "bbbb2222");
    t.check(e.getKind() == ErrorKind::checksumMismatch, "checksumMismatch() kind");
    t.checkContains(e.toString(), L"aaaa1111", "message names the source hash");
    t.checkContains(e.toString(), L"bbbb2222", "message names the target hash");
    t.checkContains(e.toString(), L"IMG_0001.JPG", "message names the file");

    const TransferError s = sizeMismatch(Zstr("/dest/a.mov"), 100, 50);
    t.check(s.getKind() == ErrorKind::checksumMismatch, "size mismatch is treated as corruption");
    t.checkContains(s.toString(), L"100", "message names expected size");
    t.checkContains(s.toString(), L"50", "message names actual size");

    const TransferError space = insufficientSpace(Zstr("/dest"), 2000000, 1000);
    t.check(space.getKind() == ErrorKind::insufficientSpace, "insufficientSpace() kind");
    t.check(!space.isRetryable(), "insufficient space is not retryable");

    const TransferError c = cancelled();
    t.check(c.getKind() == ErrorKind::cancelled, "cancelled() kind");
}


void test_kind_names(TestContext& t)
{
    t.check(std::string(getErrorKindName(ErrorKind::permissionDenied))   == "PermissionDenied",   "name PermissionDenied");
    t.check(std::string(getErrorKindName(ErrorKind::insufficientSpace))  == "InsufficientSpace",  "name InsufficientSpace");
    t.check(std::string(getErrorKindName(ErrorKind::checksumMismatch))   == "ChecksumMismatch",   "name ChecksumMismatch");
    t.check(std::string(getErrorKindName(ErrorKind::sourceDisconnected)) == "SourceDisconnected", "name SourceDisconnected");
    t.check(std::string(getErrorKindName(ErrorKind::networkError))       == "NetworkError",       "name NetworkError");
    t.check(std::string(getErrorKindName(ErrorKind::cancelled))          == "Cancelled",          "name Cancelled");
    t.check(std::string(getErrorKindName(ErrorKind::unknown))            == "Unknown",            "name Unknown");

    t.check(!getErrorKindLabel(ErrorKind::networkError).empty(), "labels are available");
}
}


int main()
{
    TestContext t;
    test_classification_table(t);
    test_retryable_flag(t);
    test_wrap_error(t);
    test_factories(t);
    test_kind_names(t);
    return t.finish("transfer_error_tests");
}
