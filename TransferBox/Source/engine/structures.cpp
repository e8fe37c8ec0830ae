// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "structures.h"

using namespace tbx;
using namespace xfer;


std::vector<std::wstring> xfer::validateSettings(TransferSettings& settings)
{
    std::vector<std::wstring> warnings;

    auto addWarning = [&](const std::wstring& name, const std::wstring& valueFmt, const std::wstring& defaultFmt)
    {
        warnings.push_back(replaceCpy(replaceCpy(replaceCpy(_("Invalid value %x for setting %y. Using default %z instead."),
                                                            L"%x", valueFmt),
                                                 L"%y", name),
                                      L"%z", defaultFmt));
    };

    auto checkRange = [&](size_t& value, size_t minVal, size_t maxVal, size_t defaultVal, const std::wstring& name)
    {
        if (value < minVal || value > maxVal)
        {
            addWarning(name, numberTo<std::wstring>(value), numberTo<std::wstring>(defaultVal));
            value = defaultVal;
        }
    };
    checkRange(settings.concurrencyLimit,  MIN_CONCURRENCY, MAX_CONCURRENCY, DEFAULT_CONCURRENCY, L"concurrencyLimit");
    checkRange(settings.bufferSize,        MIN_BUFFER_SIZE, MAX_BUFFER_SIZE, DEFAULT_BUFFER_SIZE, L"bufferSize");
    checkRange(settings.networkBufferSize, MIN_BUFFER_SIZE, MAX_BUFFER_SIZE, NETWORK_BUFFER_SIZE, L"networkBufferSize");

    const RetryConfig retryDefault;

    if (settings.retry.maxAttempts == 0)
    {
        addWarning(L"retry.maxAttempts", L"0", numberTo<std::wstring>(retryDefault.maxAttempts));
        settings.retry.maxAttempts = retryDefault.maxAttempts;
    }

    if (settings.retry.initialDelay.count() < 0)
    {
        addWarning(L"retry.initialDelay", numberTo<std::wstring>(settings.retry.initialDelay.count()), numberTo<std::wstring>(retryDefault.initialDelay.count()));
        settings.retry.initialDelay = retryDefault.initialDelay;
    }

    if (settings.retry.maxDelay < settings.retry.initialDelay)
    {
        addWarning(L"retry.maxDelay", numberTo<std::wstring>(settings.retry.maxDelay.count()), numberTo<std::wstring>(settings.retry.initialDelay.count()));
        settings.retry.maxDelay = settings.retry.initialDelay;
    }

    return warnings;
}


std::vector<TransferTask> xfer::makeTransferTasks(const std::vector<std::pair<Zstring, Zstring>>& paths)
{
    std::vector<TransferTask> tasks;
    for (const auto& [sourcePath, targetPath] : paths)
        tasks.push_back({tasks.size(), sourcePath, targetPath, std::nullopt});
    return tasks;
}


FileTransferResult xfer::makeFailureResult(const Zstring& sourcePath, const Zstring& targetPath, const TransferError& e, std::chrono::milliseconds duration)
{
    FileTransferResult result;
    result.success    = false;
    result.sourcePath = sourcePath;
    result.targetPath = targetPath;
    result.errorMsg   = e.toString();
    result.errorKind  = e.getKind();
    result.duration   = duration;
    return result;
}
