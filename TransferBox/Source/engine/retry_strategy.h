// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef RETRY_STRATEGY_H_2309487561029384
#define RETRY_STRATEGY_H_2309487561029384

#include <functional>
#include <stop_token>
#include <tbx/thread.h>
#include "structures.h"


namespace xfer
{
//min(initialDelay * 2^(attempt - 1), maxDelay) where "attempt" is the 1-based number of the failed attempt
std::chrono::milliseconds getRetryDelay(const RetryConfig& cfg, size_t attempt);

using RetryCallback = std::function<void(size_t attempt, const TransferError& error, std::chrono::milliseconds delay)>;

/*  run "op" until it succeeds, fails with a non-retryable kind or maxAttempts are used up
    - only retryable ErrorKinds are retried: classification happens here and nowhere else
    - the backoff sleep ends early with ThreadStopRequest on stop request           */
template <class Function>
auto withRetry(Function op, const RetryConfig& cfg, const std::stop_token& stopToken, const RetryCallback& onRetry /*optional*/); //throw TransferError, ThreadStopRequest








//######################## implementation ##############################
template <class Function> inline
auto withRetry(Function op, const RetryConfig& cfg, const std::stop_token& stopToken, const RetryCallback& onRetry) //throw TransferError, ThreadStopRequest
{
    const size_t maxAttempts = std::max<size_t>(cfg.maxAttempts, 1);

    for (size_t attempt = 1;; ++attempt)
    {
        std::optional<TransferError> lastError;
        try
        {
            return op(); //throw FileError, ThreadStopRequest
        }
        catch (const tbx::FileError& e) { lastError = wrapError(e); }

        if (!lastError->isRetryable() || attempt >= maxAttempts)
            throw *lastError;

        const std::chrono::milliseconds delay = getRetryDelay(cfg, attempt);
        if (onRetry)
            onRetry(attempt, *lastError, delay);

        tbx::interruptibleSleep(delay, stopToken); //throw ThreadStopRequest
    }
}
}

#endif //RETRY_STRATEGY_H_2309487561029384
