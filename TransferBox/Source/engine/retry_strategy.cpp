// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "retry_strategy.h"

using namespace xfer;


std::chrono::milliseconds xfer::getRetryDelay(const RetryConfig& cfg, size_t attempt)
{
    assert(attempt >= 1);
    std::chrono::milliseconds delay = cfg.initialDelay;

    for (size_t i = 1; i < attempt && delay < cfg.maxDelay; ++i) //no overflow for huge attempt numbers
        delay *= 2;

    return std::min(delay, cfg.maxDelay);
}
