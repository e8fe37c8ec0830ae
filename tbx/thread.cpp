// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#include "thread.h"
    #include <sys/prctl.h>

using namespace tbx;


void tbx::setCurrentThreadName(const Zstring& threadName)
{
    //"The name can be up to 16 bytes long, including the terminating null byte"
    ::prctl(PR_SET_NAME, threadName.c_str(), 0, 0, 0);
}
