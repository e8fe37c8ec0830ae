// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef OPEN_SSL_H_98123476509182734
#define OPEN_SSL_H_98123476509182734

#include "sys_error.h"


namespace tbx
{
//OpenSSL 3 initializes itself on first use: no explicit init/teardown needed

//evaluate the calling thread's OpenSSL error queue and clear it
std::wstring formatLastOpenSSLError(const char* functionName);
}

#endif //OPEN_SSL_H_98123476509182734
