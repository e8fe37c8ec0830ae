// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef ZSTRING_H_98713245609812734
#define ZSTRING_H_98713245609812734

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include "utf.h"          //
#include "string_tools.h" //


//native file path string: UTF-8 on Linux
using Zchar = char;
#define Zstr(x) x

using Zstring     = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

#endif //ZSTRING_H_98713245609812734
