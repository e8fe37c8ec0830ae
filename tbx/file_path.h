// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef FILE_PATH_H_5098273409812734
#define FILE_PATH_H_5098273409812734

#include <optional>
#include "zstring.h"


namespace tbx
{
const Zchar FILE_NAME_SEPARATOR = '/';

//no value for the root "/" or an empty path; relative paths are not supported
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath);

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);
}

#endif //FILE_PATH_H_5098273409812734
