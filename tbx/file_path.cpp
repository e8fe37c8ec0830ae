// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#include "file_path.h"
#include <cassert>

using namespace tbx;


std::optional<Zstring> tbx::getParentFolderPath(const Zstring& itemPath)
{
    if (!startsWith(itemPath, FILE_NAME_SEPARATOR))
    {
        assert(itemPath.empty());
        return std::nullopt;
    }

    //ignore trailing separators: "/a/b/" => "/a"
    size_t end = itemPath.size();
    while (end > 1 && itemPath[end - 1] == FILE_NAME_SEPARATOR)
        --end;
    if (end == 1) //device root
        return std::nullopt;

    const size_t pos = itemPath.rfind(FILE_NAME_SEPARATOR, end - 1);
    if (pos == 0)
        return Zstring(1, FILE_NAME_SEPARATOR);

    return itemPath.substr(0, pos);
}


Zstring tbx::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(!startsWith(relPath, FILE_NAME_SEPARATOR));
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    return basePath + FILE_NAME_SEPARATOR + relPath;
}
