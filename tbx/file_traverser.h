// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_7809123465012783
#define FILE_TRAVERSER_H_7809123465012783

#include <functional>
#include <ctime>
#include "file_error.h"


namespace tbx
{
struct FileInfo
{
    Zstring itemName;
    Zstring fullPath;
    uint64_t fileSize = 0; //[bytes]
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
};

struct FolderInfo
{
    Zstring itemName;
    Zstring fullPath;
};

struct SymlinkInfo
{
    Zstring itemName;
    Zstring fullPath;
    time_t modTime = 0;
};

//- non-recursive
//- callbacks are optional
void traverseFolder(const Zstring& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,
                    const std::function<void(const FolderInfo&  fi)>& onFolder,
                    const std::function<void(const SymlinkInfo& si)>& onSymlink); //throw FileError
}

#endif //FILE_TRAVERSER_H_7809123465012783
