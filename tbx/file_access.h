// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef FILE_ACCESS_H_3409587120934857
#define FILE_ACCESS_H_3409587120934857

#include <functional>
#include <optional>
#include "file_error.h"
#include "file_path.h"


namespace tbx
{
//report number of *bytes* processed during file operations; may throw to cancel
using IoCallback = std::function<void(int64_t bytesDelta)>;

enum class ItemType
{
    file,
    folder,
    symlink,
};
//(hopefully) fast: does not distinguish between error/not existing
ItemType getItemType(const Zstring& itemPath); //throw FileError
//execute potentially SLOW folder traversal but distinguish error/not existing:
//  - all child item path parts must correspond to folder traversal
//  => we can conclude whether an item is *not* existing anymore by doing a *case-sensitive* name search => potentially SLOW!
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//- symlink handling: follow
//- returns < 0 if not available
//- folderPath does not need to exist (yet)
int64_t getFreeDiskSpace(const Zstring& folderPath); //throw FileError

uint64_t getFileSize(const Zstring& filePath); //throw FileError

//NFS, SMB/CIFS, sshfs, ...: folderPath does not need to exist (yet)
bool isNetworkFileSystem(const Zstring& folderPath); //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing

//rename file: no copying!!! replaceExisting == false: fail with ErrorTargetExisting instead of (atomically) overwriting
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

//- no error if already existing
//- create recursively if parent directory is missing
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError

//fail if already existing or parent directory not existing
void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting
}

#endif //FILE_ACCESS_H_3409587120934857
