// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include <cassert>
#include "file_traverser.h"

    #include <sys/vfs.h> //statfs
    #include <sys/stat.h>
    #include <mntent.h>  //getmntent_r
    #include <unistd.h>  //unlink

using namespace tbx;


namespace
{
ItemType getItemTypeImpl(const Zstring& itemPath) //throw SysError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_SYS_ERROR("lstat");

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


//nullopt: item is not existing, but the returned parent is
std::optional<ItemType> getItemTypeIfExistsImpl(const Zstring& itemPath, Zstring& lastExistingPath) //throw SysError
{
    try
    {
        const ItemType type = getItemTypeImpl(itemPath); //throw SysError
        lastExistingPath = itemPath;
        return type;
    }
    catch (const SysError& e) //let's dig deeper, but *only* if error code sounds like "not existing"
    {
        const std::optional<Zstring>& parentPath = getParentFolderPath(itemPath);
        if (!parentPath || e.getErrorCode() != ENOENT) //device root => quick access test
            throw;

        if (const std::optional<ItemType> parentType = getItemTypeIfExistsImpl(*parentPath, lastExistingPath)) //throw SysError
        {
            if (*parentType == ItemType::file /*obscure, but possible*/)
                throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(*parentPath))));

            const Zstring itemName = getItemName(itemPath);
            try
            {
                //finding the item after lstat() previously failed is exceptional
                auto checkName = [&](const Zstring& name) { if (name == itemName) throw SysError(_("Temporary access error:") + L' ' + e.toString(), ENOENT); };
                traverseFolder(*parentPath, //throw FileError
                [&](const    FileInfo& fi) { checkName(fi.itemName); },
                [&](const  FolderInfo& fi) { checkName(fi.itemName); },
                [&](const SymlinkInfo& si) { checkName(si.itemName); });
            }
            catch (const FileError& e2) { throw SysError(replaceCpy(e2.toString(), L"\n\n", L'\n'), e2.getErrorCode()); }
        }
        return std::nullopt;
    }
}


Zstring getLastExistingPath(const Zstring& itemPath) //throw SysError
{
    Zstring lastExistingPath;
    getItemTypeIfExistsImpl(itemPath, lastExistingPath); //throw SysError
    return lastExistingPath;
}


bool isNetworkFuseMount(const Zstring& existingPath) //throw SysError
{
    FILE* mounts = ::setmntent("/proc/self/mounts", "r");
    if (!mounts)
        THROW_LAST_SYS_ERROR("setmntent");
    TBX_ON_SCOPE_EXIT(::endmntent(mounts));

    //the mount point with the longest matching prefix owns the path
    Zstring bestMountDir;
    Zstring bestFsType;
    char buffer[4096] = {};
    mntent entry = {};
    while (::getmntent_r(mounts, &entry, buffer, sizeof(buffer)))
    {
        const Zstring mountDir = entry.mnt_dir;
        if ((existingPath == mountDir || startsWith(existingPath, mountDir == "/" ? mountDir : mountDir + FILE_NAME_SEPARATOR)) &&
            mountDir.size() >= bestMountDir.size())
        {
            bestMountDir = mountDir;
            bestFsType   = entry.mnt_type;
        }
    }
    return bestFsType == "fuse.sshfs" ||
           bestFsType == "fuse.afpfs" ||
           bestFsType == "fuse.smbnetfs" ||
           bestFsType == "fuse.rclone";
}
}


ItemType tbx::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e); }
}


std::optional<ItemType> tbx::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        Zstring lastExistingPath;
        return getItemTypeIfExistsImpl(itemPath, lastExistingPath); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e); }
}


int64_t tbx::getFreeDiskSpace(const Zstring& folderPath) //throw FileError
{
    try
    {
        const Zstring existingPath = getLastExistingPath(folderPath); //throw SysError

        struct statfs info = {};
        if (::statfs(existingPath.c_str(), &info) != 0) //follows symlinks!
            THROW_LAST_SYS_ERROR("statfs");
        //"Fields that are undefined for a particular file system are set to 0."
        if (static_cast<int64_t>(info.f_bsize) <= 0 ||
            static_cast<int64_t>(info.f_bavail) <= 0)
            return -1;

        return static_cast<int64_t>(info.f_bsize) * static_cast<int64_t>(info.f_bavail);
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot determine free disk space for %x."), L"%x", fmtPath(folderPath)), e); }
}


uint64_t tbx::getFileSize(const Zstring& filePath) //throw FileError
{
    try
    {
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        return fileInfo.st_size;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), e); }
}


bool tbx::isNetworkFileSystem(const Zstring& folderPath) //throw FileError
{
    try
    {
        const Zstring existingPath = getLastExistingPath(folderPath); //throw SysError

        struct statfs info = {};
        if (::statfs(existingPath.c_str(), &info) != 0)
            THROW_LAST_SYS_ERROR("statfs");

        switch (static_cast<unsigned long>(info.f_type)) //see "man 2 statfs"
        {
            case 0x6969:     //NFS_SUPER_MAGIC
            case 0x517b:     //SMB_SUPER_MAGIC
            case 0xff534d42: //CIFS_SUPER_MAGIC
            case 0xfe534d42: //SMB2_SUPER_MAGIC
            case 0x5346414f: //AFS_SUPER_MAGIC
            case 0x73757245: //CODA_SUPER_MAGIC
            case 0x564c:     //NCP_SUPER_MAGIC
            case 0x01021997: //V9FS_MAGIC
            case 0x00c36400: //CEPH_SUPER_MAGIC
                return true;

            case 0x65735546: //FUSE_SUPER_MAGIC: local (exfat, ntfs-3g) or remote (sshfs)
                return isNetworkFuseMount(existingPath); //throw SysError
        }
        return false;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(folderPath)), e); }
}


void tbx::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e); }
}


namespace
{
std::wstring generateMoveErrorMsg(const Zstring& pathFrom, const Zstring& pathTo)
{
    if (getParentFolderPath(pathFrom) == getParentFolderPath(pathTo)) //pure "rename"
        return replaceCpy(replaceCpy(_("Cannot rename %x to %y."),
                                     L"%x", fmtPath(pathFrom)),
                          L"%y", fmtPath(getItemName(pathTo)));
    else //"move" or "move + rename"
        return trimCpy(replaceCpy(replaceCpy(_("Cannot move %x to %y."),
                                             L"%x", L'\n' + fmtPath(pathFrom)),
                                  L"%y", L'\n' + fmtPath(pathTo)));
}
}


void tbx::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
{
    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    if (!replaceExisting)
    {
        struct stat sourceInfo = {};
        if (::lstat(pathFrom.c_str(), &sourceInfo) != 0)
            THROW_LAST_FILE_ERROR(generateMoveErrorMsg(pathFrom, pathTo), "lstat(source)");

        struct stat targetInfo = {};
        if (::lstat(pathTo.c_str(), &targetInfo) != 0)
        {
            if (errno != ENOENT)
                THROW_LAST_FILE_ERROR(generateMoveErrorMsg(pathFrom, pathTo), "lstat(target)");
        }
        else if (sourceInfo.st_dev != targetInfo.st_dev ||
                 sourceInfo.st_ino != targetInfo.st_ino)
            throw ErrorTargetExisting(generateMoveErrorMsg(pathFrom, pathTo),
                                      replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(pathTo))), EEXIST);
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        const ErrorCode ec = errno; //copy before making other system calls!
        if (ec == EXDEV)
            throw ErrorMoveUnsupported(generateMoveErrorMsg(pathFrom, pathTo), formatSystemError("rename", ec), ec);

        throw FileError(generateMoveErrorMsg(pathFrom, pathTo), formatSystemError("rename", ec), ec);
    }
}


void tbx::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const Zstring dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == Zstr('.'); }))
        /**/throw SysError(replaceCpy<std::wstring>(L"Invalid folder name %x.", L"%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const ErrorCode ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec), ec);
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e); }
}


void tbx::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    auto checkExistingIsFolder = [&] //throw FileError
    {
        if (getItemType(dirPath) == ItemType::file /*obscure, but possible*/) //throw FileError
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPath))), EEXIST);
    };

    //path most likely already exists => check first
    try
    {
        createDirectory(dirPath); //throw FileError, ErrorTargetExisting
        return;
    }
    catch (ErrorTargetExisting&)
    {
        checkExistingIsFolder(); //throw FileError
        return;
    }
    catch (FileError&)
    {
        const std::optional<Zstring> parentPath = getParentFolderPath(dirPath);
        if (!parentPath || itemExists(*parentPath)) //throw FileError
            throw; //not a missing-parent problem
    }

    createDirectoryIfMissingRecursion(*getParentFolderPath(dirPath)); //throw FileError
    try
    {
        createDirectory(dirPath); //throw FileError, ErrorTargetExisting
    }
    catch (ErrorTargetExisting&) //possible, if createDirectoryIfMissingRecursion() is run in parallel
    {
        checkExistingIsFolder(); //throw FileError
    }
}
