// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef FILE_IO_H_23409875162340987
#define FILE_IO_H_23409875162340987

#include <optional>
#include "file_access.h"
#include "crc.h"
#include "guid.h"

    #include <sys/stat.h>


namespace tbx
{
/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void setStatBuffered(const struct stat& fileInfo) { statBuf_ = fileInfo; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError; regular files only

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const Zstring& filePath);
};


class FileOutputPlain : public FileBase
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    //write all data to the device before close(): needed to read back what really hit the disk
    void flushBuffers(); //throw FileError

    void setPermissions(mode_t mode); //throw FileError
    void setModTime(const timespec& modTime); //throw FileError

    //close() when done, or else file is considered incomplete and will be deleted!
};

//--------------------------------------------------------------------

//return "bytesToRead" bytes unless end of stream!
size_t readFull(FileInputPlain& fileIn, void* buffer, size_t bytesToRead); //throw FileError

//generate (hopefully) unique file name next to filePath: "<filePath>.<4 hex digits><tmpEnding>"
inline
Zstring getPathWithTempName(const Zstring& filePath, const Zstring& tmpEnding)
{
    const Zstring shortGuid = printNumber<Zstring>(Zstr("%04x"), static_cast<unsigned int>(getCrc16(generateGUID())));
    return filePath + Zstr('.') + shortGuid + tmpEnding;
}
}

#endif //FILE_IO_H_23409875162340987
