// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef STRUCTURES_H_8210478915019450901745
#define STRUCTURES_H_8210478915019450901745

#include <chrono>
#include <optional>
#include <vector>
#include <tbx/zstring.h>
#include "checksum_stream.h"
#include "transfer_error.h"


namespace xfer
{
const size_t MIN_BUFFER_SIZE     = 1024;
const size_t MAX_BUFFER_SIZE     = 10 * 1024 * 1024;
const size_t DEFAULT_BUFFER_SIZE =  4 * 1024 * 1024;
const size_t NETWORK_BUFFER_SIZE =  1 * 1024 * 1024; //smaller chunks: keep progress and cancellation responsive on slow links

const size_t MIN_CONCURRENCY     = 1;
const size_t MAX_CONCURRENCY     = 10;
const size_t DEFAULT_CONCURRENCY = 3;


struct RetryConfig
{
    size_t maxAttempts = 3; //including the first attempt
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{10000};
};


struct TransferSettings
{
    size_t concurrencyLimit = DEFAULT_CONCURRENCY;

    size_t bufferSize        = DEFAULT_BUFFER_SIZE;
    size_t networkBufferSize = NETWORK_BUFFER_SIZE;
    bool adaptToNetworkTarget = true; //use networkBufferSize if target is on NFS, SMB, sshfs...

    bool verifyChecksum  = true;
    bool overwrite       = false;
    bool continueOnError = false;

    bool preservePermissions = true;
    bool preserveModTime     = true;

    HashAlgorithm hashAlgorithm = HashAlgorithm::sha256;

    RetryConfig retry{5, std::chrono::milliseconds(2000), std::chrono::milliseconds(10000)};
};

//replace invalid values by defaults; returns one warning per correction
std::vector<std::wstring> validateSettings(TransferSettings& settings);


struct TransferTask
{
    size_t index = 0; //position within the batch: results[index] belongs to this task
    Zstring sourcePath;
    Zstring targetPath;
    std::optional<uint64_t> expectedSize; //from the device scan; stat() is used if missing
};

std::vector<TransferTask> makeTransferTasks(const std::vector<std::pair<Zstring /*source*/, Zstring /*target*/>>& paths);


struct FileTransferResult
{
    bool success = false;
    Zstring sourcePath;
    Zstring targetPath;
    uint64_t bytesTransferred = 0;
    std::optional<std::string> checksum; //hex digest of the source data
    bool checksumVerified = false;
    std::optional<std::wstring> errorMsg;
    std::optional<ErrorKind> errorKind;
    std::chrono::milliseconds duration{};

    bool isCancelled() const { return errorKind && *errorKind == ErrorKind::cancelled; }
};

FileTransferResult makeFailureResult(const Zstring& sourcePath, const Zstring& targetPath, const TransferError& e, std::chrono::milliseconds duration);
}

#endif //STRUCTURES_H_8210478915019450901745
