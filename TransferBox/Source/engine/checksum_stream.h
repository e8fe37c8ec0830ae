// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef CHECKSUM_STREAM_H_0912384756102938
#define CHECKSUM_STREAM_H_0912384756102938

#include <memory>
#include <stop_token>
#include <tbx/file_access.h>


struct evp_md_ctx_st; //EVP_MD_CTX
struct XXH64_state_s; //XXH64_state_t

namespace xfer
{
enum class HashAlgorithm
{
    md5,
    sha1,
    sha256,
    sha512,
    xxh64, //non-cryptographic, fast: digest as recorded by the media import history
};


//incremental content hash: feed chunks in stream order, finalize once
class ChecksumStream
{
public:
    explicit ChecksumStream(HashAlgorithm algo = HashAlgorithm::sha256); //throw SysError

    void update(const void* buffer, size_t bytes); //throw SysError

    //lower-case hex digest; CONTRACT: call once, no update() afterwards
    std::string finalizeHex(); //throw SysError

    uint64_t getBytesProcessed() const { return bytesProcessed_; }
    HashAlgorithm getAlgorithm() const { return algo_; }

private:
    struct FreeMdCtx     { void operator()(evp_md_ctx_st* ctx) const; };
    struct FreeXxhState  { void operator()(XXH64_state_s* state) const; };

    const HashAlgorithm algo_;
    std::unique_ptr<evp_md_ctx_st, FreeMdCtx> mdCtx_;        //OpenSSL digests
    std::unique_ptr<XXH64_state_s, FreeXxhState> xxhState_;  //HashAlgorithm::xxh64
    uint64_t bytesProcessed_ = 0;
    bool finalized_ = false;
};


//stream a whole file through ChecksumStream
std::string getFileChecksum(const Zstring& filePath, HashAlgorithm algo, size_t bufferSize,
                            const std::stop_token& stopToken,
                            const tbx::IoCallback& notifyUnbufferedIO /*optional*/); //throw FileError, ThreadStopRequest
}

#endif //CHECKSUM_STREAM_H_0912384756102938
