// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "checksum_stream.h"
#include <vector>
#include <openssl/evp.h>
#include <xxhash.h>
#include <tbx/file_io.h>
#include <tbx/open_ssl.h>
#include <tbx/thread.h>

using namespace tbx;
using namespace xfer;


namespace
{
const EVP_MD* getDigestType(HashAlgorithm algo)
{
    switch (algo)
    {
        //@formatter:off
        case HashAlgorithm::md5:    return ::EVP_md5();
        case HashAlgorithm::sha1:   return ::EVP_sha1();
        case HashAlgorithm::sha256: return ::EVP_sha256();
        case HashAlgorithm::sha512: return ::EVP_sha512();
        //@formatter:on
        case HashAlgorithm::xxh64:
            break;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
}


void ChecksumStream::FreeMdCtx   ::operator()(evp_md_ctx_st* ctx)    const { ::EVP_MD_CTX_free(ctx); }
void ChecksumStream::FreeXxhState::operator()(XXH64_state_s* state) const { ::XXH64_freeState(state); }


ChecksumStream::ChecksumStream(HashAlgorithm algo) : //throw SysError
    algo_(algo)
{
    if (algo == HashAlgorithm::xxh64)
    {
        xxhState_.reset(::XXH64_createState());
        if (!xxhState_)
            throw SysError(formatSystemError("XXH64_createState", L"", _("Out of memory.")));

        if (::XXH64_reset(xxhState_.get(), 0 /*seed*/) != XXH_OK)
            throw SysError(formatSystemError("XXH64_reset", L"", _("Unexpected failure.")));
        return;
    }

    mdCtx_.reset(::EVP_MD_CTX_new());
    if (!mdCtx_)
        throw SysError(formatLastOpenSSLError("EVP_MD_CTX_new"));

    if (::EVP_DigestInit_ex(mdCtx_.get(), getDigestType(algo), nullptr /*ENGINE* impl*/) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestInit_ex"));
}


void ChecksumStream::update(const void* buffer, size_t bytes) //throw SysError
{
    if (finalized_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    if (bytes == 0)
        return;

    if (xxhState_)
    {
        if (::XXH64_update(xxhState_.get(), buffer, bytes) != XXH_OK)
            throw SysError(formatSystemError("XXH64_update", L"", _("Unexpected failure.")));
    }
    else if (::EVP_DigestUpdate(mdCtx_.get(), buffer, bytes) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));

    bytesProcessed_ += bytes;
}


std::string ChecksumStream::finalizeHex() //throw SysError
{
    if (finalized_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    finalized_ = true;

    if (xxhState_)
    {
        //canonical representation: big endian, same digest on every platform
        XXH64_canonical_t canonical = {};
        ::XXH64_canonicalFromHash(&canonical, ::XXH64_digest(xxhState_.get()));
        return formatAsHexString({reinterpret_cast<const char*>(canonical.digest), sizeof(canonical.digest)});
    }

    std::string digest(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    if (::EVP_DigestFinal_ex(mdCtx_.get(), reinterpret_cast<unsigned char*>(digest.data()), &bytesWritten) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    digest.resize(bytesWritten);
    return formatAsHexString(digest);
}


std::string xfer::getFileChecksum(const Zstring& filePath, HashAlgorithm algo, size_t bufferSize,
                                  const std::stop_token& stopToken,
                                  const IoCallback& notifyUnbufferedIO /*optional*/) //throw FileError, ThreadStopRequest
{
    if (bufferSize == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    FileInputPlain fileIn(filePath); //throw FileError
    try
    {
        ChecksumStream checksum(algo); //throw SysError

        std::vector<std::byte> buffer(bufferSize);
        for (;;)
        {
            interruptionPoint(stopToken); //throw ThreadStopRequest

            const size_t bytesRead = readFull(fileIn, buffer.data(), buffer.size()); //throw FileError
            if (bytesRead == 0) //end of file
                break;

            checksum.update(buffer.data(), bytesRead); //throw SysError
            if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead);
        }
        return checksum.finalizeHex(); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(filePath)), e); }
}
