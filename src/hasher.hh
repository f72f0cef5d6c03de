/**
 * Copyright (c) 2023, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file hasher.hh
 */

#ifndef piiguard_hasher_hh
#define piiguard_hasher_hh

#include <iterator>
#include <stdexcept>
#include <string>

#include <stdint.h>

#include <openssl/evp.h>

#include "base/auto_mem.hh"
#include "base/string_fragment.hh"
#include "byte_array.hh"

/**
 * Incremental message digest over the OpenSSL EVP interface.
 */
class hasher {
public:
    enum class algorithm {
        md5,
        sha256,
    };

    explicit hasher(algorithm algo = algorithm::sha256)
        : h_context(EVP_MD_CTX_free)
    {
        this->h_context = EVP_MD_CTX_new();
        if (this->h_context.in() == nullptr
            || EVP_DigestInit_ex(this->h_context,
                                 algo == algorithm::md5 ? EVP_md5()
                                                        : EVP_sha256(),
                                 nullptr)
                != 1)
        {
            throw std::runtime_error("unable to initialize digest");
        }
    }

    hasher& update(const std::string& str)
    {
        EVP_DigestUpdate(this->h_context, str.data(), str.length());

        return *this;
    }

    hasher& update(const string_fragment& str)
    {
        EVP_DigestUpdate(this->h_context, str.data(), str.length());

        return *this;
    }

    hasher& update(const char* bits, size_t len)
    {
        EVP_DigestUpdate(this->h_context, bits, len);

        return *this;
    }

    /**
     * @return The lowercase hex digest of the data seen so far.  The hasher
     * can continue to be updated afterwards.
     */
    std::string to_string() const
    {
        auto_mem<EVP_MD_CTX> fin_ctx(EVP_MD_CTX_free);
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        std::string retval;

        fin_ctx = EVP_MD_CTX_new();
        if (fin_ctx.in() == nullptr
            || EVP_MD_CTX_copy_ex(fin_ctx, this->h_context.in()) != 1
            || EVP_DigestFinal_ex(fin_ctx, md, &md_len) != 1)
        {
            throw std::runtime_error("unable to finalize digest");
        }

        retval.reserve(md_len * 2);
        for (unsigned int lpc = 0; lpc < md_len; lpc++) {
            fmt::format_to(
                std::back_inserter(retval), FMT_STRING("{:02x}"), md[lpc]);
        }

        return retval;
    }

private:
    auto_mem<EVP_MD_CTX> h_context;
};

inline std::string
md5_hex(const std::string& str)
{
    return hasher(hasher::algorithm::md5).update(str).to_string();
}

inline std::string
sha256_hex(const std::string& str)
{
    return hasher(hasher::algorithm::sha256).update(str).to_string();
}

#endif
