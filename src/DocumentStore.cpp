// =====================================================================================
//
//       Filename:  DocumentStore.cpp
//
//    Description:  encoding rules shared by all document stores
//
//        Version:  1.0
//        Created:  10/04/2026 09:05:52 AM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

	/* This file is part of XBRL_Crawler. */

	/* XBRL_Crawler is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* XBRL_Crawler is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with XBRL_Crawler.  If not, see <http://www.gnu.org/licenses/>. */

#include "DocumentStore.h"

#include <iterator>
#include <memory>

#include <openssl/evp.h>
#include <zlib.h>

#include <fmt/format.h>

#include "Crawler_Utils.h"

std::string StorageMethodName(StorageMethod method)
{
    return method == StorageMethod::e_LargeObject ? "large_object" : "bytea";
}    // -----  end of function StorageMethodName  -----

StorageMethod StorageMethodFromName(XC::sv name)
{
    BOOST_ASSERT_MSG(name == "large_object" || name == "bytea", catenate("Unknown storage method: ", name).c_str());
    return name == "large_object" ? StorageMethod::e_LargeObject : StorageMethod::e_Bytea;
}    // -----  end of function StorageMethodFromName  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ComputeSHA256Hex
 *  Description:  lower case hex digest of the original document
 * =====================================================================================
 */
std::string ComputeSHA256Hex(XC::sv content)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (! ctx)
    {
        throw StorageException("EVP_MD_CTX_new failed.");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len{0};

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1)
    {
        throw StorageException("SHA-256 digest failed.");
    }

    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i)
    {
        fmt::format_to(std::back_inserter(result), "{:02x}", digest[i]);
    }
    return result;
}		/* -----  end of function ComputeSHA256Hex  ----- */

std::string CompressDocument(XC::sv content, int compression_level)
{
    uLongf compressed_len = compressBound(static_cast<uLong>(content.size()));
    std::string compressed(compressed_len, '\0');

    auto rc = compress2(reinterpret_cast<Bytef*>(compressed.data()), &compressed_len,
                        reinterpret_cast<const Bytef*>(content.data()), static_cast<uLong>(content.size()),
                        compression_level);
    if (rc != Z_OK)
    {
        throw StorageException(catenate("zlib compress2 failed. rc: ", rc));
    }
    compressed.resize(compressed_len);
    return compressed;
}		/* -----  end of function CompressDocument  ----- */

std::string DecompressDocument(XC::sv compressed, std::uint64_t original_size)
{
    std::string result(original_size, '\0');
    uLongf result_len = static_cast<uLongf>(original_size);

    auto rc = uncompress(reinterpret_cast<Bytef*>(result.data()), &result_len,
                         reinterpret_cast<const Bytef*>(compressed.data()), static_cast<uLong>(compressed.size()));
    if (rc != Z_OK || result_len != original_size)
    {
        throw StorageException(catenate("zlib uncompress failed. rc: ", rc, ". Expected: ", original_size,
                                        " bytes. Got: ", result_len));
    }
    return result;
}		/* -----  end of function DecompressDocument  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  EncodeDocument
 *  Description:  decide compression and storage method for a document.
 * =====================================================================================
 */
EncodedDocument EncodeDocument(XC::DocumentContent content, const XbrlStorageConfig& config)
{
    EncodedDocument result;
    result.original_size_ = content.get().size();
    result.file_hash_ = ComputeSHA256Hex(content.get());

    if (config.compression_enabled_ && ! content.get().empty())
    {
        auto compressed = CompressDocument(content.get(), config.compression_level_);
        if (compressed.size() < content.get().size())
        {
            result.bytes_ = std::move(compressed);
            result.compressed_ = true;
        }
    }
    if (! result.compressed_)
    {
        result.bytes_.assign(content.get());
    }

    result.storage_method_ = config.use_large_objects_ && result.bytes_.size() > config.large_object_threshold_
                                 ? StorageMethod::e_LargeObject
                                 : StorageMethod::e_Bytea;
    return result;
}		/* -----  end of function EncodeDocument  ----- */
