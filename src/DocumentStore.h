// =====================================================================================
//
//       Filename:  DocumentStore.h
//
//    Description:  interface to whatever holds our downloaded filings plus the encoding rules shared by all of them
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

#ifndef _DOCUMENTSTORE_INC_
#define _DOCUMENTSTORE_INC_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <date/date.h>

#include "Crawler.h"

enum class StorageMethod
{
    e_Bytea,
    e_LargeObject
};

std::string StorageMethodName(StorageMethod method);
StorageMethod StorageMethodFromName(XC::sv name);

struct XbrlStorageConfig
{
    bool use_large_objects_{true};

    // documents whose stored (encoded) size is above this go to a large object.

    std::uint64_t large_object_threshold_{100 * 1024 * 1024};
    bool compression_enabled_{true};
    int compression_level_{6};
};

// what we know about a filing when we hand it to storage.

struct DocumentMetadata
{
    std::string accession_number_;
    std::string company_cik_;
    std::string company_name_;
    std::string form_type_;
    std::string source_url_;
    date::year_month_day filing_date_{};
    date::year_month_day period_end_date_{};
    int fiscal_year_{0};
    std::optional<int> fiscal_quarter_;
};

struct StoredDocumentRecord
{
    std::string document_id_;
    std::string accession_number_;
    std::string company_cik_;
    std::string form_type_;
    date::year_month_day filing_date_{};
    date::year_month_day period_end_date_{};
    int fiscal_year_{0};
    std::optional<int> fiscal_quarter_;

    // always the original, uncompressed size.

    std::uint64_t file_size_{0};
    std::uint64_t stored_size_{0};
    bool compressed_{false};
    std::string compression_type_{"none"};
    std::string file_hash_;
    StorageMethod storage_method_{StorageMethod::e_Bytea};
    std::chrono::system_clock::time_point created_at_;
};

struct StorageStats
{
    std::uint64_t total_files_{0};
    std::uint64_t total_bytes_{0};
    std::uint64_t large_object_files_{0};
    std::uint64_t bytea_files_{0};
    std::uint64_t compressed_files_{0};
    std::uint64_t uncompressed_files_{0};
};

// the bytes we will actually write plus how they were produced.

struct EncodedDocument
{
    std::string bytes_;
    std::string file_hash_;
    std::uint64_t original_size_{0};
    bool compressed_{false};
    StorageMethod storage_method_{StorageMethod::e_Bytea};
};

std::string ComputeSHA256Hex(XC::sv content);
std::string CompressDocument(XC::sv content, int compression_level);
std::string DecompressDocument(XC::sv compressed, std::uint64_t original_size);

// compression is kept only when it actually makes the document smaller.

EncodedDocument EncodeDocument(XC::DocumentContent content, const XbrlStorageConfig& config);

// =====================================================================================
//        Class:  DocumentStore
//  Description:  the crawler only talks to this. Implementations must make
//                each Store() atomic and safe to call from several threads.
// =====================================================================================

class DocumentStore
{
public:
    virtual ~DocumentStore() = default;

    // replaces any existing document with the same accession number.

    virtual StoredDocumentRecord Store(XC::DocumentContent content, const DocumentMetadata& metadata) = 0;

    virtual StorageStats GetStorageStats() = 0;

    // original bytes, decompressed.

    virtual std::optional<std::string> Retrieve(const std::string& accession_number) = 0;

    virtual bool Remove(const std::string& accession_number) = 0;
};

#endif   // ----- #ifndef _DOCUMENTSTORE_INC_  -----
