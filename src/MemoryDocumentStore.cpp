// =====================================================================================
//
//       Filename:  MemoryDocumentStore.cpp
//
//    Description:  document store kept in memory. used for dry runs and tests
//
//        Version:  1.0
//        Created:  10/04/2026 02:31:10 PM
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

#include "MemoryDocumentStore.h"

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

//--------------------------------------------------------------------------------------
//       Class:  MemoryDocumentStore
//      Method:  MemoryDocumentStore
// Description:  constructor
//--------------------------------------------------------------------------------------
MemoryDocumentStore::MemoryDocumentStore(const XbrlStorageConfig& config)
    : config_{config}
{
}  // -----  end of method MemoryDocumentStore::MemoryDocumentStore  (constructor)  -----

StoredDocumentRecord MemoryDocumentStore::Store(XC::DocumentContent content, const DocumentMetadata& metadata)
{
    BOOST_ASSERT_MSG(! metadata.accession_number_.empty(), "Accession number must not be empty.");

    auto encoded = EncodeDocument(content, config_);

    Entry entry;
    entry.record_.accession_number_ = metadata.accession_number_;
    entry.record_.company_cik_ = metadata.company_cik_;
    entry.record_.form_type_ = metadata.form_type_;
    entry.record_.filing_date_ = metadata.filing_date_;
    entry.record_.period_end_date_ = metadata.period_end_date_;
    entry.record_.fiscal_year_ = metadata.fiscal_year_;
    entry.record_.fiscal_quarter_ = metadata.fiscal_quarter_;
    entry.record_.file_size_ = encoded.original_size_;
    entry.record_.stored_size_ = encoded.bytes_.size();
    entry.record_.compressed_ = encoded.compressed_;
    entry.record_.compression_type_ = encoded.compressed_ ? "zlib" : "none";
    entry.record_.file_hash_ = encoded.file_hash_;
    entry.record_.storage_method_ = encoded.storage_method_;
    entry.record_.created_at_ = std::chrono::system_clock::now();
    entry.bytes_ = std::move(encoded.bytes_);

    std::lock_guard<std::mutex> lk{m_};
    entry.record_.document_id_ = std::to_string(next_id_++);
    auto record = entry.record_;
    documents_.insert_or_assign(metadata.accession_number_, std::move(entry));

    spdlog::debug(catenate("Stored: ", record.accession_number_, " as: ", StorageMethodName(record.storage_method_),
                           ". Size: ", FormatFileSize(record.file_size_), ". Stored: ",
                           FormatFileSize(record.stored_size_), '.'));
    return record;
}  // -----  end of method MemoryDocumentStore::Store  -----

StorageStats MemoryDocumentStore::GetStorageStats()
{
    std::lock_guard<std::mutex> lk{m_};

    StorageStats stats;
    for (const auto& [accession, entry] : documents_)
    {
        ++stats.total_files_;
        stats.total_bytes_ += entry.record_.file_size_;
        if (entry.record_.storage_method_ == StorageMethod::e_LargeObject)
        {
            ++stats.large_object_files_;
        }
        else
        {
            ++stats.bytea_files_;
        }
        if (entry.record_.compressed_)
        {
            ++stats.compressed_files_;
        }
        else
        {
            ++stats.uncompressed_files_;
        }
    }
    return stats;
}  // -----  end of method MemoryDocumentStore::GetStorageStats  -----

std::optional<std::string> MemoryDocumentStore::Retrieve(const std::string& accession_number)
{
    std::lock_guard<std::mutex> lk{m_};
    auto pos = documents_.find(accession_number);
    if (pos == documents_.end())
    {
        return std::nullopt;
    }
    if (pos->second.record_.compressed_)
    {
        return DecompressDocument(pos->second.bytes_, pos->second.record_.file_size_);
    }
    return pos->second.bytes_;
}  // -----  end of method MemoryDocumentStore::Retrieve  -----

bool MemoryDocumentStore::Remove(const std::string& accession_number)
{
    std::lock_guard<std::mutex> lk{m_};
    return documents_.erase(accession_number) > 0;
}  // -----  end of method MemoryDocumentStore::Remove  -----

std::optional<StoredDocumentRecord> MemoryDocumentStore::FindRecord(const std::string& accession_number) const
{
    std::lock_guard<std::mutex> lk{m_};
    auto pos = documents_.find(accession_number);
    if (pos == documents_.end())
    {
        return std::nullopt;
    }
    return pos->second.record_;
}  // -----  end of method MemoryDocumentStore::FindRecord  -----
