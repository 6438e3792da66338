// =====================================================================================
//
//       Filename:  MemoryDocumentStore.h
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

#ifndef _MEMORYDOCUMENTSTORE_INC_
#define _MEMORYDOCUMENTSTORE_INC_

#include <map>
#include <mutex>
#include <string>

#include "DocumentStore.h"

// =====================================================================================
//        Class:  MemoryDocumentStore
//  Description:  everything is encoded before we take the lock so a failure
//                never leaves a partial entry behind.
// =====================================================================================
class MemoryDocumentStore : public DocumentStore
{
public:
    // ====================  LIFECYCLE     =======================================

    explicit MemoryDocumentStore(const XbrlStorageConfig& config = XbrlStorageConfig{});

    MemoryDocumentStore(const MemoryDocumentStore& rhs) = delete;
    MemoryDocumentStore(MemoryDocumentStore&& rhs) = delete;

    ~MemoryDocumentStore() override = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] std::optional<StoredDocumentRecord> FindRecord(const std::string& accession_number) const;

    // ====================  MUTATORS      =======================================

    StoredDocumentRecord Store(XC::DocumentContent content, const DocumentMetadata& metadata) override;
    StorageStats GetStorageStats() override;
    std::optional<std::string> Retrieve(const std::string& accession_number) override;
    bool Remove(const std::string& accession_number) override;

    // ====================  OPERATORS     =======================================

    MemoryDocumentStore& operator=(const MemoryDocumentStore& rhs) = delete;
    MemoryDocumentStore& operator=(MemoryDocumentStore&& rhs) = delete;

private:
    struct Entry
    {
        StoredDocumentRecord record_;
        std::string bytes_;
    };

    // ====================  DATA MEMBERS  =======================================

    const XbrlStorageConfig config_;

    mutable std::mutex m_;
    std::map<std::string, Entry> documents_;
    int next_id_{1};

}; // -----  end of class MemoryDocumentStore  -----

#endif   // ----- #ifndef _MEMORYDOCUMENTSTORE_INC_  -----
