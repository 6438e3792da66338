// =====================================================================================
//
//       Filename:  XbrlStorage.h
//
//    Description:  store downloaded XBRL documents in PostgreSQL
//
//        Version:  1.0
//        Created:  10/05/2026 08:47:36 AM
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

#ifndef _XBRLSTORAGE_INC_
#define _XBRLSTORAGE_INC_

#include <string>

#include <pqxx/pqxx>

#include "CrawlerMutexAndLock.h"
#include "DocumentStore.h"

// =====================================================================================
//        Class:  XbrlStorage
//  Description:  one row per accession number in <schema>.xbrl_documents.
//                Small documents go in a bytea column, big ones in a large
//                object. Each Store() is a single transaction so the row and
//                its large object appear, or are replaced, together.
//
//                A fresh connection per call, so one instance may be shared
//                between crawler threads.
// =====================================================================================
class XbrlStorage : public DocumentStore
{
public:
    // ====================  LIFECYCLE     =======================================

    XbrlStorage(const std::string& connection_params, const std::string& schema_name,
                const XbrlStorageConfig& config = XbrlStorageConfig{});

    XbrlStorage() = delete;
    XbrlStorage(const XbrlStorage& rhs) = delete;
    XbrlStorage(XbrlStorage&& rhs) = delete;

    ~XbrlStorage() override = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const std::string& GetSchemaName() const { return schema_name_; }

    std::optional<StoredDocumentRecord> FindRecord(const std::string& accession_number);

    // ====================  MUTATORS      =======================================

    void CreateSchema();

    StoredDocumentRecord Store(XC::DocumentContent content, const DocumentMetadata& metadata) override;
    StorageStats GetStorageStats() override;
    std::optional<std::string> Retrieve(const std::string& accession_number) override;
    bool Remove(const std::string& accession_number) override;

    // ====================  OPERATORS     =======================================

    XbrlStorage& operator=(const XbrlStorage& rhs) = delete;
    XbrlStorage& operator=(XbrlStorage&& rhs) = delete;

private:
    // ====================  METHODS       =======================================

    StoredDocumentRecord RowToRecord(const pqxx::row& row) const;

    // ====================  DATA MEMBERS  =======================================

    const std::string connection_params_;
    const std::string schema_name_;
    const XbrlStorageConfig config_;

    KeyedMutex active_accessions_;

}; // -----  end of class XbrlStorage  -----

#endif   // ----- #ifndef _XBRLSTORAGE_INC_  -----
