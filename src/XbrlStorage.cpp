// =====================================================================================
//
//       Filename:  XbrlStorage.cpp
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

#include "XbrlStorage.h"

#include <cstddef>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

namespace
{
    constexpr const char* kRecordColumns =
        "document_id, accession_number, company_cik, form_type, filing_date, period_end_date,"
        " fiscal_year, fiscal_quarter, file_size, stored_size, compressed, compression_type,"
        " file_hash, storage_method, extract(epoch from created_at)::bigint AS created_epoch";

    std::string DateOrNull(pqxx::work& trxn, const date::year_month_day& a_date)
    {
        return a_date.ok() ? trxn.quote(fmt::format("{}", a_date)) : "NULL";
    }

    date::year_month_day DateFromField(const pqxx::field& field)
    {
        return field.is_null() ? date::year_month_day{} : StringToDateYMD("%F", field.as<std::string>());
    }

    std::basic_string_view<std::byte> AsBytes(const std::string& data)
    {
        return {reinterpret_cast<const std::byte*>(data.data()), data.size()};
    }
}   // namespace

//--------------------------------------------------------------------------------------
//       Class:  XbrlStorage
//      Method:  XbrlStorage
// Description:  constructor
//--------------------------------------------------------------------------------------
XbrlStorage::XbrlStorage(const std::string& connection_params, const std::string& schema_name,
                         const XbrlStorageConfig& config)
    : connection_params_{connection_params}, schema_name_{schema_name}, config_{config}
{
    BOOST_ASSERT_MSG(! connection_params_.empty(), "Must provide database connection parameters.");
    BOOST_ASSERT_MSG(! schema_name_.empty(), "Must provide database schema name.");
}  // -----  end of method XbrlStorage::XbrlStorage  (constructor)  -----

void XbrlStorage::CreateSchema()
{
    pqxx::connection c{connection_params_};
    pqxx::work trxn{c};

    trxn.exec(fmt::format("CREATE SCHEMA IF NOT EXISTS {}", schema_name_));

    auto create_table_cmd = fmt::format(
        "CREATE TABLE IF NOT EXISTS {0}.xbrl_documents ("
        " document_id BIGSERIAL PRIMARY KEY,"
        " accession_number TEXT NOT NULL UNIQUE,"
        " company_cik TEXT NOT NULL,"
        " company_name TEXT,"
        " form_type TEXT NOT NULL,"
        " filing_date DATE,"
        " period_end_date DATE,"
        " fiscal_year INTEGER,"
        " fiscal_quarter INTEGER,"
        " source_url TEXT,"
        " file_size BIGINT NOT NULL,"
        " stored_size BIGINT NOT NULL,"
        " compressed BOOLEAN NOT NULL,"
        " compression_type TEXT NOT NULL,"
        " file_hash TEXT NOT NULL,"
        " storage_method TEXT NOT NULL CHECK (storage_method IN ('bytea', 'large_object')),"
        " content_oid OID,"
        " content BYTEA,"
        " created_at TIMESTAMPTZ NOT NULL DEFAULT now())",
        schema_name_);
    trxn.exec(create_table_cmd);
    trxn.exec(fmt::format("CREATE INDEX IF NOT EXISTS xbrl_documents_cik_idx ON {0}.xbrl_documents (company_cik)",
                          schema_name_));
    trxn.commit();
}  // -----  end of method XbrlStorage::CreateSchema  -----

StoredDocumentRecord XbrlStorage::Store(XC::DocumentContent content, const DocumentMetadata& metadata)
{
    BOOST_ASSERT_MSG(! metadata.accession_number_.empty(), "Accession number must not be empty.");

    // no 2 threads replace the same accession number at the same time.

    KeyedLock accession_lock{&active_accessions_, metadata.accession_number_};

    auto encoded = EncodeDocument(content, config_);

    try
    {
        pqxx::connection c{connection_params_};
        pqxx::work trxn{c};

        // a re-crawl replaces what we had. Large objects are not deleted
        // with their row so we do that ourselves.

        auto existing_cmd = fmt::format("SELECT content_oid FROM {0}.xbrl_documents WHERE accession_number = {1}",
                                        schema_name_, trxn.quote(metadata.accession_number_));
        auto existing = trxn.exec(existing_cmd);
        for (const auto& row : existing)
        {
            if (! row[0].is_null())
            {
                pqxx::blob::remove(trxn, row[0].as<pqxx::oid>());
            }
        }
        if (! existing.empty())
        {
            trxn.exec(fmt::format("DELETE FROM {0}.xbrl_documents WHERE accession_number = {1}", schema_name_,
                                  trxn.quote(metadata.accession_number_)));
        }

        std::string content_oid{"NULL"};
        if (encoded.storage_method_ == StorageMethod::e_LargeObject)
        {
            auto oid = pqxx::blob::from_buf(trxn, AsBytes(encoded.bytes_));
            content_oid = std::to_string(oid);
        }

        auto insert_cmd = fmt::format(
            "INSERT INTO {0}.xbrl_documents"
            " (accession_number, company_cik, company_name, form_type, filing_date, period_end_date,"
            " fiscal_year, fiscal_quarter, source_url, file_size, stored_size, compressed, compression_type,"
            " file_hash, storage_method, content_oid, content)"
            " VALUES ({1}, {2}, {3}, {4}, {5}, {6}, {7}, {8}, {9}, {10}, {11}, {12}, {13}, {14}, {15}, {16}, {17})"
            " RETURNING {18}",
            schema_name_,
            trxn.quote(metadata.accession_number_),
            trxn.quote(metadata.company_cik_),
            metadata.company_name_.empty() ? "NULL" : trxn.quote(metadata.company_name_),
            trxn.quote(metadata.form_type_),
            DateOrNull(trxn, metadata.filing_date_),
            DateOrNull(trxn, metadata.period_end_date_),
            metadata.fiscal_year_ == 0 ? "NULL" : std::to_string(metadata.fiscal_year_),
            metadata.fiscal_quarter_ ? std::to_string(metadata.fiscal_quarter_.value()) : "NULL",
            metadata.source_url_.empty() ? "NULL" : trxn.quote(metadata.source_url_),
            encoded.original_size_,
            encoded.bytes_.size(),
            encoded.compressed_ ? "TRUE" : "FALSE",
            trxn.quote(encoded.compressed_ ? "zlib" : "none"),
            trxn.quote(encoded.file_hash_),
            trxn.quote(StorageMethodName(encoded.storage_method_)),
            content_oid,
            encoded.storage_method_ == StorageMethod::e_Bytea ? "$1" : "NULL",
            kRecordColumns);

        pqxx::row inserted = encoded.storage_method_ == StorageMethod::e_Bytea
                                 ? trxn.exec_params1(insert_cmd, std::basic_string<std::byte>{AsBytes(encoded.bytes_)})
                                 : trxn.exec1(insert_cmd);

        auto record = RowToRecord(inserted);
        trxn.commit();

        spdlog::info(catenate("Stored: ", record.accession_number_, " as: ", StorageMethodName(record.storage_method_),
                              ". Size: ", FormatFileSize(record.file_size_), ". Stored: ",
                              FormatFileSize(record.stored_size_), '.'));
        return record;
    }
    catch (const pqxx::sql_error& e)
    {
        spdlog::error(catenate("Database error: ", e.what()));
        spdlog::error(catenate("Query was: ", e.query()));
        throw StorageException(catenate("Unable to store: ", metadata.accession_number_, ": ", e.what()));
    }
    catch (const pqxx::failure& e)
    {
        throw StorageException(catenate("Unable to store: ", metadata.accession_number_, ": ", e.what()));
    }
}  // -----  end of method XbrlStorage::Store  -----

StorageStats XbrlStorage::GetStorageStats()
{
    pqxx::connection c{connection_params_};
    pqxx::work trxn{c};

    // one statement so the partitions always add up.

    auto stats_cmd = fmt::format(
        "SELECT count(*), coalesce(sum(file_size), 0),"
        " count(*) FILTER (WHERE storage_method = 'large_object'),"
        " count(*) FILTER (WHERE storage_method <> 'large_object'),"
        " count(*) FILTER (WHERE compressed),"
        " count(*) FILTER (WHERE NOT compressed)"
        " FROM {0}.xbrl_documents",
        schema_name_);
    auto row = trxn.exec1(stats_cmd);
    trxn.commit();

    StorageStats stats;
    stats.total_files_ = row[0].as<std::uint64_t>();
    stats.total_bytes_ = row[1].as<std::uint64_t>();
    stats.large_object_files_ = row[2].as<std::uint64_t>();
    stats.bytea_files_ = row[3].as<std::uint64_t>();
    stats.compressed_files_ = row[4].as<std::uint64_t>();
    stats.uncompressed_files_ = row[5].as<std::uint64_t>();
    return stats;
}  // -----  end of method XbrlStorage::GetStorageStats  -----

std::optional<StoredDocumentRecord> XbrlStorage::FindRecord(const std::string& accession_number)
{
    pqxx::connection c{connection_params_};
    pqxx::work trxn{c};

    auto find_cmd = fmt::format("SELECT {0} FROM {1}.xbrl_documents WHERE accession_number = {2}", kRecordColumns,
                                schema_name_, trxn.quote(accession_number));
    auto result = trxn.exec(find_cmd);
    trxn.commit();
    if (result.empty())
    {
        return std::nullopt;
    }
    return RowToRecord(result[0]);
}  // -----  end of method XbrlStorage::FindRecord  -----

std::optional<std::string> XbrlStorage::Retrieve(const std::string& accession_number)
{
    pqxx::connection c{connection_params_};
    pqxx::work trxn{c};

    auto retrieve_cmd = fmt::format(
        "SELECT storage_method, content_oid, content, compressed, file_size, stored_size"
        " FROM {0}.xbrl_documents WHERE accession_number = {1}",
        schema_name_, trxn.quote(accession_number));
    auto result = trxn.exec(retrieve_cmd);
    if (result.empty())
    {
        return std::nullopt;
    }
    const auto& row = result[0];

    std::basic_string<std::byte> stored;
    if (StorageMethodFromName(row["storage_method"].view()) == StorageMethod::e_LargeObject)
    {
        pqxx::blob::to_buf(trxn, row["content_oid"].as<pqxx::oid>(), stored, row["stored_size"].as<std::size_t>());
    }
    else
    {
        stored = row["content"].as<std::basic_string<std::byte>>();
    }
    trxn.commit();

    std::string bytes{reinterpret_cast<const char*>(stored.data()), stored.size()};
    if (row["compressed"].as<bool>())
    {
        return DecompressDocument(bytes, row["file_size"].as<std::uint64_t>());
    }
    return bytes;
}  // -----  end of method XbrlStorage::Retrieve  -----

bool XbrlStorage::Remove(const std::string& accession_number)
{
    KeyedLock accession_lock{&active_accessions_, accession_number};

    pqxx::connection c{connection_params_};
    pqxx::work trxn{c};

    auto remove_cmd = fmt::format("DELETE FROM {0}.xbrl_documents WHERE accession_number = {1} RETURNING content_oid",
                                  schema_name_, trxn.quote(accession_number));
    auto removed = trxn.exec(remove_cmd);
    for (const auto& row : removed)
    {
        if (! row[0].is_null())
        {
            pqxx::blob::remove(trxn, row[0].as<pqxx::oid>());
        }
    }
    trxn.commit();
    return ! removed.empty();
}  // -----  end of method XbrlStorage::Remove  -----

StoredDocumentRecord XbrlStorage::RowToRecord(const pqxx::row& row) const
{
    StoredDocumentRecord record;
    record.document_id_ = row["document_id"].as<std::string>();
    record.accession_number_ = row["accession_number"].as<std::string>();
    record.company_cik_ = row["company_cik"].as<std::string>();
    record.form_type_ = row["form_type"].as<std::string>();
    record.filing_date_ = DateFromField(row["filing_date"]);
    record.period_end_date_ = DateFromField(row["period_end_date"]);
    record.fiscal_year_ = row["fiscal_year"].is_null() ? 0 : row["fiscal_year"].as<int>();
    if (! row["fiscal_quarter"].is_null())
    {
        record.fiscal_quarter_ = row["fiscal_quarter"].as<int>();
    }
    record.file_size_ = row["file_size"].as<std::uint64_t>();
    record.stored_size_ = row["stored_size"].as<std::uint64_t>();
    record.compressed_ = row["compressed"].as<bool>();
    record.compression_type_ = row["compression_type"].as<std::string>();
    record.file_hash_ = row["file_hash"].as<std::string>();
    record.storage_method_ = StorageMethodFromName(row["storage_method"].view());
    record.created_at_ = std::chrono::system_clock::time_point{std::chrono::seconds{row["created_epoch"].as<long>()}};
    return record;
}  // -----  end of method XbrlStorage::RowToRecord  -----
