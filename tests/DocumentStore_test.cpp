// =====================================================================================
//
//       Filename:  DocumentStore_test.cpp
//
//    Description:  tests for document encoding and the memory and PostgreSQL document stores
//
//        Version:  1.0
//        Created:  10/12/2026 11:20:19 AM
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

#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "Crawler_Utils.h"
#include "DocumentStore.h"
#include "MemoryDocumentStore.h"
#include "XbrlStorage.h"

namespace
{

DocumentMetadata MakeMetadata(const std::string& accession_number, const std::string& form_type = "10-K")
{
    DocumentMetadata metadata;
    metadata.accession_number_ = accession_number;
    metadata.company_cik_ = "320193";
    metadata.company_name_ = "Apple Inc.";
    metadata.form_type_ = form_type;
    metadata.source_url_ = "https://www.sec.gov/Archives/edgar/data/320193/000032019323000106/aapl-20230930.htm";
    metadata.filing_date_ = date::year{2023} / date::November / 3;
    metadata.period_end_date_ = date::year{2023} / date::September / 30;
    metadata.fiscal_year_ = 2023;
    return metadata;
}

// XBRL compresses very well.

std::string MakeCompressibleDocument()
{
    std::string document{"<xbrli:xbrl>"};
    for (int i = 0; i < 500; ++i)
    {
        document += "<us-gaap:Assets contextRef=\"I2023\" unitRef=\"usd\">352583000000</us-gaap:Assets>\n";
    }
    document += "</xbrli:xbrl>";
    return document;
}

}   // namespace

TEST(EncodeDocument, HashIsSHA256OfOriginal)
{
    EXPECT_EQ(ComputeSHA256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(EncodeDocument, CompressionKeptOnlyWhenSmaller)
{
    XbrlStorageConfig config;

    const auto big = MakeCompressibleDocument();
    auto encoded = EncodeDocument(XC::DocumentContent{big}, config);
    EXPECT_TRUE(encoded.compressed_);
    EXPECT_LT(encoded.bytes_.size(), big.size());
    EXPECT_EQ(encoded.original_size_, big.size());
    EXPECT_EQ(DecompressDocument(encoded.bytes_, encoded.original_size_), big);

    const std::string tiny{"ab"};
    auto not_worth_it = EncodeDocument(XC::DocumentContent{tiny}, config);
    EXPECT_FALSE(not_worth_it.compressed_);
    EXPECT_EQ(not_worth_it.bytes_, tiny);
}

TEST(EncodeDocument, CompressionCanBeTurnedOff)
{
    XbrlStorageConfig config;
    config.compression_enabled_ = false;

    const auto big = MakeCompressibleDocument();
    auto encoded = EncodeDocument(XC::DocumentContent{big}, config);
    EXPECT_FALSE(encoded.compressed_);
    EXPECT_EQ(encoded.bytes_, big);
}

TEST(EncodeDocument, ThresholdAppliesToStoredSize)
{
    XbrlStorageConfig config;
    config.large_object_threshold_ = 1024;

    // compresses to well under 1 KB so stays inline.

    const auto big = MakeCompressibleDocument();
    ASSERT_GT(big.size(), config.large_object_threshold_);
    EXPECT_EQ(EncodeDocument(XC::DocumentContent{big}, config).storage_method_, StorageMethod::e_Bytea);

    config.compression_enabled_ = false;
    EXPECT_EQ(EncodeDocument(XC::DocumentContent{big}, config).storage_method_, StorageMethod::e_LargeObject);

    config.use_large_objects_ = false;
    EXPECT_EQ(EncodeDocument(XC::DocumentContent{big}, config).storage_method_, StorageMethod::e_Bytea);
}

TEST(StorageMethod, NamesRoundTrip)
{
    EXPECT_EQ(StorageMethodName(StorageMethod::e_LargeObject), "large_object");
    EXPECT_EQ(StorageMethodFromName("bytea"), StorageMethod::e_Bytea);
    EXPECT_THROW(StorageMethodFromName("blob"), AssertionException);
}

class MemoryStore : public testing::Test
{
protected:
    MemoryDocumentStore store_;
};

TEST_F(MemoryStore, StoreAndRetrieveOriginal)
{
    const auto document = MakeCompressibleDocument();
    auto record = store_.Store(XC::DocumentContent{document}, MakeMetadata("0000320193-23-000106"));

    EXPECT_EQ(record.accession_number_, "0000320193-23-000106");
    EXPECT_EQ(record.company_cik_, "320193");
    EXPECT_EQ(record.file_size_, document.size());
    EXPECT_TRUE(record.compressed_);
    EXPECT_EQ(record.compression_type_, "zlib");
    EXPECT_EQ(record.file_hash_, ComputeSHA256Hex(document));

    auto retrieved = store_.Retrieve("0000320193-23-000106");
    ASSERT_TRUE(retrieved);
    EXPECT_EQ(retrieved.value(), document);
    EXPECT_FALSE(store_.Retrieve("0000320193-23-999999"));
}

TEST_F(MemoryStore, SameAccessionReplacesPrevious)
{
    store_.Store(XC::DocumentContent{"first version"}, MakeMetadata("0000320193-23-000106"));
    store_.Store(XC::DocumentContent{"second version"}, MakeMetadata("0000320193-23-000106"));

    auto stats = store_.GetStorageStats();
    EXPECT_EQ(stats.total_files_, 1U);
    EXPECT_EQ(store_.Retrieve("0000320193-23-000106").value(), "second version");
}

TEST_F(MemoryStore, StatsCountEachKind)
{
    const auto big = MakeCompressibleDocument();
    store_.Store(XC::DocumentContent{big}, MakeMetadata("0000320193-23-000106"));
    store_.Store(XC::DocumentContent{"ab"}, MakeMetadata("0000320193-23-000077", "10-Q"));

    auto stats = store_.GetStorageStats();
    EXPECT_EQ(stats.total_files_, 2U);
    EXPECT_EQ(stats.total_bytes_, big.size() + 2);
    EXPECT_EQ(stats.compressed_files_, 1U);
    EXPECT_EQ(stats.uncompressed_files_, 1U);
    EXPECT_EQ(stats.bytea_files_, 2U);
    EXPECT_EQ(stats.large_object_files_, 0U);
}

TEST_F(MemoryStore, RemoveDeletes)
{
    store_.Store(XC::DocumentContent{"content"}, MakeMetadata("0000320193-23-000106"));
    EXPECT_TRUE(store_.Remove("0000320193-23-000106"));
    EXPECT_FALSE(store_.Remove("0000320193-23-000106"));
    EXPECT_FALSE(store_.FindRecord("0000320193-23-000106"));
}

TEST_F(MemoryStore, AccessionNumberRequired)
{
    EXPECT_THROW(store_.Store(XC::DocumentContent{"content"}, MakeMetadata("")), AssertionException);
    EXPECT_EQ(store_.GetStorageStats().total_files_, 0U);
}

TEST_F(MemoryStore, ConcurrentStoresAllLand)
{
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t)
    {
        workers.emplace_back([this, t]() {
            for (int i = 0; i < 25; ++i)
            {
                store_.Store(XC::DocumentContent{"document body"},
                             MakeMetadata(BuildAccessionNumber("320193", 2023, t * 100 + i)));
            }
        });
    }
    for (auto& worker : workers)
    {
        worker.join();
    }
    EXPECT_EQ(store_.GetStorageStats().total_files_, 100U);
}

// needs a running PostgreSQL. Set XBRL_CRAWLER_TEST_DB to a connection string to run these.

class PostgresStore : public testing::Test
{
protected:
    void SetUp() override
    {
        const char* connection = std::getenv("XBRL_CRAWLER_TEST_DB");
        if (connection == nullptr)
        {
            GTEST_SKIP() << "XBRL_CRAWLER_TEST_DB not set.";
        }
        XbrlStorageConfig config;
        config.large_object_threshold_ = 1024;
        config.compression_enabled_ = false;
        store_ = std::make_unique<XbrlStorage>(connection, "xbrl_crawler_unit_test", config);
        store_->CreateSchema();
        store_->Remove("0000320193-23-000106");
        store_->Remove("0000320193-23-000077");
    }

    std::unique_ptr<XbrlStorage> store_;
};

TEST_F(PostgresStore, SmallDocumentGoesInline)
{
    auto record = store_->Store(XC::DocumentContent{"<xbrl/>"}, MakeMetadata("0000320193-23-000077", "10-Q"));
    EXPECT_EQ(record.storage_method_, StorageMethod::e_Bytea);
    EXPECT_EQ(store_->Retrieve("0000320193-23-000077").value(), "<xbrl/>");

    auto found = store_->FindRecord("0000320193-23-000077");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->form_type_, "10-Q");
    EXPECT_EQ(found->period_end_date_, (date::year{2023} / date::September / 30));
}

TEST_F(PostgresStore, BigDocumentGoesToLargeObjectAndIsReplaced)
{
    const auto big = MakeCompressibleDocument();
    auto record = store_->Store(XC::DocumentContent{big}, MakeMetadata("0000320193-23-000106"));
    EXPECT_EQ(record.storage_method_, StorageMethod::e_LargeObject);
    EXPECT_EQ(store_->Retrieve("0000320193-23-000106").value(), big);

    store_->Store(XC::DocumentContent{"<xbrl/>"}, MakeMetadata("0000320193-23-000106"));
    EXPECT_EQ(store_->Retrieve("0000320193-23-000106").value(), "<xbrl/>");
    EXPECT_EQ(store_->FindRecord("0000320193-23-000106")->storage_method_, StorageMethod::e_Bytea);

    EXPECT_TRUE(store_->Remove("0000320193-23-000106"));
    EXPECT_FALSE(store_->Retrieve("0000320193-23-000106"));
}
