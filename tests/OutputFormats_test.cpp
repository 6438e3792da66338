// =====================================================================================
//
//       Filename:  OutputFormats_test.cpp
//
//    Description:  tests for JSON and CSV renderings
//
//        Version:  1.0
//        Created:  10/12/2026 04:15:40 PM
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

#include <sstream>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <json/json.h>

#include "FinancialRatioCalculator.h"
#include "OutputFormats.h"
#include "XbrlParser.h"
#include "XbrlSamples.h"

using namespace testing;

namespace
{

ParsedStatement SimpleStatement(const std::string& id, const std::string& filing_type)
{
    ParsedStatement statement;
    statement.statement_id_ = id;
    statement.company_id_ = "320193";
    statement.filing_type_ = filing_type;
    statement.period_end_date_ = date::year{2023} / date::September / 30;
    statement.fiscal_year_ = 2023;
    return statement;
}

Json::Value ReadBack(const std::string& text)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream input{text};
    EXPECT_TRUE(Json::parseFromStream(builder, input, &root, &errors)) << errors;
    return root;
}

}   // namespace

TEST(StatementsCSV, HeaderAndRows)
{
    auto quarterly = SimpleStatement("s2", "10-Q");
    quarterly.period_end_date_ = date::year{2023} / date::July / 1;
    quarterly.fiscal_quarter_ = 3;

    auto csv = StatementsToCSV({SimpleStatement("s1", "10-K"), quarterly});
    EXPECT_EQ(csv,
              "id,company_id,filing_type,period_end_date,fiscal_year,fiscal_quarter\n"
              "s1,320193,10-K,2023-09-30,2023,0\n"
              "s2,320193,10-Q,2023-07-01,2023,3\n");
}

TEST(StatementsCSV, FieldsWithCommasAreQuoted)
{
    auto csv = StatementsToCSV({SimpleStatement("s1", "10-K, \"amended\"")});
    EXPECT_THAT(csv, HasSubstr("s1,320193,\"10-K, \"\"amended\"\"\",2023-09-30,2023,0\n"));
}

TEST(StatementsCSV, NoStatements)
{
    EXPECT_EQ(StatementsToCSV({}), "id,company_id,filing_type,period_end_date,fiscal_year,fiscal_quarter\n");
}

TEST(JSONOutput, ParsedDocument)
{
    XbrlParser parser;
    auto result = parser.ParseDocument(XC::DocumentContent{kInstanceDocument});
    auto root = ReadBack(WriteJSON(ParseResultToJSON(result)));

    ASSERT_EQ(root["statements"].size(), 1U);
    const auto& statement = root["statements"][0];
    EXPECT_EQ(statement["company_id"].asString(), "0000320193");
    EXPECT_EQ(statement["period_end_date"].asString(), "2023-09-30");
    EXPECT_EQ(statement["fiscal_year"].asInt(), 2023);
    EXPECT_TRUE(statement["fiscal_quarter"].isNull());

    bool found_assets{false};
    for (const auto& concept_value : statement["concepts"])
    {
        if (concept_value["name"].asString() == "us-gaap:Assets")
        {
            found_assets = true;

            // the value text is kept exactly as filed.

            EXPECT_TRUE(concept_value["value"].isString());
            EXPECT_EQ(concept_value["value"].asString(), "352583000000");
            EXPECT_EQ(concept_value["period_type"].asString(), "instant");
            EXPECT_EQ(concept_value["statement_type"].asString(), "balance_sheet");
            EXPECT_EQ(concept_value["balance_type"].asString(), "debit");
            EXPECT_FALSE(concept_value.isMember("annotation"));
        }
    }
    EXPECT_TRUE(found_assets);

    ASSERT_EQ(statement["alternates"].size(), 2U);
    EXPECT_TRUE(statement["alternates"][0].isMember("annotation"));

    EXPECT_EQ(root["metadata"]["document_type"].asString(), "xbrl");
    EXPECT_EQ(root["metadata"]["context_count"].asUInt64(), 4U);
    EXPECT_TRUE(root["metadata"]["warnings"].isArray());
}

TEST(JSONOutput, ValidationReport)
{
    XbrlParser parser;
    auto root = ReadBack(WriteJSON(ValidationReportToJSON(parser.Validate(XC::DocumentContent{""}))));
    EXPECT_FALSE(root["is_valid"].asBool());
    ASSERT_EQ(root["errors"].size(), 1U);
    EXPECT_EQ(root["errors"][0].asString(), "Document is empty.");
    EXPECT_EQ(root["warnings"].size(), 0U);
}

TEST(JSONOutput, RatiosWithoutValuesAreNull)
{
    FinancialRatioCalculator calculator;
    auto ratios = calculator.Calculate(SimpleStatement("s1", "10-K"));
    auto root = ReadBack(WriteJSON(RatiosToJSON(ratios)));

    ASSERT_EQ(root.size(), ratios.size());
    EXPECT_EQ(root[0]["name"].asString(), ratios[0].ratio_name_);
    EXPECT_TRUE(root[0]["value"].isNull());
    EXPECT_TRUE(root[0]["benchmark_percentile"].isNull());
    EXPECT_EQ(root[0]["rule_id"].asString(), ratios[0].rule_id_);
    EXPECT_THAT(root[0]["annotation"].asString(), StartsWith("missing required input:"));
}

TEST(JSONOutput, CrawlResults)
{
    auto result = CrawlResult::Begin("company_crawl", std::string{"320193"});
    result.total_filings_found_ = 1;
    result.filings_downloaded_ = 1;
    result.total_bytes_downloaded_ = 5000000000ULL;
    result.outcomes_.push_back(FilingOutcome{"0000320193-23-000106", "10-K", "https://example.com/a.htm",
                                             FilingStatus::e_Stored, 5000000000ULL, 2, ""});
    result.MarkCompleted(true);

    BatchResults batch;
    batch.emplace("320193", result);
    batch.emplace("789019", MakeFailedCrawlResult("789019", "Not started"));

    auto root = ReadBack(WriteJSON(BatchResultsToJSON(batch)));
    ASSERT_TRUE(root.isMember("320193"));
    const auto& crawl = root["320193"];
    EXPECT_EQ(crawl["company_cik"].asString(), "320193");
    EXPECT_TRUE(crawl["success"].asBool());
    EXPECT_EQ(crawl["total_bytes_downloaded"].asUInt64(), 5000000000ULL);
    EXPECT_FALSE(crawl["end_time"].isNull());
    ASSERT_EQ(crawl["filings"].size(), 1U);
    EXPECT_EQ(crawl["filings"][0]["status"].asString(), "stored");
    EXPECT_EQ(crawl["filings"][0]["attempts"].asInt(), 2);

    EXPECT_FALSE(root["789019"]["success"].asBool());
    EXPECT_EQ(root["789019"]["errors"][0].asString(), "Not started");
}

TEST(JSONOutput, StorageStats)
{
    StorageStats stats;
    stats.total_files_ = 3;
    stats.total_bytes_ = 1024;
    stats.compressed_files_ = 2;
    stats.uncompressed_files_ = 1;
    stats.bytea_files_ = 3;

    auto root = ReadBack(WriteJSON(StorageStatsToJSON(stats)));
    EXPECT_EQ(root["total_files"].asUInt64(), 3U);
    EXPECT_EQ(root["total_bytes"].asUInt64(), 1024U);
    EXPECT_EQ(root["large_object_files"].asUInt64(), 0U);
    EXPECT_EQ(root["compressed_files"].asUInt64(), 2U);
}
