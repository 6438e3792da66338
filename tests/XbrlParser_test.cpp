// =====================================================================================
//
//       Filename:  XbrlParser_test.cpp
//
//    Description:  tests for XBRL and inline XBRL validation and parsing
//
//        Version:  1.0
//        Created:  10/12/2026 01:12:48 PM
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

#include <algorithm>
#include <limits>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "Crawler_Utils.h"
#include "XbrlParser.h"
#include "XbrlSamples.h"

using namespace testing;

namespace
{

const TaxonomyConcept* FindAlternate(const ParsedStatement& statement, const std::string& name,
                                     const std::string& context_id)
{
    auto pos = std::find_if(statement.alternates_.begin(), statement.alternates_.end(),
                            [&](const auto& a) { return a.name_ == name && a.context_id_ == context_id; });
    return pos == statement.alternates_.end() ? nullptr : &*pos;
}

std::string ReplaceText(std::string text, const std::string& from, const std::string& to)
{
    auto pos = text.find(from);
    if (pos != std::string::npos)
    {
        text.replace(pos, from.size(), to);
    }
    return text;
}

}   // namespace

class ValidateXbrl : public Test
{
protected:
    XbrlParser parser_;
};

TEST_F(ValidateXbrl, WellFormedInstanceIsValid)
{
    auto report = parser_.Validate(XC::DocumentContent{kInstanceDocument});
    EXPECT_TRUE(report.is_valid_);
    EXPECT_THAT(report.errors_, IsEmpty());
    EXPECT_THAT(report.warnings_, IsEmpty());
}

TEST_F(ValidateXbrl, WellFormedInlineIsValid)
{
    auto report = parser_.Validate(XC::DocumentContent{kInlineDocument});
    EXPECT_TRUE(report.is_valid_);
    EXPECT_THAT(report.errors_, IsEmpty());
}

TEST_F(ValidateXbrl, SameAnswerEveryTime)
{
    const std::string broken = ReplaceText(kInstanceDocument, "xmlns:us-gaap=\"http://fasb.org/us-gaap/2023\"", "");
    auto first = parser_.Validate(XC::DocumentContent{broken});
    auto second = parser_.Validate(XC::DocumentContent{broken});
    EXPECT_EQ(first, second);
}

TEST_F(ValidateXbrl, EmptyDocument)
{
    auto report = parser_.Validate(XC::DocumentContent{""});
    EXPECT_FALSE(report.is_valid_);
    EXPECT_THAT(report.errors_, ElementsAre("Document is empty."));
}

TEST_F(ValidateXbrl, MalformedMarkupReportedNotThrown)
{
    auto report = parser_.Validate(XC::DocumentContent{"<xbrli:xbrl><xbrli:context id=\"c1\">"});
    EXPECT_FALSE(report.is_valid_);
    ASSERT_EQ(report.errors_.size(), 1U);
    EXPECT_THAT(report.errors_[0], StartsWith("Malformed markup:"));
}

TEST_F(ValidateXbrl, MissingNamespacesAndContexts)
{
    auto report = parser_.Validate(XC::DocumentContent{"<xbrl><Assets contextRef=\"c1\">5</Assets></xbrl>"});
    EXPECT_FALSE(report.is_valid_);
    EXPECT_THAT(report.errors_, Contains(HasSubstr("Missing XBRL instance namespace")));
    EXPECT_THAT(report.errors_, Contains(HasSubstr("No recognized financial taxonomy")));
    EXPECT_THAT(report.errors_, Contains("No reporting period context found."));
}

TEST_F(ValidateXbrl, WrongRootElement)
{
    auto report = parser_.Validate(XC::DocumentContent{
        "<xbrli:linkbase xmlns:xbrli=\"http://www.xbrl.org/2003/instance\"></xbrli:linkbase>"});
    EXPECT_FALSE(report.is_valid_);
    EXPECT_THAT(report.errors_, Contains(HasSubstr("is not an XBRL instance 'xbrl' element")));
}

TEST_F(ValidateXbrl, BadContextPeriodIsAnError)
{
    const std::string bad_date = ReplaceText(kInstanceDocument, "<xbrli:instant>2022-09-24</xbrli:instant>",
                                             "<xbrli:instant>2022-19-24</xbrli:instant>");
    auto report = parser_.Validate(XC::DocumentContent{bad_date});
    EXPECT_FALSE(report.is_valid_);
    EXPECT_THAT(report.errors_, Contains(HasSubstr("Context 'I2022' has invalid instant")));
}

TEST_F(ValidateXbrl, AnomaliesAreWarnings)
{
    std::string odd = ReplaceText(kInstanceDocument,
                                  "<us-gaap:AssetsCurrent contextRef=\"I2023\" unitRef=\"usd\"",
                                  "<us-gaap:AssetsCurrent contextRef=\"I2099\" unitRef=\"eur\"");
    odd = ReplaceText(odd, "<dei:DocumentPeriodEndDate contextRef=\"FY2023\">2023-09-30</dei:DocumentPeriodEndDate>",
                      "");
    auto report = parser_.Validate(XC::DocumentContent{odd});
    EXPECT_TRUE(report.is_valid_);
    EXPECT_THAT(report.warnings_, ElementsAre("Facts refer to undefined context: 'I2099'.",
                                              "Facts refer to undefined unit: 'eur'.",
                                              "Missing dei:DocumentPeriodEndDate."));
}

TEST_F(ValidateXbrl, OversizeDocument)
{
    XbrlParser small_parser{XbrlParserConfig{64}};
    auto report = small_parser.Validate(XC::DocumentContent{kInstanceDocument});
    EXPECT_FALSE(report.is_valid_);
    EXPECT_THAT(report.errors_, Contains(HasSubstr("exceeds maximum")));
    EXPECT_THROW(small_parser.ParseDocument(XC::DocumentContent{kInstanceDocument}), MaxFileSizeException);
}

class ParseInstance : public Test
{
protected:
    void SetUp() override
    {
        result_ = parser_.ParseDocument(XC::DocumentContent{kInstanceDocument},
                                        FilingDescriptor{"", "", "0000320193-23-000106"});
        ASSERT_EQ(result_.statements_.size(), 1U);
    }

    XbrlParser parser_;
    XbrlParseResult result_;
};

TEST_F(ParseInstance, FilingLevelData)
{
    const auto& statement = result_.statements_.front();
    EXPECT_FALSE(statement.statement_id_.empty());
    EXPECT_EQ(statement.company_id_, "0000320193");
    EXPECT_EQ(statement.filing_type_, "10-K");
    EXPECT_EQ(statement.accession_number_, "0000320193-23-000106");
    EXPECT_EQ(statement.trading_symbol_, "AAPL");
    EXPECT_EQ(statement.period_end_date_, (date::year{2023} / date::September / 30));
    EXPECT_EQ(statement.fiscal_year_, 2023);
    EXPECT_FALSE(statement.fiscal_quarter_);
}

TEST_F(ParseInstance, MetadataAndModel)
{
    EXPECT_EQ(result_.metadata_.document_type_, DocumentType::e_XBRL);
    EXPECT_EQ(result_.metadata_.file_size_, std::string{kInstanceDocument}.size());
    EXPECT_EQ(result_.contexts_.size(), 4U);
    EXPECT_EQ(result_.units_.size(), 2U);
    EXPECT_THAT(result_.metadata_.warnings_,
                Contains("Skipped unrecognized concept: aapl:ProductsAndServicesPerformanceObligationTerm"));
}

TEST_F(ParseInstance, PrimaryContextValues)
{
    const auto& statement = result_.statements_.front();

    auto assets = statement.FindConcept("us-gaap:Assets");
    ASSERT_TRUE(assets);
    EXPECT_EQ(assets->value_, "352583000000");
    EXPECT_EQ(assets->context_id_, "I2023");
    EXPECT_EQ(assets->label_, "Total Assets");
    EXPECT_EQ(assets->unit_, "iso4217:USD");
    EXPECT_EQ(assets->decimals_, "-6");
    EXPECT_EQ(assets->period_type_, PeriodType::e_Instant);
    EXPECT_EQ(assets->statement_type_, StatementType::e_BalanceSheet);
    EXPECT_EQ(assets->section_, "assets");
    EXPECT_EQ(assets->data_type_, "monetaryItemType");
    EXPECT_EQ(assets->balance_type_, std::optional<std::string>{"debit"});

    auto revenues = statement.FindConcept("us-gaap:Revenues");
    ASSERT_TRUE(revenues);
    EXPECT_EQ(revenues->value_, "383285000000");
    EXPECT_EQ(revenues->context_id_, "FY2023");
    EXPECT_EQ(revenues->period_type_, PeriodType::e_Duration);
    EXPECT_EQ(revenues->period_start_, (date::year{2022} / date::September / 25));
    EXPECT_EQ(revenues->statement_type_, StatementType::e_IncomeStatement);

    EXPECT_EQ(statement.FindConcept("us-gaap:StockholdersEquity")->balance_type_,
              std::optional<std::string>{"credit"});
    EXPECT_FALSE(statement.FindConcept("dei:DocumentType"));
    EXPECT_FALSE(statement.FindConcept("aapl:ProductsAndServicesPerformanceObligationTerm"));
}

TEST_F(ParseInstance, OtherContextsKeptAsAlternates)
{
    const auto& statement = result_.statements_.front();
    EXPECT_EQ(statement.alternates_.size(), 2U);

    const auto* prior_assets = FindAlternate(statement, "us-gaap:Assets", "I2022");
    ASSERT_NE(prior_assets, nullptr);
    EXPECT_EQ(prior_assets->value_, "352755000000");
    EXPECT_THAT(prior_assets->annotation_, StartsWith("non-primary period context: I2022"));

    const auto* americas = FindAlternate(statement, "us-gaap:Revenues", "FY2023_Americas");
    ASSERT_NE(americas, nullptr);
    EXPECT_THAT(americas->annotation_, StartsWith("dimensional context: FY2023_Americas"));
}

TEST_F(ParseInstance, FilingDescriptorWins)
{
    auto statements = parser_.Parse(XC::DocumentContent{kInstanceDocument}, FilingDescriptor{"320193", "10-K405", ""});
    ASSERT_EQ(statements.size(), 1U);
    EXPECT_EQ(statements[0].company_id_, "320193");
    EXPECT_EQ(statements[0].filing_type_, "10-K405");
}

TEST_F(ParseInstance, InconsistentDuplicateIsFlagged)
{
    const std::string duplicated = ReplaceText(
        kInstanceDocument, "</xbrli:xbrl>",
        "<us-gaap:Assets contextRef=\"I2023\" unitRef=\"usd\" decimals=\"-6\">352000000000</us-gaap:Assets>\n"
        "</xbrli:xbrl>");
    auto result = parser_.ParseDocument(XC::DocumentContent{duplicated});
    const auto& statement = result.statements_.front();

    EXPECT_EQ(statement.FindConcept("us-gaap:Assets")->value_, "352583000000");
    const auto* duplicate = FindAlternate(statement, "us-gaap:Assets", "I2023");
    ASSERT_NE(duplicate, nullptr);
    EXPECT_EQ(duplicate->value_, "352000000000");
    EXPECT_THAT(duplicate->annotation_, StartsWith("inconsistent duplicate"));
    EXPECT_THAT(result.metadata_.warnings_,
                Contains("Inconsistent duplicate values for: us-gaap:Assets in context: I2023"));
}

TEST_F(ParseInstance, NilFactsAndUndefinedContextsSkipped)
{
    std::string odd = ReplaceText(kInstanceDocument,
                                  "<us-gaap:AssetsCurrent contextRef=\"I2023\" unitRef=\"usd\" decimals=\"-6\">143566000000</us-gaap:AssetsCurrent>",
                                  "<us-gaap:AssetsCurrent contextRef=\"I2023\" unitRef=\"usd\" xsi:nil=\"true\" "
                                  "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\"/>");
    odd = ReplaceText(odd, "<us-gaap:LiabilitiesCurrent contextRef=\"I2023\"",
                      "<us-gaap:LiabilitiesCurrent contextRef=\"I2099\"");
    auto result = parser_.ParseDocument(XC::DocumentContent{odd});
    const auto& statement = result.statements_.front();

    EXPECT_FALSE(statement.FindConcept("us-gaap:AssetsCurrent"));
    EXPECT_FALSE(statement.FindConcept("us-gaap:LiabilitiesCurrent"));
    EXPECT_THAT(result.metadata_.warnings_, Contains("Skipped facts with undefined context: 'I2099'."));
}

TEST_F(ParseInstance, MalformedMarkupThrows)
{
    EXPECT_THROW(parser_.ParseDocument(XC::DocumentContent{"<xbrli:xbrl><xbrli:context>"}), XBRLException);
}

TEST_F(ParseInstance, LabelsFromLinkbase)
{
    auto labels = ExtractFieldLabels(XC::LabelContent{kLabelDocument});
    ASSERT_EQ(labels.size(), 1U);
    EXPECT_EQ(labels.at("us-gaap:AssetsCurrent"), "Total current assets");

    parser_.UseLabels(labels);
    auto statements = parser_.Parse(XC::DocumentContent{kInstanceDocument});
    EXPECT_EQ(statements[0].FindConcept("us-gaap:AssetsCurrent")->label_, "Total current assets");
    EXPECT_EQ(statements[0].FindConcept("us-gaap:Assets")->label_, "Total Assets");
}

class ParseInline : public Test
{
protected:
    XbrlParser parser_;
};

TEST_F(ParseInline, DisplayedNumbersAreNormalized)
{
    auto result = parser_.ParseDocument(XC::DocumentContent{kInlineDocument});
    EXPECT_EQ(result.metadata_.document_type_, DocumentType::e_InlineXBRL);
    ASSERT_EQ(result.statements_.size(), 1U);
    const auto& statement = result.statements_.front();

    EXPECT_EQ(statement.filing_type_, "10-Q");
    EXPECT_EQ(statement.period_end_date_, (date::year{2023} / date::July / 1));
    EXPECT_EQ(statement.fiscal_year_, 2023);
    EXPECT_EQ(statement.fiscal_quarter_, std::optional<int>{3});

    EXPECT_EQ(statement.FindConcept("us-gaap:Revenues")->value_, "81797000000");
    EXPECT_EQ(statement.FindConcept("us-gaap:NonoperatingIncomeExpense")->value_, "-1234500000");
    EXPECT_EQ(statement.FindConcept("us-gaap:CommercialPaper")->value_, "0");

    // the same fact shown twice is one value, not an alternate.

    EXPECT_THAT(statement.alternates_, IsEmpty());
}

TEST(NormalizeInlineNumber, ScaleSignAndFormats)
{
    EXPECT_EQ(NormalizeInlineNumber("1,234.5", "ixt:num-dot-decimal", 6, false), "1234500000");
    EXPECT_EQ(NormalizeInlineNumber("1.234,5", "ixt:num-comma-decimal", 0, false), "1234.5");
    EXPECT_EQ(NormalizeInlineNumber("12", "", -2, false), "0.12");
    EXPECT_EQ(NormalizeInlineNumber("5", "", 0, true), "-5");
    EXPECT_EQ(NormalizeInlineNumber("-", "ixt:fixed-zero", 3, true), "0");
    EXPECT_THROW(NormalizeInlineNumber("n/a", "", 0, false), XBRLException);
    EXPECT_THROW(NormalizeInlineNumber("1.2.3", "", 0, false), XBRLException);
}

TEST(NormalizeInlineNumber, ScaleOutOfRangeIsUnreadable)
{
    EXPECT_EQ(NormalizeInlineNumber("7", "", 30, false), "7" + std::string(30, '0'));
    EXPECT_EQ(NormalizeInlineNumber("7", "", -30, false), "0." + std::string(29, '0') + "7");
    EXPECT_THROW(NormalizeInlineNumber("7", "", 31, false), XBRLException);
    EXPECT_THROW(NormalizeInlineNumber("7", "", 1000000000, false), XBRLException);
    EXPECT_THROW(NormalizeInlineNumber("7", "", std::numeric_limits<int>::min(), false), XBRLException);
    EXPECT_THROW(NormalizeInlineNumber("-", "ixt:fixed-zero", std::numeric_limits<int>::min(), false), XBRLException);
}

TEST(ConceptClassification, NamesLabelsAndTypes)
{
    EXPECT_EQ(MapConceptToLabel("us-gaap:NetIncomeLoss"), "Net Income");
    EXPECT_EQ(MapConceptToLabel("us-gaap:AccountsPayableCurrent"), "Accounts Payable Current");
    EXPECT_EQ(ClassifyStatementType("us-gaap:NetCashProvidedByUsedInOperatingActivities"),
              StatementType::e_CashFlowStatement);
    EXPECT_EQ(ClassifyStatementType("us-gaap:LiabilitiesCurrent"), StatementType::e_BalanceSheet);
    EXPECT_EQ(ClassifyStatementType("us-gaap:CostOfGoodsAndServicesSold"), StatementType::e_IncomeStatement);
    EXPECT_EQ(ClassifyStatementType("dei:EntityRegistrantName"), StatementType::e_Other);
    EXPECT_EQ(InferDataType("us-gaap:EarningsPerShareBasic"), "perShareItemType");
    EXPECT_EQ(InferBalanceType("us-gaap:CostOfRevenue"), std::optional<std::string>{"debit"});
    EXPECT_EQ(InferBalanceType("us-gaap:Revenues"), std::optional<std::string>{"credit"});
    EXPECT_FALSE(InferBalanceType("dei:EntityRegistrantName"));
}

TEST(DocumentDetection, InlineBeforeInstance)
{
    EXPECT_EQ(DetectDocumentType(kInlineDocument), DocumentType::e_InlineXBRL);
    EXPECT_EQ(DetectDocumentType(kInstanceDocument), DocumentType::e_XBRL);
    EXPECT_EQ(DetectDocumentType("<html><body>see the attached xbrl exhibit</body></html>"),
              DocumentType::e_HTMLEmbedded);
}
