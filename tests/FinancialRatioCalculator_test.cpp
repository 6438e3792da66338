// =====================================================================================
//
//       Filename:  FinancialRatioCalculator_test.cpp
//
//    Description:  tests for ratio, growth rate and benchmark calculations
//
//        Version:  1.0
//        Created:  10/12/2026 02:20:31 PM
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
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "Crawler_Utils.h"
#include "FinancialRatioCalculator.h"
#include "XbrlParser.h"
#include "XbrlSamples.h"

using namespace testing;

namespace
{

ParsedStatement MakeStatement(const std::string& id, date::year_month_day period_end,
                              const std::vector<std::pair<std::string, std::string>>& values)
{
    ParsedStatement statement;
    statement.statement_id_ = id;
    statement.company_id_ = "320193";
    statement.filing_type_ = "10-K";
    statement.period_end_date_ = period_end;
    statement.fiscal_year_ = static_cast<int>(period_end.year());
    for (const auto& [name, value] : values)
    {
        TaxonomyConcept concept_value;
        concept_value.name_ = name;
        concept_value.value_ = value;
        concept_value.period_end_ = period_end;
        statement.concepts_.emplace(name, concept_value);
    }
    return statement;
}

const CalculatedRatio& FindRatio(const std::vector<CalculatedRatio>& ratios, const std::string& name)
{
    auto pos = std::find_if(ratios.begin(), ratios.end(), [&name](const auto& r) { return r.ratio_name_ == name; });
    if (pos == ratios.end())
    {
        throw std::runtime_error("no ratio named: " + name);
    }
    return *pos;
}

constexpr auto kFY2023 = date::year{2023} / date::September / 30;
constexpr auto kFY2022 = date::year{2022} / date::September / 24;

}   // namespace

TEST(CalculateRatios, MissingDenominatorGivesNoValue)
{
    FinancialRatioCalculator calculator;
    auto statement = MakeStatement("s1", kFY2023, {{"us-gaap:AssetsCurrent", "100"}});
    auto ratios = calculator.Calculate(statement);

    EXPECT_EQ(ratios.size(), calculator.GetConfig().ratios_.size());

    const auto& current_ratio = FindRatio(ratios, "current_ratio");
    EXPECT_FALSE(current_ratio.value_);
    EXPECT_THAT(current_ratio.annotation_, HasSubstr("CurrentLiabilities"));
    EXPECT_THAT(current_ratio.inputs_used_, ElementsAre("us-gaap:AssetsCurrent"));
    EXPECT_DOUBLE_EQ(current_ratio.data_quality_score_, 0.5);
    EXPECT_EQ(current_ratio.statement_id_, "s1");
    EXPECT_EQ(current_ratio.rule_id_, "builtin:current_ratio");
}

TEST(CalculateRatios, ZeroDenominator)
{
    FinancialRatioCalculator calculator;
    auto statement =
        MakeStatement("s1", kFY2023, {{"us-gaap:AssetsCurrent", "100"}, {"us-gaap:LiabilitiesCurrent", "0"}});
    const auto& current_ratio = FindRatio(calculator.Calculate(statement), "current_ratio");
    EXPECT_FALSE(current_ratio.value_);
    EXPECT_EQ(current_ratio.annotation_, "denominator is zero");
    EXPECT_DOUBLE_EQ(current_ratio.data_quality_score_, 1.0);
}

TEST(CalculateRatios, NonNumericValueIsMissing)
{
    FinancialRatioCalculator calculator;
    auto statement = MakeStatement("s1", kFY2023,
                                   {{"us-gaap:AssetsCurrent", "about 100"}, {"us-gaap:LiabilitiesCurrent", "50"}});
    const auto& current_ratio = FindRatio(calculator.Calculate(statement), "current_ratio");
    EXPECT_FALSE(current_ratio.value_);
    EXPECT_EQ(current_ratio.annotation_, "missing required input: CurrentAssets");
}

TEST(CalculateRatios, FromParsedFiling)
{
    XbrlParser parser;
    auto statements = parser.Parse(XC::DocumentContent{kInstanceDocument});
    ASSERT_EQ(statements.size(), 1U);

    FinancialRatioCalculator calculator;
    auto ratios = calculator.Calculate(statements[0]);

    const auto& current_ratio = FindRatio(ratios, "current_ratio");
    ASSERT_TRUE(current_ratio.value_);
    EXPECT_NEAR(current_ratio.value_.value(), 0.98801, 1e-5);
    EXPECT_EQ(current_ratio.interpretation_, "Below average - Weak liquidity");
    EXPECT_EQ(current_ratio.fiscal_year_, 2023);
    EXPECT_EQ(current_ratio.period_end_date_, kFY2023);

    const auto& roe = FindRatio(ratios, "return_on_equity");
    ASSERT_TRUE(roe.value_);
    EXPECT_NEAR(roe.value_.value(), 1.5608, 1e-4);
    EXPECT_THAT(roe.inputs_used_, ElementsAre("us-gaap:NetIncomeLoss", "us-gaap:StockholdersEquity"));
    EXPECT_EQ(roe.category_, "profitability");
    EXPECT_EQ(roe.interpretation_, "Excellent - Strong profitability");
    EXPECT_FALSE(roe.benchmark_percentile_);

    const auto& net_margin = FindRatio(ratios, "net_profit_margin");
    ASSERT_TRUE(net_margin.value_);
    EXPECT_NEAR(net_margin.value_.value(), 96995.0 / 383285.0, 1e-9);

    const auto& roic = FindRatio(ratios, "return_on_invested_capital");
    EXPECT_FALSE(roic.value_);
    EXPECT_EQ(roic.annotation_, "missing required input: InterestExpense");
}

TEST(CalculateRatios, OptionalTermsMayBeAbsent)
{
    FinancialRatioCalculator calculator;

    auto with_capex = MakeStatement("s1", kFY2023,
                                    {{"us-gaap:NetCashProvidedByUsedInOperatingActivities", "1000"},
                                     {"us-gaap:PaymentsToAcquirePropertyPlantAndEquipment", "300"},
                                     {"us-gaap:Revenues", "2000"}});
    auto ratios = calculator.Calculate(with_capex);
    EXPECT_DOUBLE_EQ(FindRatio(ratios, "free_cash_flow").value_.value(), 700.0);
    EXPECT_DOUBLE_EQ(FindRatio(ratios, "free_cash_flow_margin").value_.value(), 0.35);

    auto without_capex =
        MakeStatement("s2", kFY2023, {{"us-gaap:NetCashProvidedByUsedInOperatingActivities", "1000"}});
    const auto& fcf = FindRatio(calculator.Calculate(without_capex), "free_cash_flow");
    EXPECT_DOUBLE_EQ(fcf.value_.value(), 1000.0);
    EXPECT_DOUBLE_EQ(fcf.data_quality_score_, 0.5);

    auto no_debt = MakeStatement("s3", kFY2023, {{"us-gaap:StockholdersEquity", "1000"}});
    const auto& debt_to_equity = FindRatio(calculator.Calculate(no_debt), "debt_to_equity");
    EXPECT_FALSE(debt_to_equity.value_);
    EXPECT_EQ(debt_to_equity.annotation_, "no inputs available");
}

TEST(CalculateRatios, FirstCandidateConceptWins)
{
    FinancialRatioCalculator calculator;
    auto statement = MakeStatement("s1", kFY2023,
                                   {{"us-gaap:ProfitLoss", "50"},
                                    {"us-gaap:StockholdersEquityIncludingPortionAttributableToNoncontrollingInterest",
                                     "500"}});
    const auto& roe = FindRatio(calculator.Calculate(statement), "return_on_equity");
    ASSERT_TRUE(roe.value_);
    EXPECT_DOUBLE_EQ(roe.value_.value(), 0.1);
    EXPECT_THAT(roe.inputs_used_,
                ElementsAre("us-gaap:ProfitLoss",
                            "us-gaap:StockholdersEquityIncludingPortionAttributableToNoncontrollingInterest"));
}

TEST(RatioConfiguration, FromJSON)
{
    const std::string json_text = R"***({
        "industry_code": "7370",
        "concepts": { "CA": ["us-gaap:AssetsCurrent"], "CL": ["us-gaap:LiabilitiesCurrent"] },
        "ratios": [
            { "name": "current_ratio", "numerator": ["CA"], "denominator": [ { "concept": "CL" } ] },
            { "name": "working_capital", "category": "liquidity",
              "numerator": ["CA", { "concept": "CL", "coefficient": -1.0 }] }
        ]
    })***";

    auto config = LoadRatioConfigFromJSON(json_text);
    ASSERT_EQ(config.ratios_.size(), 2U);
    EXPECT_EQ(config.ratios_[0].rule_id_, "config:current_ratio");
    EXPECT_EQ(config.ratios_[0].category_, "custom");
    EXPECT_EQ(config.industry_code_, "7370");

    FinancialRatioCalculator calculator{config};
    auto statement =
        MakeStatement("s1", kFY2023, {{"us-gaap:AssetsCurrent", "250"}, {"us-gaap:LiabilitiesCurrent", "100"}});
    auto ratios = calculator.Calculate(statement);
    ASSERT_EQ(ratios.size(), 2U);

    EXPECT_DOUBLE_EQ(ratios[0].value_.value(), 2.5);
    EXPECT_EQ(ratios[0].benchmark_percentile_, std::optional<double>{50.0});
    EXPECT_DOUBLE_EQ(ratios[1].value_.value(), 150.0);
    EXPECT_FALSE(ratios[1].benchmark_percentile_);
}

TEST(RatioConfiguration, PartialConceptsKeepBuiltinMappings)
{
    auto config = LoadRatioConfigFromJSON(R"***({ "concepts": { "Revenue": ["acme:NetSales"] } })***");
    EXPECT_THAT(config.concept_map_.at("Revenue"), ElementsAre("acme:NetSales"));
    EXPECT_THAT(config.concept_map_.at("CurrentLiabilities"), ElementsAre("us-gaap:LiabilitiesCurrent"));

    FinancialRatioCalculator calculator{config};
    auto statement = MakeStatement("s1", kFY2023,
                                   {{"us-gaap:AssetsCurrent", "300"},
                                    {"us-gaap:LiabilitiesCurrent", "100"},
                                    {"us-gaap:GrossProfit", "40"},
                                    {"acme:NetSales", "200"}});
    auto ratios = calculator.Calculate(statement);

    const auto& current = FindRatio(ratios, "current_ratio");
    ASSERT_TRUE(current.value_);
    EXPECT_DOUBLE_EQ(current.value_.value(), 3.0);

    const auto& gross_margin = FindRatio(ratios, "gross_profit_margin");
    ASSERT_TRUE(gross_margin.value_);
    EXPECT_DOUBLE_EQ(gross_margin.value_.value(), 0.2);
}

TEST(RatioConfiguration, TaxRateAppliesToBuiltinROIC)
{
    auto config = LoadRatioConfigFromJSON(R"***({ "tax_rate": 0.4 })***");
    FinancialRatioCalculator calculator{config};
    auto statement = MakeStatement("s1", kFY2023,
                                   {{"us-gaap:NetIncomeLoss", "100"},
                                    {"us-gaap:InterestExpense", "50"},
                                    {"us-gaap:StockholdersEquity", "1000"}});
    const auto& roic = FindRatio(calculator.Calculate(statement), "return_on_invested_capital");
    ASSERT_TRUE(roic.value_);
    EXPECT_NEAR(roic.value_.value(), 0.13, 1e-12);
}

TEST(RatioConfiguration, BadConfigurations)
{
    EXPECT_THROW(LoadRatioConfigFromJSON("{ not json"), CrawlerException);
    EXPECT_THROW(LoadRatioConfigFromJSON(R"***({ "tax_rate": 1.5 })***"), AssertionException);
    EXPECT_THROW(LoadRatioConfigFromJSON(R"***({ "ratios": [ { "numerator": ["CA"] } ] })***"), AssertionException);
    EXPECT_THROW(LoadRatioConfigFromJSON(R"***([1, 2, 3])***"), AssertionException);
    EXPECT_THROW(LoadRatioConfigFromJSON(R"***({ "concepts": { "Revenue": "acme:NetSales" } })***"), AssertionException);
}

TEST(Benchmarks, InterpolatedPercentiles)
{
    FinancialRatioCalculator calculator;
    EXPECT_EQ(calculator.BenchmarkPercentile("7370", "current_ratio", 2.5), std::optional<double>{50.0});
    EXPECT_DOUBLE_EQ(calculator.BenchmarkPercentile("7370", "current_ratio", 3.0).value(), 62.5);
    EXPECT_EQ(calculator.BenchmarkPercentile("7370", "current_ratio", 0.5), std::optional<double>{10.0});
    EXPECT_EQ(calculator.BenchmarkPercentile("7370", "current_ratio", 9.0), std::optional<double>{90.0});
    EXPECT_FALSE(calculator.BenchmarkPercentile("7370", "quick_ratio", 1.0));
    EXPECT_FALSE(calculator.BenchmarkPercentile("9999", "current_ratio", 1.0));
}

TEST(GrowthRates, ConsecutivePeriodsInAnyOrder)
{
    FinancialRatioCalculator calculator;
    std::vector<ParsedStatement> statements{
        MakeStatement("2023", kFY2023, {{"us-gaap:Revenues", "120"}, {"us-gaap:NetIncomeLoss", "10"}}),
        MakeStatement("2022", kFY2022, {{"us-gaap:Revenues", "100"}, {"us-gaap:NetIncomeLoss", "0"}})};

    auto growth = calculator.CalculateGrowthRates(statements);
    ASSERT_EQ(growth.size(), 4U);

    const auto& revenue = FindRatio(growth, "revenue_growth_rate");
    ASSERT_TRUE(revenue.value_);
    EXPECT_NEAR(revenue.value_.value(), 0.2, 1e-12);
    EXPECT_EQ(revenue.statement_id_, "2023");
    EXPECT_EQ(revenue.category_, "growth");

    const auto& earnings = FindRatio(growth, "earnings_growth_rate");
    EXPECT_FALSE(earnings.value_);
    EXPECT_EQ(earnings.annotation_, "previous period value is zero");

    const auto& book_value = FindRatio(growth, "book_value_growth_rate");
    EXPECT_FALSE(book_value.value_);
    EXPECT_EQ(book_value.annotation_, "missing input for one of the periods");
}

TEST(GrowthRates, NeedsTwoPeriods)
{
    FinancialRatioCalculator calculator;
    EXPECT_THAT(calculator.CalculateGrowthRates({MakeStatement("s1", kFY2023, {{"us-gaap:Revenues", "1"}})}),
                IsEmpty());

    auto config = RatioConfig::Default();
    config.calculate_growth_rates_ = false;
    FinancialRatioCalculator no_growth{config};
    EXPECT_THAT(no_growth.CalculateGrowthRates({MakeStatement("a", kFY2022, {{"us-gaap:Revenues", "1"}}),
                                                MakeStatement("b", kFY2023, {{"us-gaap:Revenues", "2"}})}),
                IsEmpty());
}

TEST(GrowthRates, NegativePreviousValue)
{
    EXPECT_DOUBLE_EQ(FinancialRatioCalculator::GrowthRate(50.0, -100.0).value(), 1.5);
    EXPECT_FALSE(FinancialRatioCalculator::GrowthRate(50.0, 0.0));
    EXPECT_FALSE(FinancialRatioCalculator::GrowthRate(std::nullopt, 10.0));
}
