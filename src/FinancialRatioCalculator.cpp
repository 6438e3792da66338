// =====================================================================================
//
//       Filename:  FinancialRatioCalculator.cpp
//
//    Description:  derive financial ratios from parsed statements
//
//        Version:  1.0
//        Created:  10/07/2026 02:11:05 PM
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

#include "FinancialRatioCalculator.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>

#include <json/json.h>

#include <range/v3/algorithm/sort.hpp>

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

namespace
{

RatioDefinition MakeRatio(const char* name, const char* display_name, const char* category, const char* formula,
                          std::vector<RatioTerm> numerator, std::vector<RatioTerm> denominator)
{
    return RatioDefinition{name,
                           display_name,
                           category,
                           formula,
                           catenate("builtin:", name),
                           std::move(numerator),
                           std::move(denominator)};
}

struct TermsTotal
{
    std::optional<double> total_;
    std::vector<std::string> missing_required_;
    int resolved_{0};
    int terms_{0};
};

std::optional<std::pair<std::string, double>> ResolveConcept(const ParsedStatement& statement,
                                                             const RatioConfig& config, XC::sv logical_name)
{
    std::vector<std::string> candidates;
    if (auto pos = config.concept_map_.find(logical_name); pos != config.concept_map_.end())
    {
        candidates = pos->second;
    }
    else
    {
        candidates.emplace_back(logical_name);
        if (logical_name.find(':') == XC::sv::npos)
        {
            candidates.push_back(catenate("us-gaap:", logical_name));
        }
    }

    for (const auto& candidate : candidates)
    {
        if (auto found = statement.FindConcept(candidate); found)
        {
            if (auto value = found->NumericValue(); value)
            {
                return std::make_pair(candidate, value.value());
            }
        }
    }
    return std::nullopt;
}

// an expression with no resolved terms at all has no value even if
// every term was optional.

TermsTotal SumTerms(const ParsedStatement& statement, const RatioConfig& config, const std::vector<RatioTerm>& terms,
                    std::vector<std::string>& inputs_used)
{
    TermsTotal result;
    double total{0.0};
    for (const auto& term : terms)
    {
        ++result.terms_;
        auto resolved = ResolveConcept(statement, config, term.concept_);
        if (! resolved)
        {
            if (term.required_)
            {
                result.missing_required_.push_back(term.concept_);
            }
            continue;
        }
        ++result.resolved_;
        inputs_used.push_back(resolved->first);
        total += term.coefficient_ * resolved->second;
    }
    if (result.missing_required_.empty() && result.resolved_ > 0)
    {
        result.total_ = total;
    }
    return result;
}

std::string InterpretWithBands(double value, const std::array<double, 4>& limits,
                               const std::array<const char*, 5>& descriptions, bool lower_is_better)
{
    for (std::size_t i = 0; i < limits.size(); ++i)
    {
        if (lower_is_better ? value <= limits[i] : value >= limits[i])
        {
            return descriptions[i];
        }
    }
    return descriptions.back();
}

std::vector<RatioTerm> ParseTerms(const Json::Value& terms)
{
    std::vector<RatioTerm> result;
    for (const auto& term : terms)
    {
        if (term.isString())
        {
            result.push_back(RatioTerm{term.asString(), 1.0, true});
            continue;
        }
        BOOST_ASSERT_MSG(term.isObject() && term.isMember("concept"), "Ratio term must be a name or an object with a 'concept'.");
        result.push_back(RatioTerm{term["concept"].asString(), term.get("coefficient", 1.0).asDouble(),
                                   term.get("required", true).asBool()});
    }
    return result;
}

}   // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  RatioConfig::Default
 *  Description:  the ratios we compute when we are not given any.
 * =====================================================================================
 */
RatioConfig RatioConfig::Default()
{
    RatioConfig config;

    config.concept_map_ = {
        {"Assets", {"us-gaap:Assets"}},
        {"CurrentAssets", {"us-gaap:AssetsCurrent"}},
        {"Liabilities", {"us-gaap:Liabilities"}},
        {"CurrentLiabilities", {"us-gaap:LiabilitiesCurrent"}},
        {"StockholdersEquity",
         {"us-gaap:StockholdersEquity",
          "us-gaap:StockholdersEquityIncludingPortionAttributableToNoncontrollingInterest"}},
        {"NetIncome", {"us-gaap:NetIncomeLoss", "us-gaap:ProfitLoss"}},
        {"Revenue",
         {"us-gaap:Revenues", "us-gaap:RevenueFromContractWithCustomerExcludingAssessedTax", "us-gaap:SalesRevenueNet"}},
        {"GrossProfit", {"us-gaap:GrossProfit"}},
        {"OperatingIncome", {"us-gaap:OperatingIncomeLoss"}},
        {"InterestExpense", {"us-gaap:InterestExpense"}},
        {"LongTermDebt", {"us-gaap:LongTermDebt", "us-gaap:LongTermDebtNoncurrent"}},
        {"ShortTermDebt", {"us-gaap:ShortTermBorrowings", "us-gaap:LongTermDebtCurrent", "us-gaap:DebtCurrent"}},
        {"CashAndEquivalents", {"us-gaap:CashAndCashEquivalentsAtCarryingValue"}},
        {"Inventory", {"us-gaap:InventoryNet"}},
        {"OperatingCashFlow", {"us-gaap:NetCashProvidedByUsedInOperatingActivities"}},
        {"CapitalExpenditures", {"us-gaap:PaymentsToAcquirePropertyPlantAndEquipment"}}};

    const RatioTerm debt_long{"LongTermDebt", 1.0, false};
    const RatioTerm debt_short{"ShortTermDebt", 1.0, false};

    config.ratios_ = {
        // profitability

        MakeRatio("return_on_equity", "Return on Equity (ROE)", "profitability", "Net Income / Shareholders' Equity",
                  {{"NetIncome"}}, {{"StockholdersEquity"}}),
        MakeRatio("return_on_assets", "Return on Assets (ROA)", "profitability", "Net Income / Total Assets",
                  {{"NetIncome"}}, {{"Assets"}}),
        MakeRatio("return_on_invested_capital", "Return on Invested Capital (ROIC)", "profitability",
                  "NOPAT / Invested Capital",
                  {{"NetIncome"}, {"InterestExpense", 1.0 - config.tax_rate_, true}},
                  {debt_long, debt_short, {"StockholdersEquity"}}),
        MakeRatio("gross_profit_margin", "Gross Profit Margin", "profitability", "Gross Profit / Revenue",
                  {{"GrossProfit"}}, {{"Revenue"}}),
        MakeRatio("operating_profit_margin", "Operating Profit Margin", "profitability",
                  "Operating Income / Revenue", {{"OperatingIncome"}}, {{"Revenue"}}),
        MakeRatio("net_profit_margin", "Net Profit Margin", "profitability", "Net Income / Revenue",
                  {{"NetIncome"}}, {{"Revenue"}}),

        // liquidity

        MakeRatio("current_ratio", "Current Ratio", "liquidity", "Current Assets / Current Liabilities",
                  {{"CurrentAssets"}}, {{"CurrentLiabilities"}}),
        MakeRatio("quick_ratio", "Quick Ratio", "liquidity", "(Current Assets - Inventory) / Current Liabilities",
                  {{"CurrentAssets"}, {"Inventory", -1.0, false}}, {{"CurrentLiabilities"}}),
        MakeRatio("cash_ratio", "Cash Ratio", "liquidity", "Cash and Equivalents / Current Liabilities",
                  {{"CashAndEquivalents"}}, {{"CurrentLiabilities"}}),
        MakeRatio("operating_cash_flow_ratio", "Operating Cash Flow Ratio", "liquidity",
                  "Operating Cash Flow / Current Liabilities", {{"OperatingCashFlow"}}, {{"CurrentLiabilities"}}),

        // leverage

        MakeRatio("debt_to_equity", "Debt-to-Equity Ratio", "leverage", "Total Debt / Shareholders' Equity",
                  {debt_long, debt_short}, {{"StockholdersEquity"}}),
        MakeRatio("debt_to_assets", "Debt-to-Assets Ratio", "leverage", "Total Debt / Total Assets",
                  {debt_long, debt_short}, {{"Assets"}}),
        MakeRatio("interest_coverage", "Interest Coverage Ratio", "leverage", "Operating Income / Interest Expense",
                  {{"OperatingIncome"}}, {{"InterestExpense"}}),
        MakeRatio("equity_multiplier", "Equity Multiplier", "leverage", "Total Assets / Shareholders' Equity",
                  {{"Assets"}}, {{"StockholdersEquity"}}),

        // cash flow

        MakeRatio("free_cash_flow", "Free Cash Flow", "cash_flow", "Operating Cash Flow - Capital Expenditures",
                  {{"OperatingCashFlow"}, {"CapitalExpenditures", -1.0, false}}, {}),
        MakeRatio("free_cash_flow_margin", "Free Cash Flow Margin", "cash_flow",
                  "(Operating Cash Flow - Capital Expenditures) / Revenue",
                  {{"OperatingCashFlow"}, {"CapitalExpenditures", -1.0, false}}, {{"Revenue"}})};

    return config;
}		/* -----  end of function RatioConfig::Default  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LoadRatioConfigFromJSON
 *  Description:
 *
 *  {
 *      "tax_rate": 0.25,
 *      "calculate_growth_rates": true,
 *      "industry_code": "7370",
 *      "concepts": { "CurrentAssets": ["us-gaap:AssetsCurrent"] },
 *      "ratios": [ { "name": "current_ratio", "category": "liquidity",
 *                    "numerator": ["CurrentAssets"],
 *                    "denominator": [ { "concept": "CurrentLiabilities", "coefficient": 1.0, "required": true } ] } ]
 *  }
 * =====================================================================================
 */
RatioConfig LoadRatioConfigFromJSON(const std::string& json_text)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream input{json_text};
    if (! Json::parseFromStream(builder, input, &root, &errors))
    {
        throw CrawlerException(catenate("Unable to parse ratio configuration: ", errors));
    }
    BOOST_ASSERT_MSG(root.isObject(), "Ratio configuration must be a JSON object.");

    RatioConfig config = RatioConfig::Default();
    config.tax_rate_ = root.get("tax_rate", config.tax_rate_).asDouble();
    config.calculate_growth_rates_ = root.get("calculate_growth_rates", config.calculate_growth_rates_).asBool();
    config.industry_code_ = root.get("industry_code", config.industry_code_).asString();

    BOOST_ASSERT_MSG(config.tax_rate_ >= 0.0 && config.tax_rate_ < 1.0, "Tax rate must be in [0, 1).");

    // the builtin ROIC carries the after tax share of interest expense.

    for (auto& definition : config.ratios_)
    {
        for (auto& term : definition.numerator_)
        {
            if (definition.name_ == "return_on_invested_capital" && term.concept_ == "InterestExpense")
            {
                term.coefficient_ = 1.0 - config.tax_rate_;
            }
        }
    }

    if (root.isMember("concepts"))
    {
        const auto& concepts = root["concepts"];
        BOOST_ASSERT_MSG(concepts.isObject(), "'concepts' must be an object.");

        // entries replace the built-in candidates for that name only.

        for (const auto& logical_name : concepts.getMemberNames())
        {
            BOOST_ASSERT_MSG(concepts[logical_name].isArray(),
                             catenate("Candidates for concept: ", logical_name, " must be an array.").c_str());
            auto& candidates = config.concept_map_[logical_name];
            candidates.clear();
            for (const auto& candidate : concepts[logical_name])
            {
                candidates.push_back(candidate.asString());
            }
        }
    }

    if (root.isMember("ratios"))
    {
        const auto& ratios = root["ratios"];
        BOOST_ASSERT_MSG(ratios.isArray(), "'ratios' must be an array.");
        config.ratios_.clear();
        for (const auto& ratio : ratios)
        {
            RatioDefinition definition;
            definition.name_ = ratio["name"].asString();
            BOOST_ASSERT_MSG(! definition.name_.empty(), "Every ratio needs a 'name'.");
            definition.display_name_ = ratio.get("display_name", definition.name_).asString();
            definition.category_ = ratio.get("category", "custom").asString();
            definition.formula_ = ratio.get("formula", "").asString();
            definition.rule_id_ = ratio.get("rule_id", catenate("config:", definition.name_)).asString();
            definition.numerator_ = ParseTerms(ratio["numerator"]);
            definition.denominator_ = ParseTerms(ratio["denominator"]);
            BOOST_ASSERT_MSG(! definition.numerator_.empty(), "Every ratio needs a 'numerator'.");
            config.ratios_.push_back(std::move(definition));
        }
    }
    return config;
}		/* -----  end of function LoadRatioConfigFromJSON  ----- */

//--------------------------------------------------------------------------------------
//       Class:  FinancialRatioCalculator
//      Method:  FinancialRatioCalculator
// Description:  constructor
//--------------------------------------------------------------------------------------
FinancialRatioCalculator::FinancialRatioCalculator(const RatioConfig& config)
    : config_{config}
{
    // Computer Programming, Data Processing, And Other Computer Related Services

    benchmarks_["7370"] = {{"return_on_equity", RatioBenchmark{0.03, 0.08, 0.15, 0.25, 0.35}},
                           {"current_ratio", RatioBenchmark{1.2, 1.8, 2.5, 3.5, 5.0}}};
}  // -----  end of method FinancialRatioCalculator::FinancialRatioCalculator  (constructor)  -----

std::vector<CalculatedRatio> FinancialRatioCalculator::Calculate(const ParsedStatement& statement) const
{
    return Calculate(statement, config_);
}  // -----  end of method FinancialRatioCalculator::Calculate  -----

std::vector<CalculatedRatio> FinancialRatioCalculator::Calculate(const ParsedStatement& statement,
                                                                 const RatioConfig& config) const
{
    std::vector<CalculatedRatio> results;
    results.reserve(config.ratios_.size());

    for (const auto& definition : config.ratios_)
    {
        results.push_back(CalculateOne(statement, definition, config));
    }

    const auto with_values = std::count_if(results.begin(), results.end(),
                                           [](const auto& r) { return r.value_.has_value(); });
    spdlog::debug(catenate("Calculated: ", with_values, " of: ", results.size(), " ratios for statement: ",
                           statement.statement_id_));
    return results;
}  // -----  end of method FinancialRatioCalculator::Calculate  -----

CalculatedRatio FinancialRatioCalculator::CalculateOne(const ParsedStatement& statement,
                                                       const RatioDefinition& definition,
                                                       const RatioConfig& config) const
{
    CalculatedRatio ratio;
    ratio.ratio_name_ = definition.name_;
    ratio.display_name_ = definition.display_name_;
    ratio.category_ = definition.category_;
    ratio.formula_ = definition.formula_;
    ratio.rule_id_ = definition.rule_id_;
    ratio.period_end_date_ = statement.period_end_date_;
    ratio.fiscal_year_ = statement.fiscal_year_;
    ratio.fiscal_quarter_ = statement.fiscal_quarter_;
    ratio.statement_id_ = statement.statement_id_;

    try
    {
        auto numerator = SumTerms(statement, config, definition.numerator_, ratio.inputs_used_);
        TermsTotal denominator;
        if (! definition.denominator_.empty())
        {
            denominator = SumTerms(statement, config, definition.denominator_, ratio.inputs_used_);
        }

        const int total_terms = numerator.terms_ + denominator.terms_;
        ratio.data_quality_score_ =
            total_terms == 0 ? 0.0 : static_cast<double>(numerator.resolved_ + denominator.resolved_) / total_terms;

        std::vector<std::string> missing = numerator.missing_required_;
        missing.insert(missing.end(), denominator.missing_required_.begin(), denominator.missing_required_.end());
        if (! missing.empty())
        {
            std::string names;
            for (const auto& name : missing)
            {
                names += names.empty() ? name : catenate(", ", name);
            }
            ratio.annotation_ = catenate("missing required input: ", names);
            return ratio;
        }
        if (! numerator.total_ || (! definition.denominator_.empty() && ! denominator.total_))
        {
            ratio.annotation_ = "no inputs available";
            return ratio;
        }

        double value = numerator.total_.value();
        if (! definition.denominator_.empty())
        {
            if (denominator.total_.value() == 0.0)
            {
                ratio.annotation_ = "denominator is zero";
                return ratio;
            }
            value /= denominator.total_.value();
        }
        if (! std::isfinite(value))
        {
            ratio.annotation_ = "result is not a finite number";
            return ratio;
        }

        ratio.value_ = value;
        ratio.interpretation_ = Interpret(definition.name_, value);
        if (! config.industry_code_.empty())
        {
            ratio.benchmark_percentile_ = BenchmarkPercentile(config.industry_code_, definition.name_, value);
        }
    }
    catch (const std::exception& e)
    {
        ratio.value_.reset();
        ratio.annotation_ = catenate("calculation failed: ", e.what());
        spdlog::error(catenate("Ratio: ", definition.name_, " for statement: ", statement.statement_id_, ": ",
                               ratio.annotation_));
    }
    return ratio;
}  // -----  end of method FinancialRatioCalculator::CalculateOne  -----

std::optional<double> FinancialRatioCalculator::GrowthRate(std::optional<double> current,
                                                           std::optional<double> previous)
{
    if (! current || ! previous || previous.value() == 0.0)
    {
        return std::nullopt;
    }
    double rate = (current.value() - previous.value()) / std::abs(previous.value());
    if (! std::isfinite(rate))
    {
        return std::nullopt;
    }
    return rate;
}  // -----  end of method FinancialRatioCalculator::GrowthRate  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  FinancialRatioCalculator
 *      Method:  FinancialRatioCalculator :: CalculateGrowthRates
 * Description:  period over period growth for each consecutive pair.
 *--------------------------------------------------------------------------------------
 */
std::vector<CalculatedRatio> FinancialRatioCalculator::CalculateGrowthRates(
    std::vector<ParsedStatement> statements) const
{
    std::vector<CalculatedRatio> results;
    if (! config_.calculate_growth_rates_ || statements.size() < 2)
    {
        return results;
    }

    ranges::sort(statements, [](const auto& lhs, const auto& rhs) { return lhs.period_end_date_ < rhs.period_end_date_; });

    struct GrowthMeasure
    {
        const char* name_;
        const char* display_name_;
        RatioDefinition source_;
    };

    const std::vector<GrowthMeasure> measures{
        {"revenue_growth_rate", "Revenue Growth Rate", MakeRatio("revenue", "", "", "", {{"Revenue"}}, {})},
        {"earnings_growth_rate", "Earnings Growth Rate", MakeRatio("earnings", "", "", "", {{"NetIncome"}}, {})},
        {"free_cash_flow_growth_rate", "Free Cash Flow Growth Rate",
         MakeRatio("fcf", "", "", "", {{"OperatingCashFlow"}, {"CapitalExpenditures", -1.0, false}}, {})},
        {"book_value_growth_rate", "Book Value Growth Rate",
         MakeRatio("book_value", "", "", "", {{"StockholdersEquity"}}, {})}};

    for (std::size_t i = 1; i < statements.size(); ++i)
    {
        const auto& current = statements[i];
        const auto& previous = statements[i - 1];

        for (const auto& measure : measures)
        {
            CalculatedRatio ratio;
            ratio.ratio_name_ = measure.name_;
            ratio.display_name_ = measure.display_name_;
            ratio.category_ = "growth";
            ratio.formula_ = "(Current - Previous) / |Previous|";
            ratio.rule_id_ = catenate("builtin:", measure.name_);
            ratio.period_end_date_ = current.period_end_date_;
            ratio.fiscal_year_ = current.fiscal_year_;
            ratio.fiscal_quarter_ = current.fiscal_quarter_;
            ratio.statement_id_ = current.statement_id_;

            auto current_value = CalculateOne(current, measure.source_, config_);
            auto previous_value = CalculateOne(previous, measure.source_, config_);
            ratio.inputs_used_ = current_value.inputs_used_;
            ratio.data_quality_score_ = (current_value.data_quality_score_ + previous_value.data_quality_score_) / 2.0;

            ratio.value_ = GrowthRate(current_value.value_, previous_value.value_);
            if (! ratio.value_)
            {
                ratio.annotation_ = ! current_value.value_ || ! previous_value.value_
                                        ? "missing input for one of the periods"
                                        : "previous period value is zero";
            }
            results.push_back(std::move(ratio));
        }
    }
    return results;
}  // -----  end of method FinancialRatioCalculator::CalculateGrowthRates  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  FinancialRatioCalculator
 *      Method:  FinancialRatioCalculator :: BenchmarkPercentile
 * Description:  linear between the known percentiles, clamped to [10, 90].
 *--------------------------------------------------------------------------------------
 */
std::optional<double> FinancialRatioCalculator::BenchmarkPercentile(XC::sv industry_code, XC::sv ratio_name,
                                                                    double value) const
{
    auto industry = benchmarks_.find(industry_code);
    if (industry == benchmarks_.end())
    {
        return std::nullopt;
    }
    auto benchmark = industry->second.find(ratio_name);
    if (benchmark == industry->second.end())
    {
        return std::nullopt;
    }

    const auto& b = benchmark->second;
    const std::array<std::pair<double, double>, 5> points{
        {{b.p10_, 10.0}, {b.p25_, 25.0}, {b.median_, 50.0}, {b.p75_, 75.0}, {b.p90_, 90.0}}};

    if (value <= points.front().first)
    {
        return points.front().second;
    }
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        if (value <= points[i].first)
        {
            const auto& [x0, y0] = points[i - 1];
            const auto& [x1, y1] = points[i];
            return y0 + (value - x0) * (y1 - y0) / (x1 - x0);
        }
    }
    return points.back().second;
}  // -----  end of method FinancialRatioCalculator::BenchmarkPercentile  -----

std::string FinancialRatioCalculator::Interpret(XC::sv ratio_name, double value)
{
    if (ratio_name == "return_on_equity")
    {
        return InterpretWithBands(value, {0.20, 0.15, 0.10, 0.05},
                                  {"Excellent - Strong profitability", "Good - Above average profitability",
                                   "Average - Moderate profitability", "Below average - Weak profitability",
                                   "Poor - Very weak profitability"},
                                  false);
    }
    if (ratio_name == "return_on_assets")
    {
        return InterpretWithBands(value, {0.10, 0.05, 0.02, 0.01},
                                  {"Excellent - Very efficient asset utilization", "Good - Efficient asset utilization",
                                   "Average - Moderate asset utilization",
                                   "Below average - Inefficient asset utilization",
                                   "Poor - Very inefficient asset utilization"},
                                  false);
    }
    if (ratio_name == "return_on_invested_capital")
    {
        return InterpretWithBands(value, {0.15, 0.10, 0.05, 0.02},
                                  {"Excellent - Strong capital efficiency", "Good - Above average capital efficiency",
                                   "Average - Moderate capital efficiency", "Below average - Weak capital efficiency",
                                   "Poor - Very weak capital efficiency"},
                                  false);
    }
    if (ratio_name == "current_ratio")
    {
        return InterpretWithBands(value, {2.0, 1.5, 1.0, 0.5},
                                  {"Excellent - Strong liquidity position", "Good - Adequate liquidity",
                                   "Average - Marginal liquidity", "Below average - Weak liquidity",
                                   "Poor - Very weak liquidity"},
                                  false);
    }
    if (ratio_name == "debt_to_equity")
    {
        return InterpretWithBands(value, {0.3, 0.5, 1.0, 2.0},
                                  {"Excellent - Conservative leverage", "Good - Moderate leverage",
                                   "Average - Balanced leverage", "Below average - High leverage",
                                   "Poor - Very high leverage"},
                                  true);
    }
    return {};
}  // -----  end of method FinancialRatioCalculator::Interpret  -----
