// =====================================================================================
//
//       Filename:  FinancialRatioCalculator.h
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

#ifndef _FINANCIALRATIOCALCULATOR_INC_
#define _FINANCIALRATIOCALCULATOR_INC_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <date/date.h>

#include "Crawler.h"
#include "XbrlParser.h"

// one input to a ratio. concept_ is a logical name (see RatioConfig::concept_map_)
// or a taxonomy concept name.

struct RatioTerm
{
    std::string concept_;
    double coefficient_{1.0};
    bool required_{true};
};

// value = sum(numerator terms) / sum(denominator terms).
// An empty denominator means the value is the numerator itself.

struct RatioDefinition
{
    std::string name_;
    std::string display_name_;
    std::string category_;
    std::string formula_;
    std::string rule_id_;
    std::vector<RatioTerm> numerator_;
    std::vector<RatioTerm> denominator_;
};

struct RatioBenchmark
{
    double p10_{0.0};
    double p25_{0.0};
    double median_{0.0};
    double p75_{0.0};
    double p90_{0.0};
};

struct RatioConfig
{
    std::vector<RatioDefinition> ratios_;

    // logical name -> candidate taxonomy concepts. First one present wins.

    std::map<std::string, std::vector<std::string>, std::less<>> concept_map_;

    double tax_rate_{0.25};
    bool calculate_growth_rates_{true};

    // SIC code used to look up benchmarks. Empty means none.

    std::string industry_code_;

    static RatioConfig Default();
};

// missing sections of the JSON document are taken from RatioConfig::Default().

RatioConfig LoadRatioConfigFromJSON(const std::string& json_text);

struct CalculatedRatio
{
    std::string ratio_name_;
    std::string display_name_;
    std::string category_;
    std::optional<double> value_;
    std::vector<std::string> inputs_used_;
    std::string formula_;
    std::string rule_id_;
    std::string interpretation_;

    // why value_ is empty.

    std::string annotation_;

    std::optional<double> benchmark_percentile_;
    date::year_month_day period_end_date_{};
    int fiscal_year_{0};
    std::optional<int> fiscal_quarter_;
    double data_quality_score_{0.0};
    std::string statement_id_;
};

// =====================================================================================
//        Class:  FinancialRatioCalculator
//  Description:  nothing here throws once constructed. Bad or missing inputs
//                give a ratio with no value and an annotation saying why.
// =====================================================================================
class FinancialRatioCalculator
{
public:
    // ====================  LIFECYCLE     =======================================

    explicit FinancialRatioCalculator(const RatioConfig& config = RatioConfig::Default());

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const RatioConfig& GetConfig() const { return config_; }

    [[nodiscard]] std::vector<CalculatedRatio> Calculate(const ParsedStatement& statement) const;
    [[nodiscard]] std::vector<CalculatedRatio> Calculate(const ParsedStatement& statement,
                                                         const RatioConfig& config) const;

    // statements need not be in order. Results are for each consecutive pair
    // by period end date.

    [[nodiscard]] std::vector<CalculatedRatio> CalculateGrowthRates(std::vector<ParsedStatement> statements) const;

    [[nodiscard]] std::optional<double> BenchmarkPercentile(XC::sv industry_code, XC::sv ratio_name,
                                                            double value) const;

    static std::string Interpret(XC::sv ratio_name, double value);
    static std::optional<double> GrowthRate(std::optional<double> current, std::optional<double> previous);

private:
    // ====================  METHODS       =======================================

    CalculatedRatio CalculateOne(const ParsedStatement& statement, const RatioDefinition& definition,
                                 const RatioConfig& config) const;

    // ====================  DATA MEMBERS  =======================================

    RatioConfig config_;

    // SIC code -> ratio name -> percentiles

    std::map<std::string, std::map<std::string, RatioBenchmark, std::less<>>, std::less<>> benchmarks_;

}; // -----  end of class FinancialRatioCalculator  -----

#endif   // ----- #ifndef _FINANCIALRATIOCALCULATOR_INC_  -----
