// =====================================================================================
//
//       Filename:  OutputFormats.cpp
//
//    Description:  JSON and CSV renderings of our results
//
//        Version:  1.0
//        Created:  10/09/2026 03:27:40 PM
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

#include "OutputFormats.h"

#include <memory>
#include <sstream>

#include "Crawler_Utils.h"

namespace
{

Json::Value DateToJSON(const std::optional<date::year_month_day>& the_date)
{
    return the_date ? Json::Value{date::format("%F", the_date.value())} : Json::Value{Json::nullValue};
}

Json::Value StringsToJSON(const std::vector<std::string>& values)
{
    Json::Value result{Json::arrayValue};
    for (const auto& value : values)
    {
        result.append(value);
    }
    return result;
}

// fields we write quoted when they might hold a comma.

std::string CSVField(const std::string& value)
{
    if (value.find_first_of(",\"\n") == std::string::npos)
    {
        return value;
    }
    std::string quoted{"\""};
    for (char c : value)
    {
        if (c == '"')
        {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}   // namespace

Json::Value ConceptToJSON(const TaxonomyConcept& concept_value)
{
    Json::Value result;
    result["name"] = concept_value.name_;
    result["label"] = concept_value.label_;

    // the text from the filing. No rounding.

    result["value"] = concept_value.value_;
    result["unit"] = concept_value.unit_;
    result["decimals"] = concept_value.decimals_;
    result["context_id"] = concept_value.context_id_;
    result["period_type"] = PeriodTypeName(concept_value.period_type_);
    result["period_start"] = DateToJSON(concept_value.period_start_);
    result["period_end"] = DateToJSON(concept_value.period_end_);
    result["statement_type"] = StatementTypeName(concept_value.statement_type_);
    result["section"] = concept_value.section_;
    result["data_type"] = concept_value.data_type_;
    result["balance_type"] =
        concept_value.balance_type_ ? Json::Value{concept_value.balance_type_.value()} : Json::Value{Json::nullValue};
    if (! concept_value.annotation_.empty())
    {
        result["annotation"] = concept_value.annotation_;
    }
    return result;
}		/* -----  end of function ConceptToJSON  ----- */

Json::Value StatementToJSON(const ParsedStatement& statement)
{
    Json::Value result;
    result["id"] = statement.statement_id_;
    result["company_id"] = statement.company_id_;
    result["filing_type"] = statement.filing_type_;
    result["accession_number"] = statement.accession_number_;
    result["trading_symbol"] = statement.trading_symbol_;
    result["shares_outstanding"] = statement.shares_outstanding_;
    result["period_end_date"] = DateToJSON(statement.period_end_date_);
    result["fiscal_year"] = statement.fiscal_year_;
    result["fiscal_quarter"] =
        statement.fiscal_quarter_ ? Json::Value{statement.fiscal_quarter_.value()} : Json::Value{Json::nullValue};

    Json::Value concepts{Json::arrayValue};
    for (const auto& [name, concept_value] : statement.concepts_)
    {
        concepts.append(ConceptToJSON(concept_value));
    }
    result["concepts"] = concepts;

    Json::Value alternates{Json::arrayValue};
    for (const auto& alternate : statement.alternates_)
    {
        alternates.append(ConceptToJSON(alternate));
    }
    result["alternates"] = alternates;
    return result;
}		/* -----  end of function StatementToJSON  ----- */

Json::Value ParseResultToJSON(const XbrlParseResult& parse_result)
{
    Json::Value result;
    Json::Value statements{Json::arrayValue};
    for (const auto& statement : parse_result.statements_)
    {
        statements.append(StatementToJSON(statement));
    }
    result["statements"] = statements;

    Json::Value metadata;
    metadata["document_type"] = DocumentTypeName(parse_result.metadata_.document_type_);
    metadata["file_size"] = Json::UInt64{parse_result.metadata_.file_size_};
    metadata["processing_time_ms"] = static_cast<Json::Int64>(parse_result.metadata_.processing_time_.count());
    metadata["fact_count"] = static_cast<Json::UInt64>(parse_result.metadata_.fact_count_);
    metadata["context_count"] = static_cast<Json::UInt64>(parse_result.contexts_.size());
    metadata["unit_count"] = static_cast<Json::UInt64>(parse_result.units_.size());
    metadata["warnings"] = StringsToJSON(parse_result.metadata_.warnings_);
    result["metadata"] = metadata;
    return result;
}		/* -----  end of function ParseResultToJSON  ----- */

Json::Value ValidationReportToJSON(const ValidationReport& report)
{
    Json::Value result;
    result["is_valid"] = report.is_valid_;
    result["errors"] = StringsToJSON(report.errors_);
    result["warnings"] = StringsToJSON(report.warnings_);
    return result;
}		/* -----  end of function ValidationReportToJSON  ----- */

Json::Value RatiosToJSON(const std::vector<CalculatedRatio>& ratios)
{
    Json::Value result{Json::arrayValue};
    for (const auto& ratio : ratios)
    {
        Json::Value entry;
        entry["name"] = ratio.ratio_name_;
        entry["display_name"] = ratio.display_name_;
        entry["category"] = ratio.category_;
        entry["value"] = ratio.value_ ? Json::Value{ratio.value_.value()} : Json::Value{Json::nullValue};
        entry["inputs_used"] = StringsToJSON(ratio.inputs_used_);
        entry["formula"] = ratio.formula_;
        entry["rule_id"] = ratio.rule_id_;
        entry["interpretation"] = ratio.interpretation_;
        entry["annotation"] = ratio.annotation_;
        entry["benchmark_percentile"] = ratio.benchmark_percentile_ ? Json::Value{ratio.benchmark_percentile_.value()}
                                                                    : Json::Value{Json::nullValue};
        entry["period_end_date"] = DateToJSON(ratio.period_end_date_);
        entry["fiscal_year"] = ratio.fiscal_year_;
        entry["fiscal_quarter"] =
            ratio.fiscal_quarter_ ? Json::Value{ratio.fiscal_quarter_.value()} : Json::Value{Json::nullValue};
        entry["data_quality_score"] = ratio.data_quality_score_;
        entry["statement_id"] = ratio.statement_id_;
        result.append(entry);
    }
    return result;
}		/* -----  end of function RatiosToJSON  ----- */

Json::Value CrawlResultToJSON(const CrawlResult& result)
{
    Json::Value output;
    output["operation_id"] = result.operation_id_;
    output["company_cik"] = result.company_cik_ ? Json::Value{result.company_cik_.value()} : Json::Value{Json::nullValue};
    output["operation_type"] = result.operation_type_;
    output["start_time"] = UTCDateTimeAsString(result.start_time_);
    output["end_time"] =
        result.end_time_ ? Json::Value{UTCDateTimeAsString(result.end_time_.value())} : Json::Value{Json::nullValue};
    output["filings_enumerated"] = static_cast<Json::UInt64>(result.filings_enumerated_);
    output["total_filings_found"] = static_cast<Json::UInt64>(result.total_filings_found_);
    output["filings_downloaded"] = static_cast<Json::UInt64>(result.filings_downloaded_);
    output["filings_failed"] = static_cast<Json::UInt64>(result.filings_failed_);
    output["total_bytes_downloaded"] = Json::UInt64{result.total_bytes_downloaded_};
    output["errors"] = StringsToJSON(result.errors_);
    output["success"] = result.success_;

    Json::Value outcomes{Json::arrayValue};
    for (const auto& outcome : result.outcomes_)
    {
        Json::Value entry;
        entry["accession_number"] = outcome.accession_number_;
        entry["form_type"] = outcome.form_type_;
        entry["url"] = outcome.url_;
        entry["status"] = FilingStatusName(outcome.status_);
        entry["bytes"] = Json::UInt64{outcome.bytes_};
        entry["attempts"] = outcome.attempts_;
        entry["error"] = outcome.error_;
        outcomes.append(entry);
    }
    output["filings"] = outcomes;
    return output;
}		/* -----  end of function CrawlResultToJSON  ----- */

Json::Value BatchResultsToJSON(const BatchResults& results)
{
    Json::Value output{Json::objectValue};
    for (const auto& [cik, result] : results)
    {
        output[cik] = CrawlResultToJSON(result);
    }
    return output;
}		/* -----  end of function BatchResultsToJSON  ----- */

Json::Value StorageStatsToJSON(const StorageStats& stats)
{
    Json::Value output;
    output["total_files"] = Json::UInt64{stats.total_files_};
    output["total_bytes"] = Json::UInt64{stats.total_bytes_};
    output["large_object_files"] = Json::UInt64{stats.large_object_files_};
    output["bytea_files"] = Json::UInt64{stats.bytea_files_};
    output["compressed_files"] = Json::UInt64{stats.compressed_files_};
    output["uncompressed_files"] = Json::UInt64{stats.uncompressed_files_};
    return output;
}		/* -----  end of function StorageStatsToJSON  ----- */

std::string WriteJSON(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}		/* -----  end of function WriteJSON  ----- */

std::string StatementsToCSV(const std::vector<ParsedStatement>& statements)
{
    std::string output{"id,company_id,filing_type,period_end_date,fiscal_year,fiscal_quarter\n"};
    for (const auto& statement : statements)
    {
        output += catenate(CSVField(statement.statement_id_), ',', CSVField(statement.company_id_), ',',
                           CSVField(statement.filing_type_), ',', date::format("%F", statement.period_end_date_), ',',
                           statement.fiscal_year_, ',', statement.fiscal_quarter_.value_or(0), '\n');
    }
    return output;
}		/* -----  end of function StatementsToCSV  ----- */
