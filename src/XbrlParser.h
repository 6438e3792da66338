// =====================================================================================
//
//       Filename:  XbrlParser.h
//
//    Description:  validate and parse XBRL instance and inline XBRL documents
//
//        Version:  1.0
//        Created:  10/06/2026 09:30:48 AM
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

#ifndef _XBRLPARSER_INC_
#define _XBRLPARSER_INC_

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <date/date.h>

#include <pugixml.hpp>

#include "Crawler.h"

enum class DocumentType
{
    e_XBRL,
    e_InlineXBRL,
    e_HTMLEmbedded
};

enum class PeriodType
{
    e_Instant,
    e_Duration
};

enum class StatementType
{
    e_BalanceSheet,
    e_IncomeStatement,
    e_CashFlowStatement,
    e_Other
};

std::string DocumentTypeName(DocumentType doc_type);
std::string PeriodTypeName(PeriodType period_type);
std::string StatementTypeName(StatementType statement_type);

DocumentType DetectDocumentType(XC::sv content);

struct XbrlContext
{
    std::string id_;
    std::string entity_identifier_;
    std::string entity_scheme_;
    PeriodType period_type_{PeriodType::e_Instant};
    std::optional<date::year_month_day> start_date_;

    // the instant for instant contexts.

    date::year_month_day end_date_{};

    // segment or scenario present.

    bool has_dimensions_{false};
};

struct XbrlUnit
{
    std::string id_;
    std::string measure_;
};

struct XbrlFact
{
    std::string concept_;
    std::string value_;
    std::string context_ref_;
    std::string unit_ref_;
    std::string decimals_;
    std::string precision_;
    bool is_nil_{false};
};

// one reported value. value_ is kept as the decimal text from the filing so
// no precision is lost.

struct TaxonomyConcept
{
    std::string name_;
    std::string label_;
    std::string value_;
    std::string unit_;
    std::string decimals_;
    std::string context_id_;
    PeriodType period_type_{PeriodType::e_Instant};
    std::optional<date::year_month_day> period_start_;
    date::year_month_day period_end_{};
    StatementType statement_type_{StatementType::e_Other};
    std::string section_;
    std::string data_type_;
    std::optional<std::string> balance_type_;

    // set on alternates. says why this one was not chosen.

    std::string annotation_;

    [[nodiscard]] std::optional<double> NumericValue() const;
};

struct FilingDescriptor
{
    std::string company_cik_;
    std::string filing_type_;
    std::string accession_number_;
};

struct ParsedStatement
{
    std::string statement_id_;
    std::string company_id_;
    std::string filing_type_;
    std::string accession_number_;
    std::string trading_symbol_;
    std::string shares_outstanding_;
    date::year_month_day period_end_date_{};
    int fiscal_year_{0};
    std::optional<int> fiscal_quarter_;

    // primary reporting context values, by concept name.

    std::map<std::string, TaxonomyConcept, std::less<>> concepts_;

    // other contexts (prior periods, dimensional breakdowns) for the same concepts.

    std::vector<TaxonomyConcept> alternates_;

    [[nodiscard]] std::optional<TaxonomyConcept> FindConcept(XC::sv concept_name) const;
};

struct ValidationReport
{
    bool is_valid_{true};
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    bool operator==(const ValidationReport& rhs) const = default;
};

struct ProcessingMetadata
{
    DocumentType document_type_{DocumentType::e_XBRL};
    std::uint64_t file_size_{0};
    std::chrono::milliseconds processing_time_{0};
    std::size_t fact_count_{0};
    std::vector<std::string> warnings_;
};

struct XbrlParseResult
{
    std::vector<ParsedStatement> statements_;
    std::vector<XbrlContext> contexts_;
    std::vector<XbrlUnit> units_;
    ProcessingMetadata metadata_;
};

struct XbrlParserConfig
{
    std::uint64_t max_file_size_{100 * 1024 * 1024};
};

// concept classification. names may include a namespace prefix.

std::string MapConceptToLabel(XC::sv concept_name);
StatementType ClassifyStatementType(XC::sv concept_name);
std::string ClassifySection(XC::sv concept_name);
std::string InferDataType(XC::sv concept_name);
std::optional<std::string> InferBalanceType(XC::sv concept_name);

// inline XBRL shows numbers formatted for people. we want plain decimal text.

std::string NormalizeInlineNumber(XC::sv displayed, XC::sv format, int scale, bool negative);

// the label linkbase (_lab.xml) maps concept names to display labels.

XC::ConceptLabels ExtractFieldLabels(XC::LabelContent label_document);

// =====================================================================================
//        Class:  XbrlParser
//  Description:  stateless apart from configuration and optional labels.
//                Validate() never throws. Parse() throws XBRLException only
//                when the document can not be read as markup at all.
// =====================================================================================
class XbrlParser
{
public:
    // ====================  LIFECYCLE     =======================================

    explicit XbrlParser(const XbrlParserConfig& config = XbrlParserConfig{});

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] ValidationReport Validate(XC::DocumentContent document) const;

    [[nodiscard]] std::vector<ParsedStatement> Parse(XC::DocumentContent document,
                                                     const FilingDescriptor& filing = FilingDescriptor{}) const;

    [[nodiscard]] XbrlParseResult ParseDocument(XC::DocumentContent document,
                                                const FilingDescriptor& filing = FilingDescriptor{}) const;

    // ====================  MUTATORS      =======================================

    void UseLabels(const XC::ConceptLabels& labels) { labels_ = labels; }

private:
    // ====================  METHODS       =======================================

    std::string LabelFor(XC::sv concept_name) const;

    // ====================  DATA MEMBERS  =======================================

    XbrlParserConfig config_;
    XC::ConceptLabels labels_;

}; // -----  end of class XbrlParser  -----

#endif   // ----- #ifndef _XBRLPARSER_INC_  -----
