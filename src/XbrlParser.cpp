// =====================================================================================
//
//       Filename:  XbrlParser.cpp
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

#include "XbrlParser.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <set>
#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/for_each.hpp>

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

using namespace std::string_literals;

namespace
{

constexpr XC::sv kInstanceNS{"http://www.xbrl.org/2003/instance"};
constexpr XC::sv kInlineNS{"http://www.xbrl.org/2013/inlineXBRL"};

// statement tags which are never facts.

const std::set<std::string, std::less<>> kStructuralElements{
    "xbrl", "context", "entity", "identifier", "period", "startDate", "endDate", "instant", "unit", "measure",
    "linkbaseRef", "schemaRef", "roleRef", "arcroleRef", "footnoteLink"};

const boost::regex regex_embedded_xbrl{R"***(<((?:xbrli:)?xbrl)[\s>].*?</\1>)***"};

// for dates in inline documents which are displayed for people.

constexpr std::array<const char*, 4> kDisplayDateFormats{"%B %d, %Y", "%b. %d, %Y", "%b %d, %Y", "%d %B %Y"};

// =====================================================================================
//  everything we pull out of one document, before choosing primary values.
// =====================================================================================

struct DocumentModel
{
    DocumentType document_type_{DocumentType::e_XBRL};
    std::string root_name_;
    std::map<std::string, std::string> namespaces_;
    std::vector<XbrlContext> contexts_;
    std::vector<std::string> context_errors_;
    std::vector<XbrlUnit> units_;
    std::vector<XbrlFact> facts_;
    std::set<std::string> skipped_concepts_;
    std::set<std::string> text_block_concepts_;
    std::set<std::string> unreadable_values_;
};

XC::sv LocalName(XC::sv name)
{
    if (auto pos = name.find(':'); pos != XC::sv::npos)
    {
        name.remove_prefix(pos + 1);
    }
    return name;
}

XC::sv Prefix(XC::sv name)
{
    if (auto pos = name.find(':'); pos != XC::sv::npos)
    {
        return name.substr(0, pos);
    }
    return {};
}

std::string CanonicalPrefix(XC::sv namespace_uri)
{
    if (namespace_uri.find("fasb.org/us-gaap") != XC::sv::npos)
    {
        return "us-gaap";
    }
    if (namespace_uri.find("xbrl.ifrs.org") != XC::sv::npos)
    {
        return "ifrs-full";
    }
    if (namespace_uri.find("fasb.org/srt") != XC::sv::npos)
    {
        return "srt";
    }
    if (namespace_uri.find("xbrl.sec.gov/dei") != XC::sv::npos)
    {
        return "dei";
    }
    return {};
}

pugi::xml_node ChildByLocalName(const pugi::xml_node& node, XC::sv local_name)
{
    for (auto child : node.children())
    {
        if (child.type() == pugi::node_element && LocalName(child.name()) == local_name)
        {
            return child;
        }
    }
    return {};
}

std::string AllText(const pugi::xml_node& node)
{
    std::string result;
    for (auto child : node.children())
    {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata)
        {
            result += child.value();
        }
        else if (child.type() == pugi::node_element)
        {
            result += AllText(child);
        }
    }
    return result;
}

bool IsNil(const pugi::xml_node& node)
{
    for (auto attr : node.attributes())
    {
        if (LocalName(attr.name()) == "nil" && XC::sv{attr.value()} == "true")
        {
            return true;
        }
    }
    return false;
}

std::optional<date::year_month_day> ParseXBRLDate(XC::sv text)
{
    std::string trimmed = boost::algorithm::trim_copy(std::string{text});

    // dateTime values show up now and then. the date part is all we use.

    if (trimmed.size() > 10 && trimmed[10] == 'T')
    {
        trimmed.resize(10);
    }
    return TryParseSECDate(trimmed);
}

std::optional<date::year_month_day> ParseDisplayDate(XC::sv text)
{
    if (auto result = ParseXBRLDate(text); result)
    {
        return result;
    }
    std::string trimmed = boost::algorithm::trim_copy(std::string{text});
    for (const auto* fmt : kDisplayDateFormats)
    {
        std::istringstream in{trimmed};
        date::sys_days tp;
        in >> date::parse(fmt, tp);
        if (! in.fail())
        {
            date::year_month_day result = tp;
            if (result.ok())
            {
                return result;
            }
        }
    }
    return std::nullopt;
}

bool LooksLikeTextBlock(XC::sv local_name, XC::sv value)
{
    return local_name.ends_with("TextBlock") || value.find("<table") != XC::sv::npos ||
           value.find("<div") != XC::sv::npos || value.find("<p ") != XC::sv::npos;
}

std::string DescribePeriod(const XbrlContext& context)
{
    if (context.period_type_ == PeriodType::e_Instant)
    {
        return catenate("instant ", context.end_date_);
    }
    return catenate(context.start_date_.value_or(date::year_month_day{}), " to ", context.end_date_);
}

XbrlContext ParseContext(const pugi::xml_node& context_node, std::vector<std::string>& errors)
{
    XbrlContext context;
    context.id_ = context_node.attribute("id").value();

    if (auto entity = ChildByLocalName(context_node, "entity"); entity)
    {
        if (auto identifier = ChildByLocalName(entity, "identifier"); identifier)
        {
            context.entity_identifier_ = boost::algorithm::trim_copy(std::string{identifier.child_value()});
            context.entity_scheme_ = identifier.attribute("scheme").value();
        }
        context.has_dimensions_ = static_cast<bool>(ChildByLocalName(entity, "segment"));
    }
    if (ChildByLocalName(context_node, "scenario"))
    {
        context.has_dimensions_ = true;
    }

    auto period = ChildByLocalName(context_node, "period");
    if (! period)
    {
        errors.push_back(catenate("Context '", context.id_, "' has no period."));
        return context;
    }

    if (auto instant = ChildByLocalName(period, "instant"); instant)
    {
        context.period_type_ = PeriodType::e_Instant;
        auto instant_date = ParseXBRLDate(instant.child_value());
        if (! instant_date)
        {
            errors.push_back(catenate("Context '", context.id_, "' has invalid instant: '", instant.child_value(), "'."));
            return context;
        }
        context.end_date_ = instant_date.value();
        return context;
    }

    context.period_type_ = PeriodType::e_Duration;
    if (ChildByLocalName(period, "forever"))
    {
        errors.push_back(catenate("Context '", context.id_, "' has a 'forever' period which is not supported."));
        return context;
    }

    auto start_date = ParseXBRLDate(ChildByLocalName(period, "startDate").child_value());
    auto end_date = ParseXBRLDate(ChildByLocalName(period, "endDate").child_value());
    if (! start_date || ! end_date)
    {
        errors.push_back(catenate("Context '", context.id_, "' has missing or invalid start/end dates."));
        return context;
    }
    context.start_date_ = start_date;
    context.end_date_ = end_date.value();
    return context;
}

XbrlUnit ParseUnit(const pugi::xml_node& unit_node)
{
    XbrlUnit unit;
    unit.id_ = unit_node.attribute("id").value();
    if (auto measure = ChildByLocalName(unit_node, "measure"); measure)
    {
        unit.measure_ = boost::algorithm::trim_copy(std::string{measure.child_value()});
    }
    else if (auto divide = ChildByLocalName(unit_node, "divide"); divide)
    {
        auto numerator = ChildByLocalName(ChildByLocalName(divide, "unitNumerator"), "measure");
        auto denominator = ChildByLocalName(ChildByLocalName(divide, "unitDenominator"), "measure");
        unit.measure_ = catenate(boost::algorithm::trim_copy(std::string{numerator.child_value()}), '/',
                                 boost::algorithm::trim_copy(std::string{denominator.child_value()}));
    }
    return unit;
}

// =====================================================================================
//  walks the whole tree once collecting contexts, units and facts.
// =====================================================================================

class ModelBuilder
{
public:
    explicit ModelBuilder(DocumentModel& model) : model_{model} {}

    void Visit(const pugi::xml_node& node)
    {
        for (auto attr : node.attributes())
        {
            XC::sv attr_name{attr.name()};
            if (attr_name == "xmlns")
            {
                model_.namespaces_.try_emplace("", attr.value());
            }
            else if (attr_name.starts_with("xmlns:"))
            {
                model_.namespaces_.try_emplace(std::string{attr_name.substr(6)}, attr.value());
            }
        }

        XC::sv name{node.name()};
        XC::sv local_name = LocalName(name);

        if (local_name == "context" && node.attribute("id"))
        {
            model_.contexts_.push_back(ParseContext(node, model_.context_errors_));
            return;
        }
        if (local_name == "unit" && node.attribute("id"))
        {
            model_.units_.push_back(ParseUnit(node));
            return;
        }

        if (model_.document_type_ == DocumentType::e_InlineXBRL && IsInlinePrefix(Prefix(name)))
        {
            if (local_name == "nonFraction")
            {
                AddInlineNumericFact(node);
                return;
            }
            if (local_name == "nonNumeric")
            {
                AddInlineTextFact(node);
            }
        }
        else if (model_.document_type_ != DocumentType::e_InlineXBRL && node.attribute("contextRef") &&
                 ! kStructuralElements.contains(local_name))
        {
            AddInstanceFact(node);
            return;
        }

        for (auto child : node.children())
        {
            if (child.type() == pugi::node_element)
            {
                Visit(child);
            }
        }
    }

private:
    bool IsInlinePrefix(XC::sv prefix) const
    {
        auto pos = model_.namespaces_.find(std::string{prefix});
        if (pos != model_.namespaces_.end())
        {
            return XC::sv{pos->second}.find("inlineXBRL") != XC::sv::npos;
        }
        return prefix == "ix";
    }

    // returns empty when the concept is not from a taxonomy we recognize.

    std::string CanonicalConceptName(XC::sv concept_name) const
    {
        auto prefix = Prefix(concept_name);
        std::string canonical;
        if (auto pos = model_.namespaces_.find(std::string{prefix}); pos != model_.namespaces_.end())
        {
            canonical = CanonicalPrefix(pos->second);
        }
        else if (prefix == "us-gaap" || prefix == "dei" || prefix == "ifrs-full" || prefix == "srt")
        {
            canonical = prefix;
        }
        if (canonical.empty())
        {
            return {};
        }
        return catenate(canonical, ':', LocalName(concept_name));
    }

    bool AcceptConcept(XC::sv concept_name, std::string& canonical)
    {
        canonical = CanonicalConceptName(concept_name);
        if (canonical.empty())
        {
            model_.skipped_concepts_.emplace(concept_name);
            return false;
        }
        return true;
    }

    void AddInstanceFact(const pugi::xml_node& node)
    {
        std::string concept_name;
        if (! AcceptConcept(node.name(), concept_name))
        {
            return;
        }

        XbrlFact fact;
        fact.value_ = boost::algorithm::trim_copy(std::string{node.child_value()});
        if (! concept_name.starts_with("dei:") && LooksLikeTextBlock(LocalName(concept_name), fact.value_))
        {
            model_.text_block_concepts_.insert(concept_name);
            return;
        }
        fact.concept_ = std::move(concept_name);
        fact.context_ref_ = node.attribute("contextRef").value();
        fact.unit_ref_ = node.attribute("unitRef").value();
        fact.decimals_ = node.attribute("decimals").value();
        fact.precision_ = node.attribute("precision").value();
        fact.is_nil_ = IsNil(node);
        model_.facts_.push_back(std::move(fact));
    }

    void AddInlineNumericFact(const pugi::xml_node& node)
    {
        std::string concept_name;
        if (! AcceptConcept(node.attribute("name").value(), concept_name))
        {
            return;
        }

        XbrlFact fact;
        fact.concept_ = concept_name;
        fact.context_ref_ = node.attribute("contextRef").value();
        fact.unit_ref_ = node.attribute("unitRef").value();
        fact.decimals_ = node.attribute("decimals").value();
        fact.precision_ = node.attribute("precision").value();
        fact.is_nil_ = IsNil(node);
        if (! fact.is_nil_)
        {
            try
            {
                fact.value_ = NormalizeInlineNumber(AllText(node), node.attribute("format").value(),
                                                    node.attribute("scale").as_int(0),
                                                    XC::sv{node.attribute("sign").value()} == "-");
            }
            catch (const XBRLException& e)
            {
                model_.unreadable_values_.insert(catenate(concept_name, ": ", e.what()));
                return;
            }
        }
        model_.facts_.push_back(std::move(fact));
    }

    void AddInlineTextFact(const pugi::xml_node& node)
    {
        std::string concept_name;
        if (! AcceptConcept(node.attribute("name").value(), concept_name))
        {
            return;
        }
        XbrlFact fact;
        fact.value_ = boost::algorithm::trim_copy(AllText(node));
        if (! concept_name.starts_with("dei:") &&
            (LooksLikeTextBlock(LocalName(concept_name), fact.value_) || node.attribute("escape").as_bool(false)))
        {
            model_.text_block_concepts_.insert(concept_name);
            return;
        }
        fact.concept_ = std::move(concept_name);
        fact.context_ref_ = node.attribute("contextRef").value();
        fact.is_nil_ = IsNil(node);
        model_.facts_.push_back(std::move(fact));
    }

    DocumentModel& model_;
};

pugi::xml_parse_result LoadMarkup(XC::sv content, DocumentType doc_type, pugi::xml_document& doc)
{
    auto result = doc.load_buffer(content.data(), content.size(), pugi::parse_default | pugi::parse_wnorm_attribute);
    if (result || doc_type != DocumentType::e_HTMLEmbedded)
    {
        return result;
    }

    // plain HTML is often not well formed. Go after the XBRL block itself.

    boost::cmatch embedded;
    if (boost::regex_search(content.data(), content.data() + content.size(), embedded, regex_embedded_xbrl))
    {
        doc.reset();
        return doc.load_buffer(embedded[0].first, embedded.length(0),
                               pugi::parse_default | pugi::parse_wnorm_attribute);
    }
    return result;
}

DocumentModel BuildModel(const pugi::xml_document& doc, DocumentType doc_type)
{
    DocumentModel model;
    model.document_type_ = doc_type;

    auto root = doc.document_element();
    model.root_name_ = root.name();

    // inline XBRL that we found inside a plain HTML wrapper is really an instance document.

    if (doc_type == DocumentType::e_HTMLEmbedded && LocalName(model.root_name_) == "xbrl")
    {
        model.document_type_ = DocumentType::e_XBRL;
    }

    ModelBuilder builder{model};
    builder.Visit(root);
    return model;
}

bool HasNamespace(const DocumentModel& model, XC::sv uri)
{
    return ranges::any_of(model.namespaces_, [uri](const auto& ns) { return XC::sv{ns.second} == uri; });
}

bool HasRecognizedTaxonomy(const DocumentModel& model)
{
    return ranges::any_of(model.namespaces_, [](const auto& ns) {
        auto canonical = CanonicalPrefix(ns.second);
        return ! canonical.empty() && canonical != "dei";
    });
}

// lower is better.

struct ContextRank
{
    int rank_{3};
    long distance_{0};

    bool operator<(const ContextRank& rhs) const
    {
        return rank_ < rhs.rank_ || (rank_ == rhs.rank_ && distance_ < rhs.distance_);
    }
};

long DurationDays(const XbrlContext& context)
{
    if (! context.start_date_)
    {
        return 0;
    }
    return (date::sys_days{context.end_date_} - date::sys_days{context.start_date_.value()}).count();
}

ContextRank RankContext(const XbrlContext& context, const XbrlContext* document_context,
                        date::year_month_day period_end)
{
    if (context.has_dimensions_ || context.end_date_ != period_end)
    {
        return {3, 0};
    }
    if (document_context != nullptr && context.id_ == document_context->id_)
    {
        return {0, 0};
    }
    if (context.period_type_ == PeriodType::e_Instant)
    {
        return {1, 0};
    }
    if (document_context != nullptr && document_context->period_type_ == PeriodType::e_Duration)
    {
        if (context.start_date_ == document_context->start_date_)
        {
            return {0, 0};
        }
        return {2, std::abs(DurationDays(context) - DurationDays(*document_context))};
    }
    return {2, 0};
}

std::string MakeStatementID()
{
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string TrimDecimalText(std::string int_part, std::string frac_part)
{
    int_part.erase(0, std::min(int_part.find_first_not_of('0'), int_part.size()));
    if (int_part.empty())
    {
        int_part = "0";
    }
    while (! frac_part.empty() && frac_part.back() == '0')
    {
        frac_part.pop_back();
    }
    return frac_part.empty() ? int_part : catenate(int_part, '.', frac_part);
}

}   // namespace

std::string DocumentTypeName(DocumentType doc_type)
{
    switch (doc_type)
    {
        case DocumentType::e_XBRL:
            return "xbrl";
        case DocumentType::e_InlineXBRL:
            return "ixbrl";
        case DocumentType::e_HTMLEmbedded:
            return "html_embedded";
    }
    return "unknown";
}		/* -----  end of function DocumentTypeName  ----- */

std::string PeriodTypeName(PeriodType period_type)
{
    return period_type == PeriodType::e_Instant ? "instant" : "duration";
}		/* -----  end of function PeriodTypeName  ----- */

std::string StatementTypeName(StatementType statement_type)
{
    switch (statement_type)
    {
        case StatementType::e_BalanceSheet:
            return "balance_sheet";
        case StatementType::e_IncomeStatement:
            return "income_statement";
        case StatementType::e_CashFlowStatement:
            return "cash_flow_statement";
        case StatementType::e_Other:
            return "other";
    }
    return "other";
}		/* -----  end of function StatementTypeName  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  DetectDocumentType
 *  Description:  inline XBRL first since those documents also mention xbrl.
 * =====================================================================================
 */
DocumentType DetectDocumentType(XC::sv content)
{
    if (content.find("<ix:") != XC::sv::npos || content.find("xmlns:ix=") != XC::sv::npos)
    {
        return DocumentType::e_InlineXBRL;
    }
    if (content.find("<xbrl") != XC::sv::npos || content.find("<xbrli:xbrl") != XC::sv::npos)
    {
        return DocumentType::e_XBRL;
    }
    if (boost::algorithm::icontains(content, "<html") && boost::algorithm::icontains(content, "xbrl"))
    {
        return DocumentType::e_HTMLEmbedded;
    }
    return DocumentType::e_XBRL;
}		/* -----  end of function DetectDocumentType  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  NormalizeInlineNumber
 *  Description:  "1,234.5" with scale 6 -> "1234500000". Done on the text so
 *                nothing is lost to floating point.
 * =====================================================================================
 */
std::string NormalizeInlineNumber(XC::sv displayed, XC::sv format, int scale, bool negative)
{
    // filings use -9 through 12 or so. Anything past this is garbage.

    constexpr int max_scale{30};
    if (scale < -max_scale || scale > max_scale)
    {
        throw XBRLException(catenate("Scale: ", scale, " out of range for: '", displayed, "'."));
    }

    std::string text = boost::algorithm::trim_copy(std::string{displayed});

    if (format.find("zerodash") != XC::sv::npos || format.find("fixed-zero") != XC::sv::npos ||
        text == "-" || text == "—" || text == "–")
    {
        return "0";
    }

    const bool comma_decimal =
        format.find("numcommadecimal") != XC::sv::npos || format.find("num-comma-decimal") != XC::sv::npos;

    std::string int_part;
    std::string frac_part;
    bool in_fraction{false};
    for (char c : text)
    {
        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            (in_fraction ? frac_part : int_part) += c;
        }
        else if ((c == '.' && ! comma_decimal) || (c == ',' && comma_decimal))
        {
            if (in_fraction)
            {
                throw XBRLException(catenate("Too many decimal separators in: '", displayed, "'."));
            }
            in_fraction = true;
        }
    }
    if (int_part.empty() && frac_part.empty())
    {
        throw XBRLException(catenate("No digits in numeric value: '", displayed, "'."));
    }

    // shift the decimal point.

    if (scale > 0)
    {
        if (static_cast<int>(frac_part.size()) < scale)
        {
            frac_part.append(scale - frac_part.size(), '0');
        }
        int_part += frac_part.substr(0, scale);
        frac_part.erase(0, scale);
    }
    else if (scale < 0)
    {
        const auto shift = static_cast<std::size_t>(-scale);
        if (int_part.size() < shift)
        {
            int_part.insert(0, shift - int_part.size(), '0');
        }
        frac_part.insert(0, int_part.substr(int_part.size() - shift));
        int_part.erase(int_part.size() - shift);
    }

    auto result = TrimDecimalText(int_part, frac_part);
    if (negative && result != "0")
    {
        result.insert(0, 1, '-');
    }
    return result;
}		/* -----  end of function NormalizeInlineNumber  ----- */

std::string MapConceptToLabel(XC::sv concept_name)
{
    static const std::map<std::string, std::string, std::less<>> known_labels{
        {"Assets", "Total Assets"},
        {"Liabilities", "Total Liabilities"},
        {"StockholdersEquity", "Stockholders' Equity"},
        {"NetIncomeLoss", "Net Income"},
        {"Revenues", "Revenues"},
        {"GrossProfit", "Gross Profit"},
        {"OperatingIncomeLoss", "Operating Income"}};

    auto local_name = LocalName(concept_name);
    if (auto pos = known_labels.find(local_name); pos != known_labels.end())
    {
        return pos->second;
    }

    // split the CamelCase name into words.

    std::string label;
    for (std::size_t i = 0; i < local_name.size(); ++i)
    {
        char c = local_name[i];
        if (i > 0 && std::isupper(static_cast<unsigned char>(c)) &&
            ! std::isupper(static_cast<unsigned char>(local_name[i - 1])))
        {
            label += ' ';
        }
        label += c;
    }
    return label;
}		/* -----  end of function MapConceptToLabel  ----- */

StatementType ClassifyStatementType(XC::sv concept_name)
{
    auto name = LocalName(concept_name);
    auto has = [name](XC::sv part) { return name.find(part) != XC::sv::npos; };

    if (name.starts_with("NetCashProvidedBy") || name.starts_with("IncreaseDecreaseIn") ||
        name.starts_with("PaymentsTo") || name.starts_with("PaymentsFor") || name.starts_with("ProceedsFrom") ||
        has("PeriodIncreaseDecrease") || (has("Cash") && has("Activities")))
    {
        return StatementType::e_CashFlowStatement;
    }
    if (has("Assets") || has("Liabilities") || has("StockholdersEquity") || has("Inventory") ||
        has("Receivable") || has("Payable") || has("DeferredRevenue") || has("Debt") || has("Goodwill") ||
        has("RetainedEarnings") || has("PropertyPlantAndEquipment") || has("CashAndCashEquivalentsAtCarryingValue"))
    {
        return StatementType::e_BalanceSheet;
    }
    if (has("Revenue") || has("NetIncomeLoss") || has("Expense") || has("CostOf") || has("GrossProfit") ||
        has("OperatingIncomeLoss") || has("EarningsPerShare") || has("IncomeTax") || has("ProfitLoss"))
    {
        return StatementType::e_IncomeStatement;
    }
    return StatementType::e_Other;
}		/* -----  end of function ClassifyStatementType  ----- */

std::string ClassifySection(XC::sv concept_name)
{
    auto name = LocalName(concept_name);
    auto has = [name](XC::sv part) { return name.find(part) != XC::sv::npos; };

    if (has("NetIncomeLoss") || has("ProfitLoss"))
    {
        return "net_income";
    }
    if (has("Liabilities") || has("Payable") || has("Debt"))
    {
        return "liabilities";
    }
    if (has("Equity") || has("RetainedEarnings"))
    {
        return "equity";
    }
    if (has("Assets") || has("Receivable") || has("Inventory"))
    {
        return "assets";
    }
    if (has("Revenue"))
    {
        return "revenues";
    }
    if (has("Expense") || has("CostOf"))
    {
        return "expenses";
    }
    return "other";
}		/* -----  end of function ClassifySection  ----- */

std::string InferDataType(XC::sv concept_name)
{
    auto name = LocalName(concept_name);
    auto has = [name](XC::sv part) { return name.find(part) != XC::sv::npos; };

    if (has("PerShare"))
    {
        return "perShareItemType";
    }
    if (has("Shares") || has("Units"))
    {
        return "sharesItemType";
    }
    if (has("Date"))
    {
        return "dateItemType";
    }
    if (has("Assets") || has("Liabilities") || has("Equity") || has("Revenue") || has("Income") ||
        has("Expense") || has("Cash") || has("Debt") || has("Profit") || has("Payable") || has("Receivable"))
    {
        return "monetaryItemType";
    }
    return "stringItemType";
}		/* -----  end of function InferDataType  ----- */

std::optional<std::string> InferBalanceType(XC::sv concept_name)
{
    auto name = LocalName(concept_name);
    auto has = [name](XC::sv part) { return name.find(part) != XC::sv::npos; };

    if (has("Expense") || has("CostOf"))
    {
        return "debit";
    }
    if (has("Liabilities") || has("Equity") || has("Revenue") || has("NetIncomeLoss"))
    {
        return "credit";
    }
    if (has("Assets"))
    {
        return "debit";
    }
    return std::nullopt;
}		/* -----  end of function InferBalanceType  ----- */

std::optional<double> TaxonomyConcept::NumericValue() const
{
    if (value_.empty())
    {
        return std::nullopt;
    }
    double result{0.0};
    const char* first = value_.data();
    const char* last = value_.data() + value_.size();
    if (*first == '+')
    {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return result;
}		/* -----  end of method TaxonomyConcept::NumericValue  ----- */

std::optional<TaxonomyConcept> ParsedStatement::FindConcept(XC::sv concept_name) const
{
    if (auto pos = concepts_.find(concept_name); pos != concepts_.end())
    {
        return pos->second;
    }
    return std::nullopt;
}		/* -----  end of method ParsedStatement::FindConcept  ----- */

// The purpose of this routine is to translate from the taxonomy concept name
// to a 'user friendly' name.
//
// We have to go to the _lab.xml file and follow various links in its XML:
//
//  - find the link:loc element with an xlink:href attribute naming the concept.
//  - use its xlink:label attribute to find the matching link:labelArc element.
//  - retrieve the arc's xlink:to attribute.
//  - find the link:label element with a matching xlink:label attribute.
//  - retrieve the element value.

XC::ConceptLabels ExtractFieldLabels(XC::LabelContent label_document)
{
    pugi::xml_document labels_xml;
    auto load_result = labels_xml.load_buffer(label_document.get().data(), label_document.get().size(),
                                              pugi::parse_default | pugi::parse_wnorm_attribute);
    if (! load_result)
    {
        throw XBRLException{catenate("Error description: ", load_result.description(),
                                     "\nError offset: ", load_result.offset, '\n')};
    }

    std::vector<std::pair<XC::sv, XC::sv>> labels;
    std::map<XC::sv, XC::sv> locs;
    std::map<XC::sv, XC::sv> arcs;

    // some files have separate labelLink sections for each link element set !!

    for (auto links : labels_xml.document_element().children())
    {
        if (LocalName(links.name()) != "labelLink")
        {
            continue;
        }
        for (auto node : links.children())
        {
            auto local_name = LocalName(node.name());
            if (local_name == "label")
            {
                XC::sv role{node.attribute("xlink:role").value()};
                if (role.ends_with("/label"))
                {
                    labels.emplace_back(node.attribute("xlink:label").value(), node.child_value());
                }
            }
            else if (local_name == "loc")
            {
                XC::sv href{node.attribute("xlink:href").value()};
                auto pos = href.find('#');
                if (pos == XC::sv::npos)
                {
                    throw XBRLException(catenate("Can't find href label start in: ", href));
                }
                href.remove_prefix(pos + 1);
                locs[href] = node.attribute("xlink:label").value();
            }
            else if (local_name == "labelArc")
            {
                if (XC::sv{node.attribute("use").value()} == "prohibited")
                {
                    continue;
                }
                arcs[node.attribute("xlink:from").value()] = node.attribute("xlink:to").value();
            }
        }
    }

    XC::ConceptLabels result;

    for (auto [href, label] : locs)
    {
        auto link_to = arcs.find(label);
        if (link_to == arcs.end())
        {
            // stand-alone link
            continue;
        }
        auto value = ranges::find_if(labels, [&link_to](const auto& e) { return e.first == link_to->second; });
        if (value == labels.end())
        {
            spdlog::debug(catenate("missing label: ", label));
            continue;
        }

        // href fragments look like: us-gaap_AssetsCurrent

        std::string concept_name{href};
        if (auto underscore = concept_name.find('_'); underscore != std::string::npos)
        {
            concept_name[underscore] = ':';
        }
        result.emplace(std::move(concept_name), boost::algorithm::trim_copy(std::string{value->second}));
    }
    return result;
}		/* -----  end of function ExtractFieldLabels  ----- */

//--------------------------------------------------------------------------------------
//       Class:  XbrlParser
//      Method:  XbrlParser
// Description:  constructor
//--------------------------------------------------------------------------------------
XbrlParser::XbrlParser(const XbrlParserConfig& config)
    : config_{config}
{
}  // -----  end of method XbrlParser::XbrlParser  (constructor)  -----

std::string XbrlParser::LabelFor(XC::sv concept_name) const
{
    if (auto pos = labels_.find(concept_name); pos != labels_.end())
    {
        return pos->second;
    }
    return MapConceptToLabel(concept_name);
}  // -----  end of method XbrlParser::LabelFor  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  XbrlParser
 *      Method:  XbrlParser :: Validate
 * Description:  structural checks only. Everything wrong goes in the report.
 *--------------------------------------------------------------------------------------
 */
ValidationReport XbrlParser::Validate(XC::DocumentContent document) const
{
    ValidationReport report;

    auto finish = [&report]() {
        report.is_valid_ = report.errors_.empty();
        return report;
    };

    try
    {
        const auto content = document.get();
        if (content.empty())
        {
            report.errors_.emplace_back("Document is empty.");
            return finish();
        }
        if (content.size() > config_.max_file_size_)
        {
            report.errors_.push_back(catenate("Document size: ", FormatFileSize(content.size()),
                                              " exceeds maximum: ", FormatFileSize(config_.max_file_size_), '.'));
            return finish();
        }

        const auto doc_type = DetectDocumentType(content);
        pugi::xml_document doc;
        if (auto load_result = LoadMarkup(content, doc_type, doc); ! load_result)
        {
            report.errors_.push_back(catenate("Malformed markup: ", load_result.description(), " at offset: ",
                                              load_result.offset, '.'));
            return finish();
        }

        auto model = BuildModel(doc, doc_type);
        auto root_local_name = LocalName(model.root_name_);

        if (model.document_type_ == DocumentType::e_InlineXBRL)
        {
            if (root_local_name != "html")
            {
                report.errors_.push_back(
                    catenate("Root element: '", model.root_name_, "' is not an inline XBRL 'html' element."));
            }
            if (! HasNamespace(model, kInlineNS))
            {
                report.errors_.push_back(catenate("Missing inline XBRL namespace: ", kInlineNS));
            }
        }
        else if (root_local_name != "xbrl" &&
                 ! (model.document_type_ == DocumentType::e_HTMLEmbedded && root_local_name == "html"))
        {
            report.errors_.push_back(
                catenate("Root element: '", model.root_name_, "' is not an XBRL instance 'xbrl' element."));
        }

        if (! HasNamespace(model, kInstanceNS))
        {
            report.errors_.push_back(catenate("Missing XBRL instance namespace: ", kInstanceNS));
        }
        if (! HasRecognizedTaxonomy(model))
        {
            report.errors_.emplace_back("No recognized financial taxonomy namespace (us-gaap, ifrs-full, srt).");
        }

        if (model.contexts_.empty())
        {
            report.errors_.emplace_back("No reporting period context found.");
        }
        ranges::for_each(model.context_errors_, [&report](const auto& e) { report.errors_.push_back(e); });

        // the rest are anomalies we can live with.

        std::set<std::string> context_ids;
        std::set<std::string> duplicate_contexts;
        for (const auto& context : model.contexts_)
        {
            if (! context_ids.insert(context.id_).second)
            {
                duplicate_contexts.insert(context.id_);
            }
        }
        for (const auto& id : duplicate_contexts)
        {
            report.warnings_.push_back(catenate("Duplicate context id: '", id, "'."));
        }

        std::set<std::string> unit_ids;
        ranges::for_each(model.units_, [&unit_ids](const auto& u) { unit_ids.insert(u.id_); });

        std::set<std::string> missing_contexts;
        std::set<std::string> missing_units;
        for (const auto& fact : model.facts_)
        {
            if (! context_ids.contains(fact.context_ref_))
            {
                missing_contexts.insert(fact.context_ref_);
            }
            if (! fact.unit_ref_.empty() && ! unit_ids.contains(fact.unit_ref_))
            {
                missing_units.insert(fact.unit_ref_);
            }
        }
        for (const auto& id : missing_contexts)
        {
            report.warnings_.push_back(catenate("Facts refer to undefined context: '", id, "'."));
        }
        for (const auto& id : missing_units)
        {
            report.warnings_.push_back(catenate("Facts refer to undefined unit: '", id, "'."));
        }

        if (ranges::count_if(model.facts_, [](const auto& f) { return f.concept_ == "dei:DocumentPeriodEndDate"; }) == 0)
        {
            report.warnings_.emplace_back("Missing dei:DocumentPeriodEndDate.");
        }
        if (model.facts_.empty())
        {
            report.warnings_.emplace_back("No facts found.");
        }
    }
    catch (const std::exception& e)
    {
        report.errors_.push_back(catenate("Validation failed: ", e.what()));
    }

    return finish();
}  // -----  end of method XbrlParser::Validate  -----

std::vector<ParsedStatement> XbrlParser::Parse(XC::DocumentContent document, const FilingDescriptor& filing) const
{
    return ParseDocument(document, filing).statements_;
}  // -----  end of method XbrlParser::Parse  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  XbrlParser
 *      Method:  XbrlParser :: ParseDocument
 * Description:  one statement per document holding the values for the
 *               filing's primary reporting period.
 *--------------------------------------------------------------------------------------
 */
XbrlParseResult XbrlParser::ParseDocument(XC::DocumentContent document, const FilingDescriptor& filing) const
{
    const auto start_time = std::chrono::steady_clock::now();
    const auto content = document.get();

    if (content.size() > config_.max_file_size_)
    {
        throw MaxFileSizeException(catenate("Document size: ", FormatFileSize(content.size()),
                                            " exceeds maximum: ", FormatFileSize(config_.max_file_size_), '.'));
    }

    XbrlParseResult result;
    result.metadata_.file_size_ = content.size();

    const auto doc_type = DetectDocumentType(content);
    pugi::xml_document doc;
    if (auto load_result = LoadMarkup(content, doc_type, doc); ! load_result)
    {
        throw XBRLException{catenate("Error description: ", load_result.description(),
                                     "\nError offset: ", load_result.offset, '\n')};
    }

    auto model = BuildModel(doc, doc_type);
    result.metadata_.document_type_ = model.document_type_;
    result.metadata_.fact_count_ = model.facts_.size();

    auto& warnings = result.metadata_.warnings_;
    ranges::for_each(model.context_errors_, [&warnings](const auto& e) { warnings.push_back(e); });
    for (const auto& concept_name : model.skipped_concepts_)
    {
        warnings.push_back(catenate("Skipped unrecognized concept: ", concept_name));
    }
    for (const auto& concept_name : model.text_block_concepts_)
    {
        warnings.push_back(catenate("Skipped text block concept: ", concept_name));
    }
    for (const auto& problem : model.unreadable_values_)
    {
        warnings.push_back(catenate("Skipped unreadable value: ", problem));
    }

    std::map<std::string, const XbrlContext*> contexts;
    for (const auto& context : model.contexts_)
    {
        contexts.try_emplace(context.id_, &context);
    }
    std::map<std::string, const XbrlUnit*> units;
    for (const auto& unit : model.units_)
    {
        units.try_emplace(unit.id_, &unit);
    }

    // filing level data from the dei facts.

    std::map<std::string, const XbrlFact*, std::less<>> dei;
    for (const auto& fact : model.facts_)
    {
        if (fact.concept_.starts_with("dei:"))
        {
            dei.try_emplace(fact.concept_.substr(4), &fact);
        }
    }
    auto dei_value = [&dei](XC::sv name) -> std::string {
        auto pos = dei.find(name);
        return pos == dei.end() ? std::string{} : pos->second->value_;
    };

    const XbrlContext* document_context = nullptr;
    for (const auto* name : {"DocumentPeriodEndDate", "DocumentType"})
    {
        if (auto pos = dei.find(name); pos != dei.end())
        {
            if (auto ctx = contexts.find(pos->second->context_ref_); ctx != contexts.end())
            {
                document_context = ctx->second;
                break;
            }
        }
    }

    std::optional<date::year_month_day> period_end = ParseDisplayDate(dei_value("DocumentPeriodEndDate"));
    if (! period_end && document_context != nullptr && document_context->end_date_.ok())
    {
        period_end = document_context->end_date_;
    }
    if (! period_end)
    {
        warnings.emplace_back("Missing dei:DocumentPeriodEndDate. Using latest context end date.");
        for (const auto& context : model.contexts_)
        {
            if (! context.has_dimensions_ && context.end_date_.ok() &&
                (! period_end || context.end_date_ > period_end.value()))
            {
                period_end = context.end_date_;
            }
        }
    }
    if (! period_end)
    {
        warnings.emplace_back("No usable reporting period found. No statement produced.");
        result.contexts_ = std::move(model.contexts_);
        result.units_ = std::move(model.units_);
        result.metadata_.processing_time_ = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    }

    ParsedStatement statement;
    statement.statement_id_ = MakeStatementID();
    statement.accession_number_ = filing.accession_number_;
    statement.company_id_ = ! filing.company_cik_.empty()              ? filing.company_cik_
                            : ! dei_value("EntityCentralIndexKey").empty() ? dei_value("EntityCentralIndexKey")
                            : document_context != nullptr                  ? document_context->entity_identifier_
                                                                           : std::string{};
    statement.filing_type_ = ! filing.filing_type_.empty() ? filing.filing_type_ : dei_value("DocumentType");
    statement.trading_symbol_ = dei_value("TradingSymbol");
    statement.shares_outstanding_ = dei_value("EntityCommonStockSharesOutstanding");
    statement.period_end_date_ = period_end.value();

    const auto fiscal_year_focus = dei_value("DocumentFiscalYearFocus");
    int fiscal_year{0};
    auto [_, ec] = std::from_chars(fiscal_year_focus.data(), fiscal_year_focus.data() + fiscal_year_focus.size(),
                                     fiscal_year);
    statement.fiscal_year_ = ec == std::errc{} && IsValidFiscalYear(fiscal_year)
                                 ? fiscal_year
                                 : static_cast<int>(period_end.value().year());

    const auto fiscal_period_focus = dei_value("DocumentFiscalPeriodFocus");
    if (fiscal_period_focus.size() == 2 && fiscal_period_focus[0] == 'Q' &&
        IsValidFiscalQuarter(fiscal_period_focus[1] - '0'))
    {
        statement.fiscal_quarter_ = fiscal_period_focus[1] - '0';
    }
    else if (fiscal_period_focus.empty() && ! statement.filing_type_.starts_with("10-K") &&
             ! statement.filing_type_.starts_with("20-F"))
    {
        statement.fiscal_quarter_ = FiscalQuarterFromDate(period_end.value());
    }

    // now, choose a value for each concept. Values from the primary reporting
    // context win, everything else is kept as an alternate.

    std::map<std::string, std::vector<std::pair<ContextRank, TaxonomyConcept>>> candidates;
    std::set<std::string> undefined_contexts;

    for (const auto& fact : model.facts_)
    {
        if (fact.concept_.starts_with("dei:"))
        {
            continue;
        }
        if (fact.is_nil_)
        {
            continue;
        }
        auto ctx = contexts.find(fact.context_ref_);
        if (ctx == contexts.end())
        {
            undefined_contexts.insert(fact.context_ref_);
            continue;
        }
        const auto& context = *ctx->second;
        if (! context.end_date_.ok())
        {
            continue;
        }

        TaxonomyConcept concept_value;
        concept_value.name_ = fact.concept_;
        concept_value.label_ = LabelFor(fact.concept_);
        concept_value.value_ = fact.value_;
        if (auto unit = units.find(fact.unit_ref_); unit != units.end())
        {
            concept_value.unit_ = unit->second->measure_;
        }
        else
        {
            concept_value.unit_ = fact.unit_ref_;
        }
        concept_value.decimals_ = fact.decimals_;
        concept_value.context_id_ = context.id_;
        concept_value.period_type_ = context.period_type_;
        concept_value.period_start_ = context.start_date_;
        concept_value.period_end_ = context.end_date_;
        concept_value.statement_type_ = ClassifyStatementType(fact.concept_);
        concept_value.section_ = ClassifySection(fact.concept_);
        concept_value.balance_type_ = InferBalanceType(fact.concept_);

        if (concept_value.unit_.ends_with("/shares") || concept_value.unit_.ends_with("/xbrli:shares"))
        {
            concept_value.data_type_ = "perShareItemType";
        }
        else if (concept_value.unit_.ends_with("shares"))
        {
            concept_value.data_type_ = "sharesItemType";
        }
        else if (concept_value.unit_.starts_with("iso4217:"))
        {
            concept_value.data_type_ = "monetaryItemType";
        }
        else if (concept_value.unit_.ends_with("pure"))
        {
            concept_value.data_type_ = "pureItemType";
        }
        else
        {
            concept_value.data_type_ = InferDataType(fact.concept_);
        }

        auto& entries = candidates[fact.concept_];

        // inline documents often show the same fact more than once.

        if (ranges::any_of(entries, [&concept_value](const auto& e) {
                return e.second.context_id_ == concept_value.context_id_ && e.second.value_ == concept_value.value_;
            }))
        {
            continue;
        }
        entries.emplace_back(RankContext(context, document_context, period_end.value()), std::move(concept_value));
    }

    for (const auto& id : undefined_contexts)
    {
        warnings.push_back(catenate("Skipped facts with undefined context: '", id, "'."));
    }

    std::size_t alternate_count{0};
    std::size_t concepts_without_primary{0};

    for (auto& [concept_name, entries] : candidates)
    {
        // stable so ties go to the first one in document order.

        std::stable_sort(entries.begin(), entries.end(),
                         [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

        std::size_t first_alternate{0};
        if (entries.front().first.rank_ < 3)
        {
            statement.concepts_.emplace(concept_name, entries.front().second);
            first_alternate = 1;
        }
        else
        {
            ++concepts_without_primary;
        }

        for (std::size_t i = first_alternate; i < entries.size(); ++i)
        {
            auto& alternate = entries[i].second;
            const auto& context = *contexts.at(alternate.context_id_);
            if (first_alternate == 0)
            {
                alternate.annotation_ = catenate("no value for primary reporting period. context: ", context.id_,
                                                 " (", DescribePeriod(context), ')');
            }
            else if (entries[i].first.rank_ == entries.front().first.rank_ &&
                     alternate.context_id_ == entries.front().second.context_id_)
            {
                alternate.annotation_ = catenate("inconsistent duplicate of primary value in context: ", context.id_);
                warnings.push_back(catenate("Inconsistent duplicate values for: ", concept_name, " in context: ",
                                            context.id_));
            }
            else
            {
                alternate.annotation_ =
                    catenate(context.has_dimensions_ ? "dimensional" : "non-primary period", " context: ", context.id_,
                             " (", DescribePeriod(context), ')');
            }
            statement.alternates_.push_back(std::move(alternate));
            ++alternate_count;
        }
    }

    if (alternate_count > 0)
    {
        warnings.push_back(catenate("Kept: ", alternate_count, " alternate values from non-primary contexts."));
    }
    if (concepts_without_primary > 0)
    {
        warnings.push_back(catenate(concepts_without_primary,
                                    " concepts have no value for the primary reporting period."));
    }

    spdlog::debug(catenate("Parsed: ", DocumentTypeName(result.metadata_.document_type_), " document. Facts: ",
                           model.facts_.size(), ". Concepts: ", statement.concepts_.size(),
                           ". Alternates: ", statement.alternates_.size(), '.'));

    result.statements_.push_back(std::move(statement));
    result.contexts_ = std::move(model.contexts_);
    result.units_ = std::move(model.units_);
    result.metadata_.processing_time_ =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
    return result;
}  // -----  end of method XbrlParser::ParseDocument  -----
