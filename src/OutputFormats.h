// =====================================================================================
//
//       Filename:  OutputFormats.h
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

#ifndef _OUTPUTFORMATS_INC_
#define _OUTPUTFORMATS_INC_

#include <string>
#include <vector>

#include <json/json.h>

#include "BatchOrchestrator.h"
#include "DocumentStore.h"
#include "FinancialRatioCalculator.h"
#include "SecEdgarCrawler.h"
#include "XbrlParser.h"

Json::Value ConceptToJSON(const TaxonomyConcept& concept_value);
Json::Value StatementToJSON(const ParsedStatement& statement);
Json::Value ParseResultToJSON(const XbrlParseResult& parse_result);
Json::Value ValidationReportToJSON(const ValidationReport& report);
Json::Value RatiosToJSON(const std::vector<CalculatedRatio>& ratios);
Json::Value CrawlResultToJSON(const CrawlResult& result);
Json::Value BatchResultsToJSON(const BatchResults& results);
Json::Value StorageStatsToJSON(const StorageStats& stats);

std::string WriteJSON(const Json::Value& value);

// id,company_id,filing_type,period_end_date,fiscal_year,fiscal_quarter
// fiscal_quarter is 0 when there is none.

std::string StatementsToCSV(const std::vector<ParsedStatement>& statements);

#endif   // ----- #ifndef _OUTPUTFORMATS_INC_  -----
