// =====================================================================================
//
//       Filename:  BatchOrchestrator.h
//
//    Description:  crawl many companies with a bounded number in flight
//
//        Version:  1.0
//        Created:  10/09/2026 08:45:52 AM
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

#ifndef _BATCHORCHESTRATOR_INC_
#define _BATCHORCHESTRATOR_INC_

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "SecEdgarCrawler.h"

using CrawlFunction = std::function<CrawlResult(const std::string& cik)>;

// one entry per requested company, keyed by CIK.

using BatchResults = std::map<std::string, CrawlResult>;

struct BatchSummary
{
    std::size_t companies_{0};
    std::size_t successful_companies_{0};
    std::size_t failed_companies_{0};
    std::size_t total_filings_found_{0};
    std::size_t filings_downloaded_{0};
    std::size_t filings_failed_{0};
    std::uint64_t total_bytes_downloaded_{0};
};

BatchSummary SummarizeBatch(const BatchResults& results);

void PrintBatchSummary(const BatchResults& results, std::ostream& output);

// used when a company's crawl threw instead of returning a result
// or was never started.

CrawlResult MakeFailedCrawlResult(const std::string& cik, const std::string& error);

// =====================================================================================
//        Class:  BatchOrchestrator
//  Description:  at most max_concurrent companies are crawled at once. As each
//                one finishes the next one is admitted. No company's failure
//                affects any other.
// =====================================================================================
class BatchOrchestrator
{
public:
    // ====================  LIFECYCLE     =======================================

    // the crawler must outlive the orchestrator.

    BatchOrchestrator(const SecEdgarCrawler& crawler, std::size_t max_concurrent);
    BatchOrchestrator(CrawlFunction crawl_function, std::size_t max_concurrent);

    BatchOrchestrator() = delete;
    BatchOrchestrator(const BatchOrchestrator& rhs) = delete;
    BatchOrchestrator(BatchOrchestrator&& rhs) = delete;

    ~BatchOrchestrator() = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] std::size_t GetMaxConcurrent() const { return max_concurrent_; }

    // ====================  MUTATORS      =======================================

    // checked before each company is admitted. When it returns true no more
    // companies are started. Those in flight are allowed to finish.

    void SetStopCondition(std::function<bool()> stop_condition) { stop_condition_ = std::move(stop_condition); }

    BatchResults CrawlCompanies(const std::vector<std::string>& ciks) const;

    // ====================  OPERATORS     =======================================

    BatchOrchestrator& operator=(const BatchOrchestrator& rhs) = delete;
    BatchOrchestrator& operator=(BatchOrchestrator&& rhs) = delete;

private:
    // ====================  METHODS       =======================================

    [[nodiscard]] bool StopRequested() const { return stop_condition_ && stop_condition_(); }

    // ====================  DATA MEMBERS  =======================================

    CrawlFunction crawl_function_;
    std::function<bool()> stop_condition_;
    const std::size_t max_concurrent_;

}; // -----  end of class BatchOrchestrator  -----

#endif   // ----- #ifndef _BATCHORCHESTRATOR_INC_  -----
