// =====================================================================================
//
//       Filename:  BatchOrchestrator.cpp
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

#include "BatchOrchestrator.h"

#include <future>
#include <ostream>
#include <thread>

#include <fmt/format.h>

#include <range/v3/algorithm/find.hpp>

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

namespace
{

// code from "The C++ Programming Language" 4th Edition. p. 1243.
// with modifications.
//
// return index of ready future
// if no future is ready, wait for d before trying again

template <typename T>
int wait_for_any(std::vector<std::future<T>>& vf, int continue_here, std::chrono::steady_clock::duration d)
{
    while (true)
    {
        bool have_valid{false};
        for (int i = continue_here; i != static_cast<int>(vf.size()); ++i)
        {
            if (! vf[i].valid())
            {
                continue;
            }
            have_valid = true;
            switch (vf[i].wait_for(std::chrono::seconds{0}))
            {
                case std::future_status::ready:
                    return i;

                case std::future_status::timeout:
                    break;

                case std::future_status::deferred:
                    throw std::runtime_error("wait_for_any(): deferred future");
            }
        }
        if (! have_valid && continue_here == 0)
        {
            return -1;
        }
        continue_here = 0;

        std::this_thread::sleep_for(d);
    }
}

}   // namespace

CrawlResult MakeFailedCrawlResult(const std::string& cik, const std::string& error)
{
    auto result = CrawlResult::Begin("company_crawl", cik);
    result.errors_.push_back(error);
    result.MarkCompleted(false);
    return result;
}		/* -----  end of function MakeFailedCrawlResult  ----- */

//--------------------------------------------------------------------------------------
//       Class:  BatchOrchestrator
//      Method:  BatchOrchestrator
// Description:  constructor
//--------------------------------------------------------------------------------------
BatchOrchestrator::BatchOrchestrator(const SecEdgarCrawler& crawler, std::size_t max_concurrent)
    : BatchOrchestrator([&crawler](const std::string& cik) { return crawler.CrawlCompanyFilings(cik); },
                        max_concurrent)
{
}  // -----  end of method BatchOrchestrator::BatchOrchestrator  (constructor)  -----

BatchOrchestrator::BatchOrchestrator(CrawlFunction crawl_function, std::size_t max_concurrent)
    : crawl_function_{std::move(crawl_function)}, max_concurrent_{max_concurrent}
{
    BOOST_ASSERT_MSG(crawl_function_, "Batch needs something to do for each company.");
    BOOST_ASSERT_MSG(max_concurrent_ > 0, "Max concurrent companies must be > 0.");
}  // -----  end of method BatchOrchestrator::BatchOrchestrator  (constructor)  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  BatchOrchestrator
 *      Method:  BatchOrchestrator :: CrawlCompanies
 * Description:  keep max_concurrent_ tasks going. As one finishes, we replace
 *               it with another.
 *--------------------------------------------------------------------------------------
 */
BatchResults BatchOrchestrator::CrawlCompanies(const std::vector<std::string>& ciks) const
{
    std::vector<std::string> companies;
    for (const auto& cik : ciks)
    {
        if (ranges::find(companies, cik) == companies.end())
        {
            companies.push_back(cik);
        }
        else
        {
            spdlog::warn(catenate("Duplicate CIK: ", cik, " ignored."));
        }
    }

    spdlog::info(catenate("Begin batch crawl of: ", companies.size(), " companies. Max concurrent: ",
                          max_concurrent_, '.'));

    BatchResults results;

    // keep track of our async processes here.

    std::vector<std::future<CrawlResult>> tasks;
    std::vector<std::string> task_ciks;
    tasks.reserve(max_concurrent_);
    task_ciks.reserve(max_concurrent_);

    auto launch = [this](const std::string& cik) {
        return std::async(std::launch::async, [this, cik]() { return crawl_function_(cik); });
    };

    auto collect = [&tasks, &task_ciks, &results](std::size_t slot) {
        const auto& cik = task_ciks[slot];
        try
        {
            results.insert_or_assign(cik, tasks[slot].get());
        }
        catch (const std::exception& e)
        {
            spdlog::error(catenate("Crawl of CIK: ", cik, " failed: ", e.what()));
            results.insert_or_assign(cik, MakeFailedCrawlResult(cik, catenate("Crawl raised an error: ", e.what())));
        }
        catch (...)
        {
            // any problems, we'll document them and continue.

            spdlog::error(catenate("Crawl of CIK: ", cik, " failed with an unknown problem."));
            results.insert_or_assign(cik, MakeFailedCrawlResult(cik, "Crawl raised an unknown error."));
        }
    };

    // prime the pump...

    std::size_t next_company{0};
    for (; tasks.size() < max_concurrent_ && next_company < companies.size() && ! StopRequested(); ++next_company)
    {
        tasks.emplace_back(launch(companies[next_company]));
        task_ciks.push_back(companies[next_company]);
    }

    int continue_here{0};
    while (next_company < companies.size() && ! tasks.empty() && ! StopRequested())
    {
        auto ready_task = wait_for_any(tasks, continue_here, std::chrono::microseconds{100});
        if (ready_task < 0)
        {
            break;
        }
        collect(ready_task);

        if (StopRequested())
        {
            break;
        }

        tasks[ready_task] = launch(companies[next_company]);
        task_ciks[ready_task] = companies[next_company];
        ++next_company;
        continue_here = (ready_task + 1) % static_cast<int>(tasks.size());
    }

    // need to clean up the last set of tasks

    for (std::size_t i = 0; i < tasks.size(); ++i)
    {
        if (tasks[i].valid())
        {
            collect(i);
        }
    }

    if (next_company < companies.size())
    {
        spdlog::error(catenate("Batch stopped. ", companies.size() - next_company, " companies were not started."));
    }
    for (; next_company < companies.size(); ++next_company)
    {
        results.insert_or_assign(companies[next_company],
                                 MakeFailedCrawlResult(companies[next_company],
                                                       "Not started: batch was stopped before this company was admitted."));
    }

    auto summary = SummarizeBatch(results);
    spdlog::info(catenate("End batch crawl. Companies: ", summary.companies_, ". Successful: ",
                          summary.successful_companies_, ". Failed: ", summary.failed_companies_, '.'));
    return results;
}  // -----  end of method BatchOrchestrator::CrawlCompanies  -----

BatchSummary SummarizeBatch(const BatchResults& results)
{
    BatchSummary summary;
    for (const auto& [cik, result] : results)
    {
        ++summary.companies_;
        ++(result.success_ ? summary.successful_companies_ : summary.failed_companies_);
        summary.total_filings_found_ += result.total_filings_found_;
        summary.filings_downloaded_ += result.filings_downloaded_;
        summary.filings_failed_ += result.filings_failed_;
        summary.total_bytes_downloaded_ += result.total_bytes_downloaded_;
    }
    return summary;
}		/* -----  end of function SummarizeBatch  ----- */

void PrintBatchSummary(const BatchResults& results, std::ostream& output)
{
    const auto summary = SummarizeBatch(results);

    output << "\n=== BATCH CRAWL SUMMARY ===\n";
    output << fmt::format("Companies processed:   {}\n", summary.companies_);
    output << fmt::format("Successful companies:  {}\n", summary.successful_companies_);
    output << fmt::format("Failed companies:      {}\n", summary.failed_companies_);
    output << fmt::format("Filings found:         {}\n", summary.total_filings_found_);
    output << fmt::format("Filings downloaded:    {}\n", summary.filings_downloaded_);
    output << fmt::format("Filings failed:        {}\n", summary.filings_failed_);
    output << fmt::format("Data downloaded:       {}\n", FormatFileSize(summary.total_bytes_downloaded_));

    if (summary.failed_companies_ > 0)
    {
        output << "\n=== FAILED COMPANIES ===\n";
        for (const auto& [cik, result] : results)
        {
            if (result.success_)
            {
                continue;
            }
            output << fmt::format("CIK {}:\n", cik);
            for (const auto& error : result.errors_)
            {
                output << fmt::format("    {}\n", error);
            }
        }
    }

    output << "\n=== COMPANY DETAILS ===\n";
    output << fmt::format("{:<12} {:<8} {:>8} {:>11} {:>8} {:>12}\n", "CIK", "Status", "Found", "Downloaded",
                          "Failed", "Bytes");
    for (const auto& [cik, result] : results)
    {
        output << fmt::format("{:<12} {:<8} {:>8} {:>11} {:>8} {:>12}\n", cik, result.success_ ? "OK" : "FAILED",
                              result.total_filings_found_, result.filings_downloaded_, result.filings_failed_,
                              FormatFileSize(result.total_bytes_downloaded_));
    }
}		/* -----  end of function PrintBatchSummary  ----- */
