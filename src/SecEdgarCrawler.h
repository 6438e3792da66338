// =====================================================================================
//
//       Filename:  SecEdgarCrawler.h
//
//    Description:  enumerate, filter, download and store a company's EDGAR filings
//
//        Version:  1.0
//        Created:  10/08/2026 10:04:17 AM
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

#ifndef _SECEDGARCRAWLER_INC_
#define _SECEDGARCRAWLER_INC_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <date/date.h>

#include "Crawler.h"
#include "DocumentStore.h"
#include "HttpClient.h"
#include "RateLimiter.h"
#include "RetryPolicy.h"

// =====================================================================================
//  configuration. Built once per run and not changed after.
// =====================================================================================

struct CrawlConfig
{
    double max_requests_per_second_{10.0};
    int max_retries_{3};
    std::chrono::seconds retry_delay_{5};
    BackoffMode backoff_mode_{BackoffMode::e_Fixed};
    std::uint64_t max_file_size_{50 * 1024 * 1024};
    std::optional<date::year_month_day> start_date_;
    std::optional<date::year_month_day> end_date_;

    // empty means all form types.

    std::vector<std::string> form_types_;
    bool exclude_amended_{false};
    bool exclude_restated_{false};
    bool require_xbrl_{true};
    std::string user_agent_{"XBRL_Crawler/1.0 (driedel@cox.net)"};
    std::chrono::seconds request_timeout_{30};

    static CrawlConfig Default() { return CrawlConfig{}; }
    static CrawlConfig Conservative();
    static CrawlConfig Aggressive();

    // throws AssertionException.

    void Validate() const;

    [[nodiscard]] RetryPolicy MakeRetryPolicy() const
    {
        return RetryPolicy{max_retries_, retry_delay_, backoff_mode_};
    }
};

// =====================================================================================
//  the company filing index (EDGAR submissions JSON)
// =====================================================================================

struct FilingInfo
{
    std::string accession_number_;
    date::year_month_day filing_date_{};
    std::optional<date::year_month_day> report_date_;
    std::string form_;
    std::string primary_document_;
    std::string primary_doc_description_;
    bool is_xbrl_{false};
    bool is_inline_xbrl_{false};
    std::uint64_t size_{0};
};

struct CompanySubmissions
{
    std::string cik_;
    std::string name_;
    std::vector<std::string> tickers_;
    std::string sic_;
    std::string sic_description_;
    std::vector<FilingInfo> filings_;
};

// throws CrawlerException if the text is not a submissions document.

CompanySubmissions ParseSubmissionsJSON(const std::string& json_text);

// let's use some function objects for our filters.

struct FilingHasFormType
{
    explicit FilingHasFormType(const std::vector<std::string>& form_list)
        : form_list_{form_list} {}

    bool operator()(const FilingInfo& filing) const;

    const std::string filter_name_{"FilingHasFormType"};

    const std::vector<std::string> form_list_;
};

struct FilingIsWithinDateRange
{
    FilingIsWithinDateRange(const date::year_month_day& begin_date, const date::year_month_day& end_date)
        : begin_date_{begin_date}, end_date_{end_date} {}

    bool operator()(const FilingInfo& filing) const;

    const std::string filter_name_{"FilingIsWithinDateRange"};

    const date::year_month_day begin_date_;
    const date::year_month_day end_date_;
};

struct FilingHasXBRL
{
    bool operator()(const FilingInfo& filing) const { return filing.is_xbrl_ || filing.is_inline_xbrl_; }

    const std::string filter_name_{"FilingHasXBRL"};
};

struct FilingIsNotAmended
{
    bool operator()(const FilingInfo& filing) const;

    const std::string filter_name_{"FilingIsNotAmended"};
};

struct FilingIsNotRestated
{
    bool operator()(const FilingInfo& filing) const;

    const std::string filter_name_{"FilingIsNotRestated"};
};

using FilterTypes =
    std::variant<FilingHasFormType, FilingIsWithinDateRange, FilingHasXBRL, FilingIsNotAmended, FilingIsNotRestated>;
using FilterList = std::vector<FilterTypes>;

FilterList MakeFilters(const CrawlConfig& config);

// =====================================================================================
//  what happened
// =====================================================================================

enum class CrawlState
{
    e_Idle,
    e_Enumerating,
    e_Filtering,
    e_Downloading,
    e_Storing,
    e_Completed,
    e_Failed
};

std::string CrawlStateName(CrawlState state);

enum class FilingStatus
{
    e_Stored,
    e_DownloadFailed,
    e_Rejected,
    e_StorageFailed
};

std::string FilingStatusName(FilingStatus status);

struct FilingOutcome
{
    std::string accession_number_;
    std::string form_type_;
    std::string url_;
    FilingStatus status_{FilingStatus::e_DownloadFailed};
    std::uint64_t bytes_{0};
    int attempts_{0};
    std::string error_;
};

struct CrawlResult
{
    std::string operation_id_;
    std::optional<std::string> company_cik_;
    std::string operation_type_;
    std::chrono::system_clock::time_point start_time_;
    std::optional<std::chrono::system_clock::time_point> end_time_;

    // before filtering.

    std::size_t filings_enumerated_{0};

    // after filtering. filings_downloaded_ + filings_failed_ == total_filings_found_

    std::size_t total_filings_found_{0};
    std::size_t filings_downloaded_{0};
    std::size_t filings_failed_{0};
    std::uint64_t total_bytes_downloaded_{0};
    std::vector<std::string> errors_;
    bool success_{false};
    std::vector<FilingOutcome> outcomes_;

    static CrawlResult Begin(const std::string& operation_type, const std::optional<std::string>& company_cik);

    // sets end_time_. Only once.

    void MarkCompleted(bool success);
    [[nodiscard]] bool IsCompleted() const { return end_time_.has_value(); }
};

// =====================================================================================
//        Class:  SecEdgarCrawler
//  Description:  one instance may be used by several threads at once. Nothing
//                is changed after construction except through the shared
//                rate limiter and document store, which do their own locking.
// =====================================================================================
class SecEdgarCrawler
{
public:
    using StateObserver = std::function<void(const std::string& subject, CrawlState state, std::size_t filing_number)>;

    // ====================  LIFECYCLE     =======================================

    SecEdgarCrawler(const CrawlConfig& config, std::shared_ptr<HttpClient> http_client,
                    std::shared_ptr<DocumentStore> document_store,
                    std::shared_ptr<RateLimiter> rate_limiter = nullptr);

    SecEdgarCrawler() = delete;
    SecEdgarCrawler(const SecEdgarCrawler& rhs) = delete;
    SecEdgarCrawler(SecEdgarCrawler&& rhs) = delete;

    ~SecEdgarCrawler() = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const CrawlConfig& GetConfig() const { return config_; }
    [[nodiscard]] std::shared_ptr<RateLimiter> GetRateLimiter() const { return rate_limiter_; }

    // ====================  MUTATORS      =======================================

    // must be set before the crawler is shared between threads.

    void SetStateObserver(StateObserver observer) { observer_ = std::move(observer); }

    CrawlResult CrawlCompanyFilings(const std::string& cik) const;
    CrawlResult FetchDocument(const std::string& url, const DocumentMetadata& metadata) const;

    StorageStats GetStorageStats() const;

    // these throw. NetworkException once retries are used up.

    CompanySubmissions EnumerateFilings(const std::string& cik) const;
    std::vector<FilingInfo> FilterFilings(const std::vector<FilingInfo>& filings, const std::string& cik) const;

    // ====================  OPERATORS     =======================================

    SecEdgarCrawler& operator=(const SecEdgarCrawler& rhs) = delete;
    SecEdgarCrawler& operator=(SecEdgarCrawler&& rhs) = delete;

private:
    // ====================  METHODS       =======================================

    void TransitionTo(const std::string& subject, CrawlState state, std::size_t filing_number = 0) const;

    // rate limited, retried. Oversize documents throw MaxFileSizeException.

    RetryOutcome<std::string> Download(const std::string& url, const std::string& description) const;

    // download then store one document. Never throws. Updates result.
    // declared_size is what the filing index claims, 0 if unknown.

    void ProcessDocument(const std::string& subject, std::size_t filing_number, const std::string& url,
                         const DocumentMetadata& metadata, std::uint64_t declared_size, CrawlResult& result) const;

    // ====================  DATA MEMBERS  =======================================

    const CrawlConfig config_;
    const RetryPolicy retry_policy_;
    const FilterList filters_;
    std::shared_ptr<HttpClient> http_client_;
    std::shared_ptr<DocumentStore> document_store_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    StateObserver observer_;

}; // -----  end of class SecEdgarCrawler  -----

DocumentMetadata MakeDocumentMetadata(const CompanySubmissions& company, const FilingInfo& filing,
                                      const std::string& source_url);

#endif   // ----- #ifndef _SECEDGARCRAWLER_INC_  -----
