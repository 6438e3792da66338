// =====================================================================================
//
//       Filename:  SecEdgarCrawler.cpp
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

#include "SecEdgarCrawler.h"

#include <algorithm>
#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <json/json.h>

#include <range/v3/algorithm/find.hpp>

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

namespace
{

std::string MakeOperationID()
{
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

// numbers sometimes come to us as strings.

std::string JSONAsString(const Json::Value& value)
{
    if (value.isNull())
    {
        return {};
    }
    if (value.isString())
    {
        return value.asString();
    }
    if (value.isIntegral())
    {
        return std::to_string(value.asLargestInt());
    }
    return value.toStyledString();
}

bool JSONAsFlag(const Json::Value& value)
{
    if (value.isBool())
    {
        return value.asBool();
    }
    if (value.isIntegral())
    {
        return value.asInt() != 0;
    }
    return value.isString() && (value.asString() == "1" || value.asString() == "true");
}

bool IsAnnualForm(XC::sv form_type)
{
    return form_type.starts_with("10-K") || form_type.starts_with("20-F") || form_type.starts_with("40-F");
}

}   // namespace

CrawlConfig CrawlConfig::Conservative()
{
    CrawlConfig config;
    config.max_requests_per_second_ = RateLimiter::ConservativeRate();
    config.max_retries_ = 5;
    config.retry_delay_ = std::chrono::seconds{10};
    config.max_file_size_ = 25 * 1024 * 1024;
    return config;
}		/* -----  end of function CrawlConfig::Conservative  ----- */

CrawlConfig CrawlConfig::Aggressive()
{
    CrawlConfig config;
    config.max_requests_per_second_ = RateLimiter::AggressiveRate();
    config.max_retries_ = 2;
    config.retry_delay_ = std::chrono::seconds{2};
    config.max_file_size_ = 100 * 1024 * 1024;
    return config;
}		/* -----  end of function CrawlConfig::Aggressive  ----- */

void CrawlConfig::Validate() const
{
    BOOST_ASSERT_MSG(max_requests_per_second_ > 0.0, "Max requests per second must be > 0.");
    BOOST_ASSERT_MSG(max_retries_ >= 0, "Max retries must be >= 0.");
    BOOST_ASSERT_MSG(retry_delay_ >= std::chrono::seconds::zero(), "Retry delay must be >= 0.");
    BOOST_ASSERT_MSG(max_file_size_ > 0, "Max file size must be > 0.");
    BOOST_ASSERT_MSG(! user_agent_.empty(), "EDGAR requires a User-Agent.");
    BOOST_ASSERT_MSG(request_timeout_ > std::chrono::seconds::zero(), "Request timeout must be > 0.");
    if (start_date_ && end_date_)
    {
        BOOST_ASSERT_MSG(start_date_.value() <= end_date_.value(), "Start date must be <= end date.");
    }
    for (const auto& form_type : form_types_)
    {
        if (! IsValidFormType(form_type))
        {
            spdlog::warn(catenate("Form type: '", form_type, "' is not a known SEC form."));
        }
    }
}		/* -----  end of function CrawlConfig::Validate  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseSubmissionsJSON
 *  Description:  the recent filings are given as parallel arrays, one per field.
 * =====================================================================================
 */
CompanySubmissions ParseSubmissionsJSON(const std::string& json_text)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream input{json_text};
    if (! Json::parseFromStream(builder, input, &root, &errors))
    {
        throw CrawlerException(catenate("Unable to parse submissions document: ", errors));
    }
    if (! root.isObject())
    {
        throw CrawlerException("Submissions document is not a JSON object.");
    }

    CompanySubmissions company;
    company.cik_ = UnpadCIK(JSONAsString(root["cik"]));
    company.name_ = JSONAsString(root["name"]);
    company.sic_ = JSONAsString(root["sic"]);
    company.sic_description_ = JSONAsString(root["sicDescription"]);
    for (const auto& ticker : root["tickers"])
    {
        company.tickers_.push_back(JSONAsString(ticker));
    }

    const auto& recent = root["filings"]["recent"];
    if (! recent.isObject())
    {
        return company;
    }

    const auto& accession_numbers = recent["accessionNumber"];
    auto field = [&recent](const char* name, Json::ArrayIndex i) -> const Json::Value& {
        static const Json::Value empty;
        const auto& values = recent[name];
        return values.isArray() && values.isValidIndex(i) ? values[i] : empty;
    };

    for (Json::ArrayIndex i = 0; i < accession_numbers.size(); ++i)
    {
        FilingInfo filing;
        filing.accession_number_ = JSONAsString(accession_numbers[i]);
        filing.form_ = JSONAsString(field("form", i));
        filing.primary_document_ = JSONAsString(field("primaryDocument", i));
        filing.primary_doc_description_ = JSONAsString(field("primaryDocDescription", i));
        filing.is_xbrl_ = JSONAsFlag(field("isXBRL", i));
        filing.is_inline_xbrl_ = JSONAsFlag(field("isInlineXBRL", i));
        filing.size_ = field("size", i).isIntegral() ? field("size", i).asLargestUInt() : 0;

        auto filing_date = TryParseSECDate(JSONAsString(field("filingDate", i)));
        if (! filing_date)
        {
            spdlog::warn(catenate("Skipping filing: ", filing.accession_number_, " with unusable filing date."));
            continue;
        }
        filing.filing_date_ = filing_date.value();
        filing.report_date_ = TryParseSECDate(JSONAsString(field("reportDate", i)));
        company.filings_.push_back(std::move(filing));
    }
    return company;
}		/* -----  end of function ParseSubmissionsJSON  ----- */

bool FilingHasFormType::operator()(const FilingInfo& filing) const
{
    return ranges::find(form_list_, filing.form_) != form_list_.end();
}		/* -----  end of method FilingHasFormType::operator()  ----- */

bool FilingIsWithinDateRange::operator()(const FilingInfo& filing) const
{
    return begin_date_ <= filing.filing_date_ && filing.filing_date_ <= end_date_;
}		/* -----  end of method FilingIsWithinDateRange::operator()  ----- */

bool FilingIsNotAmended::operator()(const FilingInfo& filing) const
{
    return ! filing.form_.ends_with("/A");
}		/* -----  end of method FilingIsNotAmended::operator()  ----- */

bool FilingIsNotRestated::operator()(const FilingInfo& filing) const
{
    return ! boost::algorithm::icontains(filing.primary_doc_description_, "restat");
}		/* -----  end of method FilingIsNotRestated::operator()  ----- */

FilterList MakeFilters(const CrawlConfig& config)
{
    FilterList filters;
    if (! config.form_types_.empty())
    {
        filters.emplace_back(FilingHasFormType{config.form_types_});
    }
    if (config.start_date_ || config.end_date_)
    {
        filters.emplace_back(FilingIsWithinDateRange{
            config.start_date_.value_or(date::year_month_day{date::year{1900}, date::January, date::day{1}}),
            config.end_date_.value_or(date::year_month_day{date::year{2100}, date::December, date::day{31}})});
    }
    if (config.require_xbrl_)
    {
        filters.emplace_back(FilingHasXBRL{});
    }
    if (config.exclude_amended_)
    {
        filters.emplace_back(FilingIsNotAmended{});
    }
    if (config.exclude_restated_)
    {
        filters.emplace_back(FilingIsNotRestated{});
    }
    return filters;
}		/* -----  end of function MakeFilters  ----- */

std::string CrawlStateName(CrawlState state)
{
    switch (state)
    {
        case CrawlState::e_Idle:
            return "Idle";
        case CrawlState::e_Enumerating:
            return "Enumerating";
        case CrawlState::e_Filtering:
            return "Filtering";
        case CrawlState::e_Downloading:
            return "Downloading";
        case CrawlState::e_Storing:
            return "Storing";
        case CrawlState::e_Completed:
            return "Completed";
        case CrawlState::e_Failed:
            return "Failed";
    }
    return "Unknown";
}		/* -----  end of function CrawlStateName  ----- */

std::string FilingStatusName(FilingStatus status)
{
    switch (status)
    {
        case FilingStatus::e_Stored:
            return "stored";
        case FilingStatus::e_DownloadFailed:
            return "download_failed";
        case FilingStatus::e_Rejected:
            return "rejected";
        case FilingStatus::e_StorageFailed:
            return "storage_failed";
    }
    return "unknown";
}		/* -----  end of function FilingStatusName  ----- */

CrawlResult CrawlResult::Begin(const std::string& operation_type, const std::optional<std::string>& company_cik)
{
    CrawlResult result;
    result.operation_id_ = MakeOperationID();
    result.operation_type_ = operation_type;
    result.company_cik_ = company_cik;
    result.start_time_ = std::chrono::system_clock::now();
    return result;
}		/* -----  end of method CrawlResult::Begin  ----- */

void CrawlResult::MarkCompleted(bool success)
{
    BOOST_ASSERT_MSG(! end_time_, "Operation has already completed.");
    success_ = success;
    end_time_ = std::chrono::system_clock::now();
}		/* -----  end of method CrawlResult::MarkCompleted  ----- */

DocumentMetadata MakeDocumentMetadata(const CompanySubmissions& company, const FilingInfo& filing,
                                      const std::string& source_url)
{
    DocumentMetadata metadata;
    metadata.accession_number_ = filing.accession_number_;
    metadata.company_cik_ = company.cik_;
    metadata.company_name_ = company.name_;
    metadata.form_type_ = filing.form_;
    metadata.source_url_ = source_url;
    metadata.filing_date_ = filing.filing_date_;
    metadata.period_end_date_ = filing.report_date_.value_or(filing.filing_date_);
    metadata.fiscal_year_ = static_cast<int>(metadata.period_end_date_.year());
    if (! IsAnnualForm(filing.form_))
    {
        metadata.fiscal_quarter_ = FiscalQuarterFromDate(metadata.period_end_date_);
    }
    return metadata;
}		/* -----  end of function MakeDocumentMetadata  ----- */

//--------------------------------------------------------------------------------------
//       Class:  SecEdgarCrawler
//      Method:  SecEdgarCrawler
// Description:  constructor
//--------------------------------------------------------------------------------------
SecEdgarCrawler::SecEdgarCrawler(const CrawlConfig& config, std::shared_ptr<HttpClient> http_client,
                                 std::shared_ptr<DocumentStore> document_store,
                                 std::shared_ptr<RateLimiter> rate_limiter)
    : config_{config},
      retry_policy_{config.MakeRetryPolicy()},
      filters_{MakeFilters(config)},
      http_client_{std::move(http_client)},
      document_store_{std::move(document_store)},
      rate_limiter_{std::move(rate_limiter)}
{
    config_.Validate();
    BOOST_ASSERT_MSG(http_client_, "Crawler needs an HTTP client.");
    BOOST_ASSERT_MSG(document_store_, "Crawler needs a document store.");

    if (! rate_limiter_)
    {
        rate_limiter_ = std::make_shared<RateLimiter>(config_.max_requests_per_second_);
    }
}  // -----  end of method SecEdgarCrawler::SecEdgarCrawler  (constructor)  -----

void SecEdgarCrawler::TransitionTo(const std::string& subject, CrawlState state, std::size_t filing_number) const
{
    spdlog::debug(catenate(subject, ": -> ", CrawlStateName(state),
                           filing_number > 0 ? catenate('(', filing_number, ')') : std::string{}));
    if (observer_)
    {
        observer_(subject, state, filing_number);
    }
}  // -----  end of method SecEdgarCrawler::TransitionTo  -----

RetryOutcome<std::string> SecEdgarCrawler::Download(const std::string& url, const std::string& description) const
{
    return RetryWithDelay(
        [this, &url]() {
            rate_limiter_->Acquire();
            spdlog::debug(catenate("GET: ", url));
            auto response = http_client_->Get(url, config_.max_file_size_);
            if (! response.IsSuccess())
            {
                throw NetworkException(catenate("HTTP status: ", response.status_code_, " for: ", url));
            }
            if (response.body_.size() > config_.max_file_size_)
            {
                throw MaxFileSizeException(catenate("Document size: ", FormatFileSize(response.body_.size()),
                                                    " exceeds maximum: ", FormatFileSize(config_.max_file_size_),
                                                    ". URL: ", url));
            }
            return std::move(response.body_);
        },
        retry_policy_, description);
}  // -----  end of method SecEdgarCrawler::Download  -----

CompanySubmissions SecEdgarCrawler::EnumerateFilings(const std::string& cik) const
{
    const auto url = BuildSubmissionsURL(cik);
    auto downloaded = Download(url, catenate("Filing index for CIK: ", cik));
    if (! downloaded.succeeded())
    {
        throw NetworkException(catenate("Unable to retrieve filing index for CIK: ", cik, " after: ",
                                        downloaded.attempts_, " attempts. Last error: ", downloaded.LastError()));
    }
    auto company = ParseSubmissionsJSON(downloaded.value_.value());
    if (company.cik_.empty())
    {
        company.cik_ = UnpadCIK(cik);
    }
    return company;
}  // -----  end of method SecEdgarCrawler::EnumerateFilings  -----

std::vector<FilingInfo> SecEdgarCrawler::FilterFilings(const std::vector<FilingInfo>& filings,
                                                       const std::string& cik) const
{
    std::vector<FilingInfo> selected;
    for (const auto& filing : filings)
    {
        bool use_filing{true};
        for (const auto& filter : filters_)
        {
            use_filing = std::visit([&filing](const auto& f) { return f(filing); }, filter);
            if (! use_filing)
            {
                spdlog::debug(catenate(cik, ": ", filing.accession_number_, " (", filing.form_,
                                       "): Filing skipped because of filter: ",
                                       std::visit([](const auto& f) -> std::string { return f.filter_name_; }, filter),
                                       "."));
                break;
            }
        }
        if (use_filing)
        {
            selected.push_back(filing);
        }
    }
    return selected;
}  // -----  end of method SecEdgarCrawler::FilterFilings  -----

void SecEdgarCrawler::ProcessDocument(const std::string& subject, std::size_t filing_number, const std::string& url,
                                      const DocumentMetadata& metadata, std::uint64_t declared_size,
                                      CrawlResult& result) const
{
    FilingOutcome outcome;
    outcome.accession_number_ = metadata.accession_number_;
    outcome.form_type_ = metadata.form_type_;
    outcome.url_ = url;

    auto record_failure = [&](FilingStatus status, const std::string& error) {
        outcome.status_ = status;
        outcome.error_ = error;
        result.errors_.push_back(catenate(metadata.accession_number_, ": ", error));
        ++result.filings_failed_;
        spdlog::error(catenate(subject, ": ", metadata.accession_number_, ": ", error));
        result.outcomes_.push_back(outcome);
    };

    // no need to spend a request on something the index already says is too big.

    if (declared_size > config_.max_file_size_)
    {
        outcome.attempts_ = 0;
        record_failure(FilingStatus::e_Rejected,
                       catenate("Declared size: ", FormatFileSize(declared_size), " exceeds maximum: ",
                                FormatFileSize(config_.max_file_size_), ". Not downloaded."));
        return;
    }

    try
    {
        TransitionTo(subject, CrawlState::e_Downloading, filing_number);

        RetryOutcome<std::string> downloaded;
        try
        {
            downloaded = Download(url, catenate(subject, ": ", metadata.accession_number_));
        }
        catch (const MaxFileSizeException& e)
        {
            outcome.attempts_ = 1;
            record_failure(FilingStatus::e_Rejected, e.what());
            return;
        }

        outcome.attempts_ = downloaded.attempts_;
        if (! downloaded.succeeded())
        {
            record_failure(FilingStatus::e_DownloadFailed,
                           catenate("Download failed after: ", downloaded.attempts_, " attempts: ",
                                    downloaded.LastError()));
            return;
        }

        const auto& content = downloaded.value_.value();
        outcome.bytes_ = content.size();
        result.total_bytes_downloaded_ += content.size();

        TransitionTo(subject, CrawlState::e_Storing, filing_number);
        try
        {
            auto record = document_store_->Store(XC::DocumentContent{content}, metadata);
            spdlog::info(catenate(subject, ": stored: ", metadata.accession_number_, " (", metadata.form_type_,
                                  "). Size: ", FormatFileSize(record.file_size_), ". Method: ",
                                  StorageMethodName(record.storage_method_), '.'));
        }
        catch (const std::exception& e)
        {
            record_failure(FilingStatus::e_StorageFailed, catenate("Storage failed: ", e.what()));
            return;
        }

        outcome.status_ = FilingStatus::e_Stored;
        ++result.filings_downloaded_;
        result.outcomes_.push_back(outcome);
    }
    catch (const std::exception& e)
    {
        record_failure(FilingStatus::e_DownloadFailed, catenate("Unexpected problem: ", e.what()));
    }
}  // -----  end of method SecEdgarCrawler::ProcessDocument  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  SecEdgarCrawler
 *      Method:  SecEdgarCrawler :: CrawlCompanyFilings
 * Description:  Idle -> Enumerating -> Filtering -> Downloading(n) -> Storing(n) -> Completed
 *
 *               success_ means we could run: the index was retrieved and, if
 *               anything passed the filters, at least one filing was stored.
 *               The counts say how well we did.
 *--------------------------------------------------------------------------------------
 */
CrawlResult SecEdgarCrawler::CrawlCompanyFilings(const std::string& cik) const
{
    auto result = CrawlResult::Begin("company_crawl", cik);
    TransitionTo(cik, CrawlState::e_Idle);

    if (! IsValidCIK(cik))
    {
        result.errors_.push_back(catenate("Invalid CIK: '", cik, "'."));
        TransitionTo(cik, CrawlState::e_Failed);
        result.MarkCompleted(false);
        return result;
    }

    spdlog::info(catenate("Begin crawl of CIK: ", cik));

    CompanySubmissions company;
    try
    {
        TransitionTo(cik, CrawlState::e_Enumerating);
        company = EnumerateFilings(cik);
    }
    catch (const std::exception& e)
    {
        result.errors_.push_back(catenate("Enumeration failed: ", e.what()));
        spdlog::error(catenate(cik, ": ", result.errors_.back()));
        TransitionTo(cik, CrawlState::e_Failed);
        result.MarkCompleted(false);
        return result;
    }

    TransitionTo(cik, CrawlState::e_Filtering);
    result.filings_enumerated_ = company.filings_.size();
    const auto selected = FilterFilings(company.filings_, cik);
    result.total_filings_found_ = selected.size();

    spdlog::info(catenate(cik, " (", company.name_, "): filings enumerated: ", result.filings_enumerated_,
                          ". Selected: ", result.total_filings_found_, '.'));

    std::size_t filing_number{0};
    for (const auto& filing : selected)
    {
        ++filing_number;
        const auto url = filing.primary_document_.empty()
                             ? BuildXBRL_URL(company.cik_, filing.accession_number_)
                             : BuildPrimaryDocumentURL(company.cik_, filing.accession_number_, filing.primary_document_);
        ProcessDocument(cik, filing_number, url, MakeDocumentMetadata(company, filing, url), filing.size_, result);
    }

    const bool success = result.total_filings_found_ == 0 || result.filings_downloaded_ > 0;
    if (! success)
    {
        result.errors_.push_back(catenate("None of the: ", result.total_filings_found_, " selected filings could be retrieved."));
    }
    TransitionTo(cik, success ? CrawlState::e_Completed : CrawlState::e_Failed);
    result.MarkCompleted(success);

    spdlog::info(catenate("End crawl of CIK: ", cik, ". Downloaded: ", result.filings_downloaded_, ". Failed: ",
                          result.filings_failed_, ". Bytes: ", FormatFileSize(result.total_bytes_downloaded_), '.'));
    return result;
}  // -----  end of method SecEdgarCrawler::CrawlCompanyFilings  -----

CrawlResult SecEdgarCrawler::FetchDocument(const std::string& url, const DocumentMetadata& metadata) const
{
    auto result = CrawlResult::Begin(
        "document_fetch", metadata.company_cik_.empty() ? std::nullopt : std::optional<std::string>{metadata.company_cik_});
    result.total_filings_found_ = 1;

    ProcessDocument(url, 1, url, metadata, 0, result);

    const bool success = result.filings_downloaded_ == 1;
    TransitionTo(url, success ? CrawlState::e_Completed : CrawlState::e_Failed);
    result.MarkCompleted(success);
    return result;
}  // -----  end of method SecEdgarCrawler::FetchDocument  -----

StorageStats SecEdgarCrawler::GetStorageStats() const
{
    return document_store_->GetStorageStats();
}  // -----  end of method SecEdgarCrawler::GetStorageStats  -----
