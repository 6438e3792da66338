// =====================================================================================
//
//       Filename:  CrawlerApp.h
//
//    Description:  command line driver for crawling, storing and parsing EDGAR XBRL filings
//
//        Version:  1.0
//        Created:  10/10/2026 11:18:02 AM
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

#ifndef CRAWLERAPP_H_
#define CRAWLERAPP_H_

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "Crawler.h"
#include "DocumentStore.h"
#include "FinancialRatioCalculator.h"
#include "HttpClient.h"
#include "SecEdgarCrawler.h"
#include "XbrlParser.h"

class CrawlerApp
{
public:
    CrawlerApp(int argc, char* argv[]);

    // use ctor below for testing with predefined options

    explicit CrawlerApp(const std::vector<std::string>& tokens);

    CrawlerApp() = delete;
    CrawlerApp(const CrawlerApp& rhs) = delete;
    CrawlerApp(CrawlerApp&& rhs) = delete;

    ~CrawlerApp() = default;

    CrawlerApp& operator=(const CrawlerApp& rhs) = delete;
    CrawlerApp& operator=(CrawlerApp&& rhs) = delete;

    static bool SignalReceived() { return had_signal_; }

    bool Startup();

    // false means the operation could not be carried out.
    // Per filing problems are reported but do not make this false.

    bool Run();
    void Shutdown();

    [[nodiscard]] const CrawlConfig& GetCrawlConfig() const { return crawl_config_; }

    // for testing. Used instead of building our own.

    void UseHttpClient(std::shared_ptr<HttpClient> http_client) { http_client_ = std::move(http_client); }
    void UseDocumentStore(std::shared_ptr<DocumentStore> document_store)
    {
        document_store_ = std::move(document_store);
    }

protected:
    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string>& tokens);

    void ConfigureLogging();

    bool CheckArgs();

    bool Do_Crawl();
    bool Do_Batch();
    bool Do_Stats();
    bool Do_Validate();
    bool Do_Parse();
    bool Do_Ratios();
    bool Do_Fetch();

    std::shared_ptr<HttpClient> GetHttpClient();
    std::shared_ptr<DocumentStore> GetDocumentStore();

    std::vector<XbrlParseResult> ParseInputFiles();

    // to --output if given, else stdout.

    void WriteOutput(const std::string& text) const;

private:
    static void HandleSignal(int signal);

    static std::optional<date::year_month_day> ParseDateArg(const std::string& date_text, const char* which);

    // ====================  DATA MEMBERS  =======================================

    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    int mArgc = 0;
    char** mArgv = nullptr;
    const std::vector<std::string> tokens_;

    CrawlConfig crawl_config_;
    XbrlStorageConfig storage_config_;
    RatioConfig ratio_config_;

    std::string mode_;
    std::string start_date_;
    std::string stop_date_;
    std::string form_;
    std::string CIK_;
    std::string DB_mode_{"test"};
    std::string DB_params_;
    std::string storage_type_{"postgres"};
    std::string logging_level_{"information"};
    std::string output_format_{"text"};
    std::string max_file_size_text_{"50MB"};
    std::string large_object_threshold_text_{"100MB"};
    std::string user_agent_;
    std::string backoff_;
    std::string document_url_;
    std::string accession_number_;

    std::vector<std::string> form_list_;
    std::vector<std::string> CIK_list_;
    std::vector<std::string> input_files_;

    XC::FileName log_file_path_name_;
    XC::FileName output_file_name_;
    XC::FileName labels_file_name_;
    XC::FileName ratio_config_file_name_;

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<HttpClient> http_client_;
    std::shared_ptr<DocumentStore> document_store_;
    std::unique_ptr<CurlGlobal> curl_global_;

    double max_requests_per_second_{RateLimiter::SEC_EDGAR_Rate()};
    int max_retries_{3};
    int retry_delay_{5};
    int request_timeout_{30};
    int max_at_a_time_{3};            // how many companies at once in batch mode
    int compression_level_{6};

    bool exclude_amended_{false};
    bool exclude_restated_{false};
    bool include_non_XBRL_{false};
    bool create_schema_{false};
    bool compression_enabled_{true};

    static std::atomic<bool> had_signal_;

}; // -----  end of class CrawlerApp  -----

#endif /* CRAWLERAPP_H_ */
