// =====================================================================================
//
//       Filename:  HttpClient.cpp
//
//    Description:  fetch documents from EDGAR
//
//        Version:  1.0
//        Created:  10/03/2026 01:20:05 PM
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

#include "HttpClient.h"

#include <memory>

#include <curl/curl.h>

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

namespace
{
    struct ResponseBody
    {
        std::string* body_;
        std::uint64_t max_body_bytes_;
        bool too_big_{false};
    };

    // returning less than we were given makes curl abort with CURLE_WRITE_ERROR.

    size_t WriteCallback(char* contents, size_t size, size_t nmemb, void* userp)
    {
        auto* response_body = static_cast<ResponseBody*>(userp);
        const auto chunk_size = size * nmemb;
        if (response_body->max_body_bytes_ > 0 &&
            response_body->body_->size() + chunk_size > response_body->max_body_bytes_)
        {
            response_body->too_big_ = true;
            return 0;
        }
        response_body->body_->append(contents, chunk_size);
        return chunk_size;
    }

    struct CurlEasyDeleter
    {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct CurlListDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
}   // namespace

CurlGlobal::CurlGlobal()
{
    auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK)
    {
        throw CrawlerException(catenate("Unable to initialize libcurl: ", curl_easy_strerror(rc)));
    }
}    // -----  end of method CurlGlobal::CurlGlobal  (constructor)  -----

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}    // -----  end of method CurlGlobal::~CurlGlobal  (destructor)  -----

//--------------------------------------------------------------------------------------
//       Class:  CurlHttpClient
//      Method:  CurlHttpClient
// Description:  constructor
//--------------------------------------------------------------------------------------
CurlHttpClient::CurlHttpClient(const std::string& user_agent, std::chrono::seconds request_timeout)
    : user_agent_{user_agent}, request_timeout_{request_timeout}
{
    // EDGAR refuses requests without a descriptive user agent.

    BOOST_ASSERT_MSG(! user_agent_.empty(), "User agent must not be empty.");
    BOOST_ASSERT_MSG(request_timeout_.count() > 0, "Request timeout must be > 0.");
}    // -----  end of method CurlHttpClient::CurlHttpClient  (constructor)  -----

HttpResponse CurlHttpClient::Get(const std::string& url, std::uint64_t max_body_bytes)
{
    std::unique_ptr<CURL, CurlEasyDeleter> curl{curl_easy_init()};
    if (! curl)
    {
        throw NetworkException("Failed to initialize CURL handle.");
    }

    std::unique_ptr<curl_slist, CurlListDeleter> headers{
        curl_slist_append(nullptr, "Accept: application/json, application/xml, text/html, */*")};

    HttpResponse response;
    ResponseBody response_body{&response.body_, max_body_bytes};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request_timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    if (max_body_bytes > 0)
    {
        // checked against Content-Length before the body is read, when there is one.

        curl_easy_setopt(curl.get(), CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(max_body_bytes));
    }

    spdlog::debug(catenate("GET: ", url));

    auto rc = curl_easy_perform(curl.get());
    if (rc == CURLE_FILESIZE_EXCEEDED || (rc == CURLE_WRITE_ERROR && response_body.too_big_))
    {
        throw MaxFileSizeException(catenate("Response for: ", url, " exceeds maximum: ", FormatFileSize(max_body_bytes),
                                            '.'));
    }
    if (rc != CURLE_OK)
    {
        throw NetworkException(catenate("Request for: ", url, " failed: ", curl_easy_strerror(rc)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code_);

    spdlog::debug(catenate("GET: ", url, " status: ", response.status_code_, " bytes: ", response.body_.size()));

    return response;
}    // -----  end of method CurlHttpClient::Get  -----
