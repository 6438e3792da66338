// =====================================================================================
//
//       Filename:  HttpClient.h
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

#ifndef _HTTPCLIENT_INC_
#define _HTTPCLIENT_INC_

#include <chrono>
#include <cstdint>
#include <string>

// =====================================================================================
//        Class:  HttpClient
//  Description:  what the crawler needs from an HTTP implementation. Tests
//                supply their own.
//
//                Get() throws NetworkException on transport failures and
//                timeouts. HTTP status is returned, not judged.
//                A body longer than max_body_bytes throws MaxFileSizeException
//                as soon as that is known. 0 means no limit.
// =====================================================================================

struct HttpResponse
{
    long status_code_{0};
    std::string body_;

    [[nodiscard]] bool IsSuccess() const { return status_code_ >= 200 && status_code_ < 300; }
};

class HttpClient
{
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse Get(const std::string& url, std::uint64_t max_body_bytes) = 0;
};

// =====================================================================================
//        Class:  CurlGlobal
//  Description:  curl_global_init/cleanup for the life of the app. RAII
// =====================================================================================

class CurlGlobal
{
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal& rhs) = delete;
    CurlGlobal& operator=(const CurlGlobal& rhs) = delete;
};

// =====================================================================================
//        Class:  CurlHttpClient
//  Description:  libcurl based client. A new easy handle per request so one
//                instance may be shared between threads.
// =====================================================================================

class CurlHttpClient : public HttpClient
{
public:
    // ====================  LIFECYCLE     =======================================

    CurlHttpClient(const std::string& user_agent, std::chrono::seconds request_timeout);

    CurlHttpClient() = delete;
    CurlHttpClient(const CurlHttpClient& rhs) = delete;
    CurlHttpClient(CurlHttpClient&& rhs) = delete;

    ~CurlHttpClient() override = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] const std::string& GetUserAgent() const { return user_agent_; }

    // ====================  MUTATORS      =======================================

    HttpResponse Get(const std::string& url, std::uint64_t max_body_bytes) override;

    // ====================  OPERATORS     =======================================

    CurlHttpClient& operator=(const CurlHttpClient& rhs) = delete;
    CurlHttpClient& operator=(CurlHttpClient&& rhs) = delete;

private:
    // ====================  DATA MEMBERS  =======================================

    const std::string user_agent_;
    const std::chrono::seconds request_timeout_;

}; // -----  end of class CurlHttpClient  -----

#endif   // ----- #ifndef _HTTPCLIENT_INC_  -----
