// =====================================================================================
//
//       Filename:  crawl_main.cpp
//
//    Description:  crawl EDGAR for XBRL filings and store them. Also validate, parse and compute ratios from saved documents.
//
//        Version:  1.0
//        Created:  10/10/2026 02:41:17 PM
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

#include <iostream>
#include <locale>

#include "spdlog/spdlog.h"

#include "CrawlerApp.h"

int main(int argc, char* argv[])
{
// from https://gcc.gnu.org/bugzilla/show_bug.cgi?id=77704
// libstdc++ concurrency problem.

    const std::ctype<char>& ct (std::use_facet<std::ctype<char>> (std::locale ()));

    for (size_t i (0); i != 256; ++i)
    {
        ct.narrow (static_cast<char> (i), '\0');
    }

    auto result{0};

    try
    {
        CrawlerApp my_app(argc, argv);
        if (! my_app.Startup())
        {
            return 1;
        }
        result = my_app.Run() ? 0 : 1;
        my_app.Shutdown();
    }
    catch (std::exception& e)
    {
        std::cout << e.what() << '\n';
        spdlog::error(e.what());
        result = 1;
    }

    return result;

}        // -----  end of method main  -----
