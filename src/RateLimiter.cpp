// =====================================================================================
//
//       Filename:  RateLimiter.cpp
//
//    Description:  Token bucket which bounds our request rate to EDGAR
//
//        Version:  1.0
//        Created:  10/03/2026 08:15:44 AM
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

#include "RateLimiter.h"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

//--------------------------------------------------------------------------------------
//       Class:  RateLimiter
//      Method:  RateLimiter
// Description:  constructor
//--------------------------------------------------------------------------------------
RateLimiter::RateLimiter(double requests_per_second)
    : rate_{requests_per_second}, capacity_{requests_per_second}, tokens_{requests_per_second},
      last_refill_{clock::now()}
{
    BOOST_ASSERT_MSG(requests_per_second > 0.0,
                     catenate("Requests per second must be > 0. Got: ", requests_per_second).c_str());
}    // -----  end of method RateLimiter::RateLimiter  (constructor)  -----

void RateLimiter::Refill(clock::time_point now)
{
    const std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_ = std::min(capacity_, tokens_ + elapsed.count() * rate_);
    last_refill_ = now;
}    // -----  end of method RateLimiter::Refill  -----

void RateLimiter::Acquire()
{
    clock::duration wait_time{0};
    {
        std::lock_guard<std::mutex> lk{m_};
        Refill(clock::now());
        tokens_ -= 1.0;
        if (tokens_ < 0.0)
        {
            wait_time = std::chrono::duration_cast<clock::duration>(
                std::chrono::duration<double>{-tokens_ / rate_});
        }
    }

    if (wait_time > clock::duration::zero())
    {
        spdlog::debug(catenate("Rate limit reached. Waiting: ",
                               std::chrono::duration_cast<std::chrono::milliseconds>(wait_time).count(), " ms."));
        std::this_thread::sleep_for(wait_time);
    }
}    // -----  end of method RateLimiter::Acquire  -----

bool RateLimiter::TryAcquire()
{
    std::lock_guard<std::mutex> lk{m_};
    Refill(clock::now());
    if (tokens_ >= 1.0)
    {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}    // -----  end of method RateLimiter::TryAcquire  -----

RateLimiter::clock::duration RateLimiter::TimeUntilNextPermit()
{
    std::lock_guard<std::mutex> lk{m_};
    Refill(clock::now());
    if (tokens_ >= 1.0)
    {
        return clock::duration::zero();
    }
    return std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>{(1.0 - tokens_) / rate_});
}    // -----  end of method RateLimiter::TimeUntilNextPermit  -----
