// =====================================================================================
//
//       Filename:  RateLimiter.h
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

#ifndef _RATELIMITER_INC_
#define _RATELIMITER_INC_

#include <chrono>
#include <mutex>

// =====================================================================================
//        Class:  RateLimiter
//  Description:  continuously refilling token bucket. Capacity equals the
//                per-second ceiling so we can burst up to the ceiling but never
//                sustain more than that.
//
//                Acquire() reserves its slot while holding the lock and then
//                sleeps outside of it so the ceiling holds jointly for all
//                threads sharing one instance.
// =====================================================================================
class RateLimiter
{
public:
    using clock = std::chrono::steady_clock;

    // ====================  LIFECYCLE     =======================================

    explicit RateLimiter(double requests_per_second);

    RateLimiter() = delete;
    RateLimiter(const RateLimiter& rhs) = delete;
    RateLimiter(RateLimiter&& rhs) = delete;

    ~RateLimiter() = default;

    // SEC asks for no more than 10 requests per second.

    static double SEC_EDGAR_Rate() { return 10.0; }
    static double ConservativeRate() { return 5.0; }
    static double AggressiveRate() { return 20.0; }

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] double GetRate() const { return rate_; }

    [[nodiscard]] clock::duration TimeUntilNextPermit();

    // ====================  MUTATORS      =======================================

    // blocks until a request may be made.

    void Acquire();

    // takes a token only if one is available right now.

    bool TryAcquire();

    // ====================  OPERATORS     =======================================

    RateLimiter& operator=(const RateLimiter& rhs) = delete;
    RateLimiter& operator=(RateLimiter&& rhs) = delete;

private:
    // ====================  METHODS       =======================================

    void Refill(clock::time_point now);

    // ====================  DATA MEMBERS  =======================================

    std::mutex m_;

    const double rate_;
    const double capacity_;

    // goes negative when callers have reserved future slots.

    double tokens_;
    clock::time_point last_refill_;

}; // -----  end of class RateLimiter  -----

#endif   // ----- #ifndef _RATELIMITER_INC_  -----
