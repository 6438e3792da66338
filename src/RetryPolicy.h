// =====================================================================================
//
//       Filename:  RetryPolicy.h
//
//    Description:  bounded retry with delay between attempts
//
//        Version:  1.0
//        Created:  10/03/2026 10:02:17 AM
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

#ifndef _RETRYPOLICY_INC_
#define _RETRYPOLICY_INC_

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

#include "Crawler_Utils.h"

enum class BackoffMode
{
    e_Fixed,
    e_Exponential
};

struct RetryPolicy
{
    int max_retries_{3};
    std::chrono::seconds retry_delay_{5};
    BackoffMode backoff_mode_{BackoffMode::e_Fixed};

    [[nodiscard]] std::chrono::seconds DelayBeforeRetry(int retry_number) const
    {
        return backoff_mode_ == BackoffMode::e_Fixed ? retry_delay_
                                                     : CalculateBackoffDelay(retry_number - 1, retry_delay_);
    }
};

template <typename T>
struct RetryOutcome
{
    std::optional<T> value_;
    int attempts_{0};
    std::vector<std::string> errors_;

    [[nodiscard]] bool succeeded() const { return value_.has_value(); }
    [[nodiscard]] std::string LastError() const { return errors_.empty() ? std::string{} : errors_.back(); }
};

// =====================================================================================
//  run 'op' up to 1 + max_retries times. Only exceptions of type Transient
//  (NetworkException by default) cause another attempt. Anything else
//  propagates to the caller untouched.
// =====================================================================================

template <typename Transient = NetworkException, typename Op>
auto RetryWithDelay(Op&& op, const RetryPolicy& policy, const std::string& description)
    -> RetryOutcome<std::invoke_result_t<Op>>
{
    BOOST_ASSERT_MSG(policy.max_retries_ >= 0, "max retries must be >= 0.");

    RetryOutcome<std::invoke_result_t<Op>> outcome;

    const int max_attempts = policy.max_retries_ + 1;
    for (int attempt = 1; attempt <= max_attempts; ++attempt)
    {
        outcome.attempts_ = attempt;
        try
        {
            outcome.value_.emplace(op());
            if (attempt > 1)
            {
                spdlog::info(catenate(description, ": succeeded on attempt: ", attempt, '.'));
            }
            return outcome;
        }
        catch (const Transient& e)
        {
            outcome.errors_.emplace_back(e.what());
            spdlog::warn(catenate(description, ": attempt ", attempt, " of ", max_attempts, " failed: ", e.what()));
        }

        if (attempt < max_attempts)
        {
            auto delay = policy.DelayBeforeRetry(attempt);
            if (delay > std::chrono::seconds::zero())
            {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    spdlog::error(catenate(description, ": giving up after: ", max_attempts, " attempts."));
    return outcome;
}

#endif   // ----- #ifndef _RETRYPOLICY_INC_  -----
