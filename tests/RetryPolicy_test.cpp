// =====================================================================================
//
//       Filename:  RetryPolicy_test.cpp
//
//    Description:  tests for retrying transient failures
//
//        Version:  1.0
//        Created:  10/12/2026 10:48:44 AM
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

#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "Crawler_Utils.h"
#include "RetryPolicy.h"

namespace
{

RetryPolicy NoDelay(int max_retries)
{
    return RetryPolicy{max_retries, std::chrono::seconds{0}, BackoffMode::e_Fixed};
}

}   // namespace

TEST(RetryWithDelay, SucceedsOnThirdAttempt)
{
    int calls{0};
    auto outcome = RetryWithDelay(
        [&calls]() {
            if (++calls < 3)
            {
                throw NetworkException("connection reset");
            }
            return std::string{"document"};
        },
        NoDelay(3), "test download");

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.value_.value(), "document");
    EXPECT_EQ(outcome.attempts_, 3);
    EXPECT_EQ(outcome.errors_.size(), 2U);
    EXPECT_EQ(calls, 3);
}

TEST(RetryWithDelay, GivesUpAfterMaxRetriesPlusOne)
{
    int calls{0};
    auto outcome = RetryWithDelay(
        [&calls]() -> int {
            ++calls;
            throw NetworkException("timed out");
        },
        NoDelay(1), "test download");

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.attempts_, 2);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(outcome.LastError(), "timed out");
}

TEST(RetryWithDelay, ZeroRetriesMeansOneAttempt)
{
    int calls{0};
    auto outcome = RetryWithDelay(
        [&calls]() -> int {
            ++calls;
            throw NetworkException("refused");
        },
        NoDelay(0), "test download");

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(calls, 1);
}

TEST(RetryWithDelay, PermanentErrorsAreNotRetried)
{
    int calls{0};
    EXPECT_THROW(RetryWithDelay(
                     [&calls]() -> int {
                         ++calls;
                         throw MaxFileSizeException("too big");
                     },
                     NoDelay(3), "test download"),
                 MaxFileSizeException);
    EXPECT_EQ(calls, 1);
}

TEST(RetryWithDelay, NegativeRetriesRejected)
{
    EXPECT_THROW(RetryWithDelay([]() { return 1; }, NoDelay(-1), "test"), AssertionException);
}

TEST(RetryPolicy, FixedAndExponentialDelays)
{
    RetryPolicy fixed{3, std::chrono::seconds{2}, BackoffMode::e_Fixed};
    EXPECT_EQ(fixed.DelayBeforeRetry(1), std::chrono::seconds{2});
    EXPECT_EQ(fixed.DelayBeforeRetry(3), std::chrono::seconds{2});

    RetryPolicy exponential{3, std::chrono::seconds{2}, BackoffMode::e_Exponential};
    EXPECT_EQ(exponential.DelayBeforeRetry(1), std::chrono::seconds{2});
    EXPECT_EQ(exponential.DelayBeforeRetry(2), std::chrono::seconds{4});
    EXPECT_EQ(exponential.DelayBeforeRetry(3), std::chrono::seconds{8});
}
