// =====================================================================================
//
//       Filename:  Crawler_Utils.h
//
//    Description:  Routines shared by the crawler, storage, parser and ratio modules.
//
//        Version:  1.0
//        Created:  10/02/2026 09:40:12 AM
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

#ifndef _CRAWLER_UTILS_INC_
#define _CRAWLER_UTILS_INC_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/assert.hpp>

#include <date/tz.h>

#include <fmt/format.h>

#include "Crawler.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

// custom fmtlib formatter for filesytem paths

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(const std::filesystem::path &p, FormatContext &ctx) const {
    std::string f_name = p.string();
    return formatter<std::string>::format(f_name, ctx);
  }
};

// custom fmtlib formatter for date year_month_day

template <>
struct fmt::formatter<date::year_month_day> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(date::year_month_day d, FormatContext &ctx) const {
    std::string s_date = date::format("%Y-%m-%d", d);
    return formatter<std::string>::format(s_date, ctx);
  }
};

template <typename... Ts> inline std::string catenate(Ts &&...ts) {

  constexpr auto N = sizeof...(Ts);

  // first, construct our format string

  std::string f_string;
  for (int i = 0; i < N; ++i) {
    f_string.append("{}");
  }

  return fmt::vformat(f_string, fmt::make_format_args(ts...));
}

// utility to convert a time_point to a string
// using Howard Hinnant's date library

inline std::string
LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time) {
  auto t = date::make_zoned(date::current_zone(), a_date_time);
  std::string ts = date::format("%a, %b %d, %Y at %I:%M:%S %p %Z", t);
  return ts;
}

// UTC, ISO 8601. used in our JSON output.

inline std::string
UTCDateTimeAsString(std::chrono::system_clock::time_point a_date_time) {
  return date::format(
      "%FT%TZ", date::floor<std::chrono::milliseconds>(a_date_time));
}

// seems we do this a lot too.

date::year_month_day StringToDateYMD(const std::string &input_format,
                                     const std::string &the_date);

// the SEC uses several date layouts. we try each of them in turn.

std::optional<date::year_month_day> TryParseSECDate(XC::sv the_date);
date::year_month_day ParseSECDate(XC::sv the_date);
std::string FormatSECDate(date::year_month_day the_date);

int FiscalQuarterFromDate(date::year_month_day the_date);

std::string LoadDataFileForUse(const XC::FileName &file_name);

// CIK and accession number handling

std::string PadCIK(XC::sv cik);
std::string UnpadCIK(XC::sv cik);
bool IsValidCIK(XC::sv cik);

struct AccessionNumberParts {
  std::string filer_id_;
  int year_ = 0;
  std::string sequence_;
};

AccessionNumberParts ParseAccessionNumber(XC::sv accession_number);
std::string BuildAccessionNumber(XC::sv filer_id, int year, int sequence);

// EDGAR URLs

std::string BuildSubmissionsURL(XC::sv cik);
std::string BuildCompanyFactsURL(XC::sv cik);
std::string BuildXBRL_URL(XC::sv cik, XC::sv accession_number);
std::string BuildPrimaryDocumentURL(XC::sv cik, XC::sv accession_number,
                                    XC::sv primary_document);

// sizes

std::string FormatFileSize(std::uint64_t bytes);
std::uint64_t ParseFileSize(XC::sv size_text);

std::chrono::seconds CalculateBackoffDelay(int attempt,
                                           std::chrono::seconds base_delay);

bool IsValidFormType(XC::sv form_type);
bool IsValidFiscalYear(int fiscal_year);
bool IsValidFiscalQuarter(int fiscal_quarter);

// so we can recognize our errors if we want to do something special
// crawling, storing and parsing each get their own exception type.

class CrawlerException : public std::runtime_error {
public:
  explicit CrawlerException(const char *what);

  explicit CrawlerException(const std::string &what);
};

class AssertionException : public std::invalid_argument {
public:
  explicit AssertionException(const char *what);

  explicit AssertionException(const std::string &what);
};

// transient problems talking to EDGAR. These, and only these, get retried.

class NetworkException : public CrawlerException {
public:
  explicit NetworkException(const char *what);

  explicit NetworkException(const std::string &what);
};

class StorageException : public CrawlerException {
public:
  explicit StorageException(const char *what);

  explicit StorageException(const std::string &what);
};

class XBRLException : public CrawlerException {
public:
  explicit XBRLException(const char *what);

  explicit XBRLException(const std::string &what);
};

// for clarity's sake

class MaxFileSizeException : public std::range_error {
public:
  explicit MaxFileSizeException(const char *what);

  explicit MaxFileSizeException(const std::string &what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(XC::sv string_data, char delim)
  requires std::is_same_v<T, std::string> || std::is_same_v<T, XC::sv>
{
  std::vector<T> results;
  for (auto it = 0; it != T::npos; ++it) {
    auto pos = string_data.find(delim, it);
    if (pos != T::npos) {
      results.emplace_back(string_data.substr(it, pos - it));
    } else {
      results.emplace_back(string_data.substr(it));
      break;
    }
    it = pos;
  }
  return results;
}

#endif /* ----- #ifndef _CRAWLER_UTILS_INC_  ----- */
