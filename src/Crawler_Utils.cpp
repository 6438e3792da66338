// =====================================================================================
//
//       Filename:  Crawler_Utils.cpp
//
//    Description:  Routines shared by the crawler, storage, parser and ratio modules.
//
//        Version:  1.0
//        Created:  10/02/2026 09:41:30 AM
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

#include "Crawler_Utils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if_not.hpp>

namespace rng = ranges;

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;

#include "Crawler.h"

// these are the forms EDGAR will hand us which we know about.

constexpr std::array<XC::sv, 25> kKnownFormTypes{
    "10-K",   "10-Q",    "8-K",    "20-F",    "6-K",    "11-K",   "DEF 14A",
    "PRE 14A", "4",      "3",      "5",       "144",    "S-1",    "S-3",
    "S-4",    "S-8",     "F-1",    "F-3",     "F-4",    "POS AM", "POS EX",
    "POS PRE", "POS UPD", "POS ASR", "POS COR"};

constexpr std::array<const char *, 4> kSECDateFormats{"%Y-%m-%d", "%Y%m%d",
                                                      "%m/%d/%Y", "%m-%d-%Y"};

date::year_month_day StringToDateYMD(const std::string &input_format,
                                     const std::string &the_date) {
  std::istringstream in{the_date};
  date::sys_days tp;
  date::from_stream(in, input_format.data(), tp);
  BOOST_ASSERT_MSG(!in.fail() && !in.bad(),
                   catenate("Unable to parse given date: ", the_date).c_str());
  date::year_month_day result = tp;
  BOOST_ASSERT_MSG(result.ok(), catenate("Invalid date: ", the_date).c_str());
  return result;
} // -----  end of method StringToDateYMD  -----

/*
 * ===  FUNCTION
 * ======================================================================
 *         Name:  TryParseSECDate
 *  Description:  the whole string must match one of the formats.
 * =====================================================================================
 */
std::optional<date::year_month_day> TryParseSECDate(XC::sv the_date) {
  std::string trimmed = boost::algorithm::trim_copy(std::string{the_date});
  if (trimmed.empty()) {
    return std::nullopt;
  }
  for (const auto *fmt : kSECDateFormats) {
    std::istringstream in{trimmed};
    date::sys_days tp;
    date::from_stream(in, fmt, tp);
    if (in.fail() || in.bad()) {
      continue;
    }
    std::string rest;
    in >> rest;
    if (!rest.empty()) {
      continue;
    }
    date::year_month_day result = tp;
    if (result.ok()) {
      return result;
    }
  }
  return std::nullopt;
} /* -----  end of function TryParseSECDate  ----- */

date::year_month_day ParseSECDate(XC::sv the_date) {
  auto result = TryParseSECDate(the_date);
  BOOST_ASSERT_MSG(result.has_value(),
                   catenate("Unable to parse date: '", the_date,
                            "'. Expected YYYY-MM-DD, YYYYMMDD, MM/DD/YYYY or "
                            "MM-DD-YYYY.")
                       .c_str());
  return result.value();
} /* -----  end of function ParseSECDate  ----- */

std::string FormatSECDate(date::year_month_day the_date) {
  return date::format("%Y%m%d", the_date);
} /* -----  end of function FormatSECDate  ----- */

int FiscalQuarterFromDate(date::year_month_day the_date) {
  return (static_cast<int>(static_cast<unsigned>(the_date.month())) - 1) / 3 +
         1;
} /* -----  end of function FiscalQuarterFromDate  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  CrawlerException
 *      Method:  CrawlerException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
CrawlerException::CrawlerException(const char *text)
    : std::runtime_error(text) {
} /* -----  end of method CrawlerException::CrawlerException  (constructor)
     ----- */

CrawlerException::CrawlerException(const std::string &text)
    : std::runtime_error(text) {
} /* -----  end of method CrawlerException::CrawlerException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AssertionException
 *      Method:  AssertionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AssertionException::AssertionException(const char *text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

AssertionException::AssertionException(const std::string &text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  NetworkException
 *      Method:  NetworkException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
NetworkException::NetworkException(const char *text)
    : CrawlerException(text) {
} /* -----  end of method NetworkException::NetworkException  (constructor)
     ----- */

NetworkException::NetworkException(const std::string &text)
    : CrawlerException(text) {
} /* -----  end of method NetworkException::NetworkException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StorageException
 *      Method:  StorageException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
StorageException::StorageException(const char *text)
    : CrawlerException(text) {
} /* -----  end of method StorageException::StorageException  (constructor)
     ----- */

StorageException::StorageException(const std::string &text)
    : CrawlerException(text) {
} /* -----  end of method StorageException::StorageException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  XBRLException
 *      Method:  XBRLException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
XBRLException::XBRLException(const char *text) : CrawlerException(text) {
} /* -----  end of method XBRLException::XBRLException  (constructor)  ----- */

XBRLException::XBRLException(const std::string &text)
    : CrawlerException(text) {
} /* -----  end of method XBRLException::XBRLException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  MaxFileSizeException
 *      Method:  MaxFileSizeException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
MaxFileSizeException::MaxFileSizeException(const char *text)
    : std::range_error(text) {
} /* -----  end of method MaxFileSizeException::MaxFileSizeException
     (constructor) ----- */

MaxFileSizeException::MaxFileSizeException(const std::string &text)
    : std::range_error(text) {
} /* -----  end of method MaxFileSizeException::MaxFileSizeException
     (constructor) ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * LoadDataFileForUse Description:
 * =====================================================================================
 */
std::string LoadDataFileForUse(const XC::FileName &file_name) {
  BOOST_ASSERT_MSG(fs::exists(file_name.get()),
                   catenate("Can't find file: ", file_name.get()).c_str());
  std::string file_content(fs::file_size(file_name.get()), '\0');
  std::ifstream input_file{std::string{file_name.get()},
                           std::ios_base::in | std::ios_base::binary};
  input_file.read(&file_content[0], file_content.size());
  input_file.close();

  return file_content;
} /* -----  end of function LoadDataFileForUse  ----- */

bool IsValidCIK(XC::sv cik) {
  return !cik.empty() && cik.size() <= 10 &&
         rng::all_of(cik, [](unsigned char c) { return std::isdigit(c) != 0; });
} /* -----  end of function IsValidCIK  ----- */

std::string PadCIK(XC::sv cik) {
  BOOST_ASSERT_MSG(IsValidCIK(cik),
                   catenate("Invalid CIK: '", cik,
                            "'. Must be 1 to 10 digits.")
                       .c_str());
  return fmt::format("{:0>10}", cik);
} /* -----  end of function PadCIK  ----- */

std::string UnpadCIK(XC::sv cik) {
  auto first_digit = rng::find_if_not(cik, [](char c) { return c == '0'; });
  if (first_digit == cik.end()) {
    return "0";
  }
  return std::string{first_digit, cik.end()};
} /* -----  end of function UnpadCIK  ----- */

/*
 * ===  FUNCTION
 * ======================================================================
 *         Name:  ParseAccessionNumber
 *  Description:  0000320193-23-000006 -> filer, year, sequence
 * =====================================================================================
 */
AccessionNumberParts ParseAccessionNumber(XC::sv accession_number) {
  auto parts = split_string<std::string>(accession_number, '-');
  BOOST_ASSERT_MSG(parts.size() == 3,
                   catenate("Invalid accession number format: ",
                            accession_number)
                       .c_str());
  BOOST_ASSERT_MSG(
      rng::all_of(parts,
                  [](const auto &p) {
                    return !p.empty() && rng::all_of(p, [](unsigned char c) {
                      return std::isdigit(c) != 0;
                    });
                  }),
      catenate("Invalid accession number format: ", accession_number).c_str());

  AccessionNumberParts result;
  result.filer_id_ = parts[0];
  result.year_ = std::stoi(parts[1]);
  if (result.year_ < 100) {
    result.year_ += 2000;
  }
  result.sequence_ = parts[2];
  return result;
} /* -----  end of function ParseAccessionNumber  ----- */

std::string BuildAccessionNumber(XC::sv filer_id, int year, int sequence) {
  return fmt::format("{:0>10}-{:02}-{:06}", filer_id, year % 100, sequence);
} /* -----  end of function BuildAccessionNumber  ----- */

std::string BuildSubmissionsURL(XC::sv cik) {
  return catenate("https://data.sec.gov/submissions/CIK", PadCIK(cik),
                  ".json");
} /* -----  end of function BuildSubmissionsURL  ----- */

std::string BuildCompanyFactsURL(XC::sv cik) {
  return catenate("https://data.sec.gov/api/xbrl/companyfacts/CIK",
                  PadCIK(cik), ".json");
} /* -----  end of function BuildCompanyFactsURL  ----- */

namespace {
std::string FilingDirectory(XC::sv cik, XC::sv accession_number) {
  std::string no_dashes{accession_number};
  std::erase(no_dashes, '-');
  return catenate("https://www.sec.gov/Archives/edgar/data/", UnpadCIK(cik),
                  '/', no_dashes, '/');
}
} // namespace

std::string BuildXBRL_URL(XC::sv cik, XC::sv accession_number) {
  return catenate(FilingDirectory(cik, accession_number), accession_number,
                  ".xbrl");
} /* -----  end of function BuildXBRL_URL  ----- */

std::string BuildPrimaryDocumentURL(XC::sv cik, XC::sv accession_number,
                                    XC::sv primary_document) {
  return catenate(FilingDirectory(cik, accession_number), primary_document);
} /* -----  end of function BuildPrimaryDocumentURL  ----- */

/*
 * ===  FUNCTION
 * ======================================================================
 *         Name:  FormatFileSize
 *  Description:  human readable, 1024 based.
 * =====================================================================================
 */
std::string FormatFileSize(std::uint64_t bytes) {
  constexpr std::array<const char *, 5> units{"B", "KB", "MB", "GB", "TB"};

  if (bytes == 0) {
    return "0 B";
  }

  double size = static_cast<double>(bytes);
  std::size_t unit_index = 0;
  while (size >= 1024.0 && unit_index < units.size() - 1) {
    size /= 1024.0;
    ++unit_index;
  }

  if (unit_index == 0) {
    return fmt::format("{} {}", bytes, units[unit_index]);
  }
  return fmt::format("{:.1f} {}", size, units[unit_index]);
} /* -----  end of function FormatFileSize  ----- */

std::uint64_t ParseFileSize(XC::sv size_text) {
  std::string size_str = boost::algorithm::to_upper_copy(
      boost::algorithm::trim_copy(std::string{size_text}));
  BOOST_ASSERT_MSG(!size_str.empty(), "Empty file size.");

  auto unit_start = rng::find_if_not(size_str, [](unsigned char c) {
    return std::isdigit(c) != 0 || c == '.';
  });
  std::string number_part{size_str.begin(), unit_start};
  std::string unit_part =
      boost::algorithm::trim_copy(std::string{unit_start, size_str.end()});

  BOOST_ASSERT_MSG(!number_part.empty(),
                   catenate("Invalid file size format: ", size_text).c_str());

  static const std::map<std::string, double> multipliers{
      {"", 1.0},
      {"B", 1.0},
      {"KB", 1024.0},
      {"MB", 1024.0 * 1024.0},
      {"GB", 1024.0 * 1024.0 * 1024.0},
      {"TB", 1024.0 * 1024.0 * 1024.0 * 1024.0}};

  auto multiplier = multipliers.find(unit_part);
  BOOST_ASSERT_MSG(multiplier != multipliers.end(),
                   catenate("Invalid file size format: ", size_text).c_str());

  double number{0.0};
  try {
    number = std::stod(number_part);
  } catch (const std::exception &e) {
    throw AssertionException(
        catenate("Invalid file size format: ", size_text, ": ", e.what()));
  }

  // 2^64 is the first value a uint64_t can't hold.

  const double size_in_bytes = number * multiplier->second;
  BOOST_ASSERT_MSG(std::isfinite(size_in_bytes) &&
                       size_in_bytes < std::ldexp(1.0, 64),
                   catenate("File size too large: ", size_text).c_str());
  return static_cast<std::uint64_t>(size_in_bytes);
} /* -----  end of function ParseFileSize  ----- */

std::chrono::seconds CalculateBackoffDelay(int attempt,
                                           std::chrono::seconds base_delay) {
  constexpr std::chrono::seconds max_delay{300};
  const auto factor = std::int64_t{1} << std::clamp(attempt, 0, 16);
  return std::min(std::chrono::seconds{base_delay.count() * factor},
                  max_delay);
} /* -----  end of function CalculateBackoffDelay  ----- */

bool IsValidFormType(XC::sv form_type) {
  return rng::find(kKnownFormTypes, form_type) != kKnownFormTypes.end();
} /* -----  end of function IsValidFormType  ----- */

bool IsValidFiscalYear(int fiscal_year) {
  return fiscal_year >= 1900 && fiscal_year <= 2100;
} /* -----  end of function IsValidFiscalYear  ----- */

bool IsValidFiscalQuarter(int fiscal_quarter) {
  return fiscal_quarter >= 1 && fiscal_quarter <= 4;
} /* -----  end of function IsValidFiscalQuarter  ----- */

namespace boost {
/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed_mgs Description: defined in boost header but left to us to
 * implement.
 * =====================================================================================
 */

void assertion_failed_msg(char const *expr, char const *msg,
                          char const *function, char const *file, long line) {
  throw AssertionException(catenate(
      "\n*** Assertion failed *** test: ", expr, " in function: ", function,
      " from file: ", file, " at line: ", line, ".\nassertion msg: ", msg));
} /* -----  end of function assertion_failed_mgs  ----- */

/*
 * ===  FUNCTION
 * ====================================================================== Name:
 * assertion_failed Description:
 * =====================================================================================
 */
void assertion_failed(char const *expr, char const *function, char const *file,
                      long line) {
  throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr,
                                    " in function: ", function,
                                    " from file: ", file, " at line: ", line));
} /* -----  end of function assertion_failed  ----- */
} /* end namespace boost */
