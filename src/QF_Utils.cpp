/*
 * =====================================================================================
 *
 *       Filename:  QF_Utils.cpp
 *
 *    Description:  Routines shared by the selection, derivation and loading code.
 *
 *        Version:  1.0
 *        Created:  09/02/2025 11:02:51 AM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *         Author:  David P. Riedel (), driedel@cox.net
 *   Organization:
 *
 * =====================================================================================
 */

/* This file is part of QuarterlyFacts. */

/* QuarterlyFacts is free software: you can redistribute it and/or modify */
/* it under the terms of the GNU General Public License as published by */
/* the Free Software Foundation, either version 3 of the License, or */
/* (at your option) any later version. */

/* QuarterlyFacts is distributed in the hope that it will be useful, */
/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
/* GNU General Public License for more details. */

/* You should have received a copy of the GNU General Public License */
/* along with QuarterlyFacts.  If not, see <http://www.gnu.org/licenses/>. */

#include "QF_Utils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>

#include <range/v3/algorithm/find.hpp>

namespace rng = ranges;

#include <date/tz.h>

#include <spdlog/spdlog.h>

std::string
LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time) {
  auto t = date::make_zoned(date::current_zone(), a_date_time);
  std::string ts = date::format("%a, %b %d, %Y at %I:%M:%S %p %Z", t);
  return ts;
} // -----  end of function LocalDateTimeAsString  -----

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
 * ====================================================================== Name:
 * LoadDataFileForUse Description:
 * =====================================================================================
 */
std::string LoadDataFileForUse(const QF::FileName &file_name) {
  std::ifstream input_file{file_name.get(),
                           std::ios_base::in | std::ios_base::binary};
  if (!input_file) {
    throw QuarterlyFactsException(
        catenate("Unable to open file: ", file_name.get().string()));
  }
  std::string file_content(fs::file_size(file_name.get()), '\0');
  input_file.read(&file_content[0], file_content.size());
  input_file.close();

  return file_content;
} /* -----  end of function LoadDataFileForUse  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  QuarterlyFactsException
 *      Method:  QuarterlyFactsException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
QuarterlyFactsException::QuarterlyFactsException(const char *text)
    : std::runtime_error(text) {
} /* -----  end of method QuarterlyFactsException::QuarterlyFactsException
     (constructor) ----- */

QuarterlyFactsException::QuarterlyFactsException(const std::string &text)
    : std::runtime_error(text) {
} /* -----  end of method QuarterlyFactsException::QuarterlyFactsException
     (constructor) ----- */

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
 *       Class:  FactsFileException
 *      Method:  FactsFileException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
FactsFileException::FactsFileException(const char *text)
    : QuarterlyFactsException(text) {
} /* -----  end of method FactsFileException::FactsFileException  (constructor)
     ----- */

FactsFileException::FactsFileException(const std::string &text)
    : QuarterlyFactsException(text) {
} /* -----  end of method FactsFileException::FactsFileException  (constructor)
     ----- */

bool GroupHasConcept::operator()(const QF::FactGroup &group) const {
  return rng::find(concept_list_, group.concept_data->name) !=
         rng::end(concept_list_);
} /* -----  end of method GroupHasConcept::operator()  ----- */

bool GroupIsWithinYearRange::operator()(const QF::FactGroup &group) const {
  return (begin_year_ <= group.fiscal_year && group.fiscal_year <= end_year_);
} /* -----  end of method GroupIsWithinYearRange::operator()  ----- */

bool GroupHasNature::operator()(const QF::FactGroup &group) const {
  return group.concept_data->duration_nature == nature_;
} /* -----  end of method GroupHasNature::operator()  ----- */

std::string to_string(QF::PeriodMode mode) {
  switch (mode) {
  case QF::PeriodMode::e_instant:
    return "instant";
  case QF::PeriodMode::e_quarter:
    return "quarter";
  case QF::PeriodMode::e_semester:
    return "semester";
  case QF::PeriodMode::e_threeQuarter:
    return "threeQuarter";
  case QF::PeriodMode::e_year:
    return "year";
  case QF::PeriodMode::e_other:
    return "other";
  }
  return "other";
} // -----  end of function to_string  -----

std::string to_string(QF::CanonicalPeriod period) {
  switch (period) {
  case QF::CanonicalPeriod::e_Q1:
    return "Q1";
  case QF::CanonicalPeriod::e_Q2:
    return "Q2";
  case QF::CanonicalPeriod::e_Q3:
    return "Q3";
  case QF::CanonicalPeriod::e_Q4:
    return "Q4";
  case QF::CanonicalPeriod::e_FY:
    return "FY";
  }
  return "FY";
} // -----  end of function to_string  -----

std::string to_string(QF::SignConvention sign) {
  switch (sign) {
  case QF::SignConvention::e_debit:
    return "debit";
  case QF::SignConvention::e_credit:
    return "credit";
  case QF::SignConvention::e_none:
    return "none";
  case QF::SignConvention::e_unspecified:
    return "unspecified";
  }
  return "unspecified";
} // -----  end of function to_string  -----

std::string to_string(QF::Derivability derivability) {
  return derivability == QF::Derivability::e_derivable ? "derivable"
                                                       : "copy-only";
} // -----  end of function to_string  -----

QF::CanonicalPeriod StringToCanonicalPeriod(QF::sv text) {
  auto period = boost::algorithm::to_upper_copy(std::string{text});
  if (period == "Q1") {
    return QF::CanonicalPeriod::e_Q1;
  }
  if (period == "Q2") {
    return QF::CanonicalPeriod::e_Q2;
  }
  if (period == "Q3") {
    return QF::CanonicalPeriod::e_Q3;
  }
  if (period == "Q4") {
    return QF::CanonicalPeriod::e_Q4;
  }
  if (period == "FY") {
    return QF::CanonicalPeriod::e_FY;
  }
  throw QuarterlyFactsException(
      catenate("Unknown fiscal period: '", text, "'."));
} // -----  end of function StringToCanonicalPeriod  -----

QF::DurationNature StringToDurationNature(QF::sv text) {
  auto nature = boost::algorithm::to_lower_copy(std::string{text});
  if (nature == "instant") {
    return QF::DurationNature::e_instant;
  }
  if (nature == "duration") {
    return QF::DurationNature::e_duration;
  }
  throw QuarterlyFactsException(
      catenate("Unknown duration nature: '", text, "'."));
} // -----  end of function StringToDurationNature  -----

QF::SignConvention StringToSignConvention(QF::sv text) {
  // XBRL concepts without a 'balance' attribute come to us empty.

  auto sign = boost::algorithm::to_lower_copy(std::string{text});
  if (sign == "debit") {
    return QF::SignConvention::e_debit;
  }
  if (sign == "credit") {
    return QF::SignConvention::e_credit;
  }
  if (sign.empty() || sign == "none") {
    return QF::SignConvention::e_none;
  }
  spdlog::debug(catenate("Unrecognized sign convention: '", text,
                         "'. Treating as unspecified."));
  return QF::SignConvention::e_unspecified;
} // -----  end of function StringToSignConvention  -----

std::optional<QF::Derivability> StringToDerivability(QF::sv text) {
  auto derivability = boost::algorithm::to_lower_copy(std::string{text});
  if (derivability.empty()) {
    return std::nullopt;
  }
  if (derivability == "derivable") {
    return QF::Derivability::e_derivable;
  }
  if (derivability == "copy" || derivability == "copy-only") {
    return QF::Derivability::e_copy_only;
  }
  throw QuarterlyFactsException(
      catenate("Unknown derivability: '", text, "'."));
} // -----  end of function StringToDerivability  -----

namespace boost {
// these functions are declared in the library headers but left to the user to
// define. so here they are...
//
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
