/*
 * =====================================================================================
 *
 *       Filename:  QF_Utils.h
 *
 *    Description:  Routines shared by the selection, derivation and loading code.
 *
 *        Version:  1.0
 *        Created:  09/02/2025 10:41:09 AM
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

#ifndef _QF_UTILS_INC_
#define _QF_UTILS_INC_

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/assert.hpp>

#include <date/date.h>

#include <fmt/format.h>

#include "QuarterlyFacts.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

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

// let's add tuples...
// based on code techniques from C++17 STL Cookbook zipping tuples.
// (works for any class which supports the '+' operator)

template <typename... Ts>
std::tuple<Ts...> AddTs(std::tuple<Ts...> const &t1,
                        std::tuple<Ts...> const &t2) {
  auto z_([](auto... xs) {
    return [xs...](auto... ys) { return std::make_tuple((xs + ys)...); };
  });

  return std::apply(std::apply(z_, t1), t2);
}

// let's sum the contents of a single tuple
// (from C++ Templates...second edition p.58
// and C++17 STL Cookbook.

template <typename... Ts> auto SumT(const std::tuple<Ts...> &t) {
  auto z_([](auto... ys) { return (... + ys); });
  return std::apply(z_, t);
}

// used for our begin/end of run messages.
// using Howard Hinnant's date library

std::string
LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time);

// seems we do this a lot too.

date::year_month_day StringToDateYMD(const std::string &input_format,
                                     const std::string &the_date);

// number of days from 'begin' to 'end'. negative if end precedes begin.

inline int DaysBetween(const date::year_month_day &begin,
                       const date::year_month_day &end) {
  return (date::sys_days{end} - date::sys_days{begin}).count();
}

std::string LoadDataFileForUse(const QF::FileName &file_name);

// so we can recognize our errors if we want to do something special

class QuarterlyFactsException : public std::runtime_error {
public:
  explicit QuarterlyFactsException(const char *what);

  explicit QuarterlyFactsException(const std::string &what);
};

class AssertionException : public std::invalid_argument {
public:
  explicit AssertionException(const char *what);

  explicit AssertionException(const std::string &what);
};

class FactsFileException : public QuarterlyFactsException {
public:
  explicit FactsFileException(const char *what);

  explicit FactsFileException(const std::string &what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(QF::sv string_data, char delim)
  requires std::is_same_v<T, std::string> || std::is_same_v<T, QF::sv>
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

// filters used to decide which concepts and years to report on.

struct GroupHasConcept {
  explicit GroupHasConcept(const std::vector<std::string> &concept_list)
      : concept_list_{concept_list} {}

  bool operator()(const QF::FactGroup &group) const;

  const std::string filter_name_{"GroupHasConcept"};

  const std::vector<std::string> concept_list_;
};

struct GroupIsWithinYearRange {
  GroupIsWithinYearRange(int begin_year, int end_year)
      : begin_year_{begin_year}, end_year_{end_year} {}

  bool operator()(const QF::FactGroup &group) const;

  const std::string filter_name_{"GroupIsWithinYearRange"};

  const int begin_year_;
  const int end_year_;
};

// instant (balance sheet) or duration (flow) concepts only.

struct GroupHasNature {
  explicit GroupHasNature(QF::DurationNature nature) : nature_{nature} {}

  bool operator()(const QF::FactGroup &group) const;

  const std::string filter_name_{"GroupHasNature"};

  const QF::DurationNature nature_;
};

// names we use in logs and output.

std::string to_string(QF::PeriodMode mode);
std::string to_string(QF::CanonicalPeriod period);
std::string to_string(QF::SignConvention sign);
std::string to_string(QF::Derivability derivability);

// and going the other way.  These throw if the text isn't recognized except
// for the sign convention where anything unrecognized is 'unspecified'.

QF::CanonicalPeriod StringToCanonicalPeriod(QF::sv text);
QF::DurationNature StringToDurationNature(QF::sv text);
QF::SignConvention StringToSignConvention(QF::sv text);
std::optional<QF::Derivability> StringToDerivability(QF::sv text);

#endif /* ----- #ifndef _QF_UTILS_INC_  ----- */
