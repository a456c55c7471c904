// =====================================================================================
//
//       Filename:  QuarterlySeries.h
//
//    Description:  build the quarterly series for 1 concept in 1 fiscal year.
//                  This is the entry point for callers.
//
//        Version:  1.0
//        Created:  09/08/2025 08:52:30 AM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

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

#ifndef _QUARTERLYSERIES_INC_
#define _QUARTERLYSERIES_INC_

#include <string>
#include <vector>

#include "CandidateSelector.h"
#include "QuarterDeriver.h"
#include "QuarterlyFacts.h"

// 'raw' gives only what was filed so it can be checked against the filings.
// 'derived' fills in what can be computed.

enum class SeriesMode
{
    e_raw,
    e_derived
};

enum class PeriodFilter
{
    e_all,
    e_quarterly,
    e_yearly
};

struct SeriesOptions
{
    SeriesMode mode_ = SeriesMode::e_derived;
    Q3Policy Q3_policy_ = Q3Policy::e_cumulative_first;
};

struct QuarterlySeries
{
    std::string concept_name_;
    int fiscal_year_ = 0;
    QF::Derivability derivability_ = QF::Derivability::e_copy_only;
    SeriesTable table_;
};

// no I/O, no shared state. Same facts in, same series out.

[[nodiscard]] QuarterlySeries BuildQuarterlySeries(const QF::FactGroup& group, const SeriesOptions& options);

// tab delimited: concept, fiscal year, period, value, provenance.
// Periods are in calendar order: Q1, Q2, 6M, Q3, 9M, Q4, FY. The cumulative
// values only show up in raw mode. Missing values show as '-' and 'absent'.

[[nodiscard]] std::vector<std::string> SeriesAsRows(const QuarterlySeries& series, SeriesMode mode,
                                                    PeriodFilter filter);

#endif /* ----- #ifndef _QUARTERLYSERIES_INC_  ----- */
