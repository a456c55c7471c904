// =====================================================================================
//
//       Filename:  PeriodClassifier.h
//
//    Description:  map a reporting interval to the kind of period it covers.
//
//        Version:  1.0
//        Created:  09/03/2025 09:12:40 AM
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

#ifndef _PERIODCLASSIFIER_INC_
#define _PERIODCLASSIFIER_INC_

#include <optional>

#include <date/date.h>

#include "QuarterlyFacts.h"

// fiscal quarters are rarely exactly 91 days so the ranges are wide enough to
// absorb 52/53 week calendars and leap years without overlapping.

[[nodiscard]] QF::PeriodMode ClassifyDuration(int days);

[[nodiscard]] QF::PeriodMode ClassifyPeriod(const std::optional<date::year_month_day>& start_date,
                                            const date::year_month_day& end_date);

[[nodiscard]] inline QF::PeriodMode ClassifyPeriod(const QF::RawFact& fact)
{
    return ClassifyPeriod(fact.start_date, fact.end_date);
}

#endif /* ----- #ifndef _PERIODCLASSIFIER_INC_  ----- */
