// =====================================================================================
//
//       Filename:  PeriodClassifier.cpp
//
//    Description:  map a reporting interval to the kind of period it covers.
//
//        Version:  1.0
//        Created:  09/03/2025 09:20:13 AM
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

#include "PeriodClassifier.h"

#include "QF_Utils.h"

// ===  FUNCTION  ======================================================================
//         Name:  ClassifyDuration
//  Description:  interval length in days to period mode
// =====================================================================================
QF::PeriodMode ClassifyDuration (int days)
{
    if (days >= 88 && days <= 95)
    {
        return QF::PeriodMode::e_quarter;
    }
    if (days >= 170 && days <= 185)
    {
        return QF::PeriodMode::e_semester;
    }
    if (days >= 260 && days <= 275)
    {
        return QF::PeriodMode::e_threeQuarter;
    }
    if (days >= 350 && days <= 373)
    {
        return QF::PeriodMode::e_year;
    }
    return QF::PeriodMode::e_other;
}		// -----  end of function ClassifyDuration  -----

// ===  FUNCTION  ======================================================================
//         Name:  ClassifyPeriod
//  Description:  no start date means a point in time.  An end before the start
//                gives a negative length which lands in 'other'.
// =====================================================================================
QF::PeriodMode ClassifyPeriod (const std::optional<date::year_month_day>& start_date, const date::year_month_day& end_date)
{
    if (! start_date)
    {
        return QF::PeriodMode::e_instant;
    }
    return ClassifyDuration(DaysBetween(start_date.value(), end_date));
}		// -----  end of function ClassifyPeriod  -----
