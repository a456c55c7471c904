// =====================================================================================
//
//       Filename:  QuarterlySeries.cpp
//
//    Description:  build the quarterly series for 1 concept in 1 fiscal year.
//                  This is the entry point for callers.
//
//        Version:  1.0
//        Created:  09/08/2025 09:07:12 AM
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

#include "QuarterlySeries.h"

#include <fmt/format.h>

#include "spdlog/spdlog.h"

#include "Derivability.h"
#include "QF_Utils.h"

// ===  FUNCTION  ======================================================================
//         Name:  BuildQuarterlySeries
//  Description:
// =====================================================================================
QuarterlySeries BuildQuarterlySeries (const QF::FactGroup& group, const SeriesOptions& options)
{
    BOOST_ASSERT_MSG(group.concept_data, "Fact group has no concept metadata.");

    const auto& concept_data = *group.concept_data;

    QuarterlySeries series{.concept_name_ = concept_data.name, .fiscal_year_ = group.fiscal_year,
        .derivability_ = ClassifyDerivability(concept_data), .table_ = {}};

    const auto filed = SelectDirectPeriods(group, options.Q3_policy_);

    if (options.mode_ == SeriesMode::e_raw)
    {
        series.table_ = AsFiled(filed);
    }
    else
    {
        QuarterDeriver deriver{concept_data, filed};
        series.table_ = deriver();
    }

    spdlog::debug(catenate(series.concept_name_, ": ", series.fiscal_year_, ": ", to_string(series.derivability_),
        ". Resolved: ", series.table_.periods_.size(), " of 5 periods."));

    return series;
}		// -----  end of function BuildQuarterlySeries  -----

// ===  FUNCTION  ======================================================================
//         Name:  SeriesAsRows
//  Description:
// =====================================================================================
std::vector<std::string> SeriesAsRows (const QuarterlySeries& series, SeriesMode mode, PeriodFilter filter)
{
    std::vector<std::string> rows;

    auto add_row = [&series, &rows] (const std::string& label, const std::optional<SelectionResult>& result)
        {
            if (result)
            {
                // at most 15 significant digits so 77.5 - 29.9 prints as 47.6

                rows.push_back(fmt::format("{}\t{}\t{}\t{:.15g}\t{}", series.concept_name_, series.fiscal_year_, label,
                    result->value_, result->ProvenanceTag()));
            }
            else
            {
                rows.push_back(fmt::format("{}\t{}\t{}\t-\tabsent", series.concept_name_, series.fiscal_year_, label));
            }
        };

    const bool show_quarters = filter != PeriodFilter::e_yearly;
    const bool show_cumulative = mode == SeriesMode::e_raw && filter == PeriodFilter::e_all;
    const bool show_year = filter != PeriodFilter::e_quarterly;

    if (show_quarters)
    {
        add_row("Q1", series.table_.Find(QF::CanonicalPeriod::e_Q1));
        add_row("Q2", series.table_.Find(QF::CanonicalPeriod::e_Q2));
    }
    if (show_cumulative)
    {
        add_row(SEMESTER_LABEL, series.table_.semester_);
    }
    if (show_quarters)
    {
        add_row("Q3", series.table_.Find(QF::CanonicalPeriod::e_Q3));
    }
    if (show_cumulative)
    {
        add_row(THREE_QUARTER_LABEL, series.table_.three_quarter_);
    }
    if (show_quarters)
    {
        add_row("Q4", series.table_.Find(QF::CanonicalPeriod::e_Q4));
    }
    if (show_year)
    {
        add_row("FY", series.table_.Find(QF::CanonicalPeriod::e_FY));
    }
    return rows;
}		// -----  end of function SeriesAsRows  -----
