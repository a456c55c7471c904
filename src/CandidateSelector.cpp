// =====================================================================================
//
//       Filename:  CandidateSelector.cpp
//
//    Description:  pick the one fact to use for each canonical period from
//                  all the facts filed for a concept in a fiscal year.
//
//        Version:  1.0
//        Created:  09/03/2025 02:05:36 PM
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

#include "CandidateSelector.h"

#include <cstdlib>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>

#include "spdlog/spdlog.h"

#include "PeriodClassifier.h"
#include "QF_Utils.h"

const std::optional<QF::RawFact>& PartialTable::Direct (QF::CanonicalPeriod period) const
{
    // Q4 is never filed directly so there is nothing to return for it.

    static const std::optional<QF::RawFact> not_filed;

    switch (period)
    {
        case QF::CanonicalPeriod::e_Q1:
            return Q1_;
        case QF::CanonicalPeriod::e_Q2:
            return Q2_;
        case QF::CanonicalPeriod::e_Q3:
            return Q3_;
        case QF::CanonicalPeriod::e_FY:
            return FY_;
        case QF::CanonicalPeriod::e_Q4:
            break;
    }
    return not_filed;
}		// -----  end of method PartialTable::Direct  -----

std::optional<int> DistanceToPeriodEnd (const QF::RawFact& fact)
{
    if (! fact.doc_period_end)
    {
        return std::nullopt;
    }
    return std::abs(DaysBetween(fact.doc_period_end.value(), fact.end_date));
}		// -----  end of function DistanceToPeriodEnd  -----

// ===  FUNCTION  ======================================================================
//         Name:  PreferredFact
//  Description:  strict weak ordering -- 'true' means lhs should be chosen over rhs
// =====================================================================================
bool PreferredFact (const QF::RawFact& lhs, const QF::RawFact& rhs)
{
    const auto lhs_distance = DistanceToPeriodEnd(lhs);
    const auto rhs_distance = DistanceToPeriodEnd(rhs);

    if (lhs_distance.has_value() != rhs_distance.has_value())
    {
        return lhs_distance.has_value();
    }
    if (lhs_distance && lhs_distance.value() != rhs_distance.value())
    {
        return lhs_distance.value() < rhs_distance.value();
    }
    if (lhs.end_date != rhs.end_date)
    {
        return lhs.end_date > rhs.end_date;
    }
    if (lhs.start_date != rhs.start_date)
    {
        return lhs.start_date > rhs.start_date;
    }
    return lhs.value > rhs.value;
}		// -----  end of function PreferredFact  -----

std::optional<QF::RawFact> PickPreferredFact (const std::vector<QF::RawFact>& candidates)
{
    if (candidates.empty())
    {
        return std::nullopt;
    }
    return *ranges::min_element(candidates, PreferredFact);
}		// -----  end of function PickPreferredFact  -----

std::vector<QF::RawFact> FindCandidates (const std::vector<QF::RawFact>& facts, QF::PeriodMode mode)
{
    return facts
        | ranges::views::filter([mode](const auto& fact) { return ClassifyPeriod(fact) == mode; })
        | ranges::to<std::vector<QF::RawFact>>();
}		// -----  end of function FindCandidates  -----

std::vector<QF::RawFact> FactsFromFiling (const std::vector<QF::RawFact>& facts, QF::CanonicalPeriod filing_period)
{
    return facts
        | ranges::views::filter([filing_period](const auto& fact) { return fact.filing_period == filing_period; })
        | ranges::to<std::vector<QF::RawFact>>();
}		// -----  end of function FactsFromFiling  -----

std::optional<QF::RawFact> SelectQ1 (const std::vector<QF::RawFact>& facts)
{
    return PickPreferredFact(FindCandidates(facts, QF::PeriodMode::e_quarter));
}		// -----  end of function SelectQ1  -----

// ===  FUNCTION  ======================================================================
//         Name:  SelectQ2
//  Description:  direct quarter first, 6 month cumulative only if Q1 is known
// =====================================================================================
std::optional<QF::RawFact> SelectQ2 (const std::vector<QF::RawFact>& facts, bool have_Q1)
{
    if (auto direct = PickPreferredFact(FindCandidates(facts, QF::PeriodMode::e_quarter)); direct)
    {
        return direct;
    }
    if (have_Q1)
    {
        return PickPreferredFact(FindCandidates(facts, QF::PeriodMode::e_semester));
    }
    return std::nullopt;
}		// -----  end of function SelectQ2  -----

// ===  FUNCTION  ======================================================================
//         Name:  SelectQ3
//  Description:  note this is the reverse of Q2.  By default the cumulative
//                value wins when it can be used.
// =====================================================================================
std::optional<QF::RawFact> SelectQ3 (const std::vector<QF::RawFact>& facts, bool have_semester,
        bool have_Q1_and_Q2, Q3Policy policy)
{
    const bool can_derive = have_semester || have_Q1_and_Q2;

    auto cumulative = PickPreferredFact(FindCandidates(facts, QF::PeriodMode::e_threeQuarter));
    auto direct = PickPreferredFact(FindCandidates(facts, QF::PeriodMode::e_quarter));

    if (policy == Q3Policy::e_direct_first && direct)
    {
        return direct;
    }
    if (cumulative && can_derive)
    {
        return cumulative;
    }
    return direct;
}		// -----  end of function SelectQ3  -----

// ===  FUNCTION  ======================================================================
//         Name:  SelectFY
//  Description:  year < quarter < other.  Use the best ranked mode we have.
// =====================================================================================
std::optional<QF::RawFact> SelectFY (const std::vector<QF::RawFact>& facts)
{
    for (auto mode : {QF::PeriodMode::e_year, QF::PeriodMode::e_quarter, QF::PeriodMode::e_other})
    {
        if (auto best = PickPreferredFact(FindCandidates(facts, mode)); best)
        {
            if (mode != QF::PeriodMode::e_year)
            {
                spdlog::debug(catenate("No full year fact found. Using: ", to_string(mode), " fact ending: ",
                    best->end_date, " for FY."));
            }
            return best;
        }
    }
    return std::nullopt;
}		// -----  end of function SelectFY  -----

std::optional<QF::RawFact> SelectInstant (const std::vector<QF::RawFact>& facts)
{
    return PickPreferredFact(FindCandidates(facts, QF::PeriodMode::e_instant));
}		// -----  end of function SelectInstant  -----

// ===  FUNCTION  ======================================================================
//         Name:  SelectDirectPeriods
//  Description:  build the table of what was actually filed
// =====================================================================================
PartialTable SelectDirectPeriods (const QF::FactGroup& group, Q3Policy policy)
{
    PartialTable table;

    const auto& concept_name = group.concept_data->name;

    if (ranges::any_of(group.facts, [](const auto& fact) { return fact.filing_period == QF::CanonicalPeriod::e_Q4; }))
    {
        spdlog::debug(catenate(concept_name, ": ", group.fiscal_year, ": ignoring facts from Q4 filing."));
    }

    const auto Q1_facts = FactsFromFiling(group.facts, QF::CanonicalPeriod::e_Q1);
    const auto Q2_facts = FactsFromFiling(group.facts, QF::CanonicalPeriod::e_Q2);
    const auto Q3_facts = FactsFromFiling(group.facts, QF::CanonicalPeriod::e_Q3);
    const auto FY_facts = FactsFromFiling(group.facts, QF::CanonicalPeriod::e_FY);

    if (group.concept_data->duration_nature == QF::DurationNature::e_instant)
    {
        table.Q1_ = SelectInstant(Q1_facts);
        table.Q2_ = SelectInstant(Q2_facts);
        table.Q3_ = SelectInstant(Q3_facts);
        table.FY_ = SelectInstant(FY_facts);
        return table;
    }

    table.Q1_ = SelectQ1(Q1_facts);

    // the 6 month value is kept whether or not Q1 is known. Q3 can be derived from it
    // without Q1. The Q1 gate only applies to deriving Q2.

    table.semester_ = PickPreferredFact(FindCandidates(Q2_facts, QF::PeriodMode::e_semester));

    if (auto Q2 = SelectQ2(Q2_facts, table.Q1_.has_value()); Q2 && ClassifyPeriod(Q2.value()) == QF::PeriodMode::e_quarter)
    {
        table.Q2_ = std::move(Q2);
    }

    if (auto Q3 = SelectQ3(Q3_facts, table.semester_.has_value(), table.Q1_ && table.Q2_, policy); Q3)
    {
        if (ClassifyPeriod(Q3.value()) == QF::PeriodMode::e_quarter)
        {
            table.Q3_ = std::move(Q3);
        }
        else
        {
            table.three_quarter_ = std::move(Q3);
        }
    }

    // the 9 month value is what Q4 is usually derived from so always keep it.

    if (! table.three_quarter_)
    {
        table.three_quarter_ = PickPreferredFact(FindCandidates(Q3_facts, QF::PeriodMode::e_threeQuarter));
    }

    table.FY_ = SelectFY(FY_facts);

    spdlog::debug(catenate(concept_name, ": ", group.fiscal_year, ": filed: Q1: ", table.Q1_.has_value(),
        " Q2: ", table.Q2_.has_value(), " 6M: ", table.semester_.has_value(), " Q3: ", table.Q3_.has_value(),
        " 9M: ", table.three_quarter_.has_value(), " FY: ", table.FY_.has_value()));

    return table;
}		// -----  end of function SelectDirectPeriods  -----
