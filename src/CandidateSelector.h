// =====================================================================================
//
//       Filename:  CandidateSelector.h
//
//    Description:  pick the one fact to use for each canonical period from
//                  all the facts filed for a concept in a fiscal year.
//
//        Version:  1.0
//        Created:  09/03/2025 01:47:02 PM
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

#ifndef _CANDIDATESELECTOR_INC_
#define _CANDIDATESELECTOR_INC_

#include <optional>
#include <vector>

#include "QuarterlyFacts.h"

// which Q3 source wins when a filing has both a 9 month cumulative value
// and a discrete 3 month value.

enum class Q3Policy
{
    e_cumulative_first,
    e_direct_first
};

// what was actually filed for 1 concept in 1 fiscal year.
// the 6 and 9 month cumulative values are kept apart from the quarters since
// they are inputs to the derivations, not answers.

struct PartialTable
{
    std::optional<QF::RawFact> Q1_;
    std::optional<QF::RawFact> Q2_;
    std::optional<QF::RawFact> Q3_;
    std::optional<QF::RawFact> FY_;
    std::optional<QF::RawFact> semester_;
    std::optional<QF::RawFact> three_quarter_;

    [[nodiscard]] const std::optional<QF::RawFact>& Direct(QF::CanonicalPeriod period) const;
};

// filings often carry the prior year's comparative value for the same
// period length. Prefer the fact which ends closest to the filing's own
// period end date.
// When that doesn't decide it (same distance or no period end date) prefer
// the later end date, then the later start date, then the larger value so
// the answer never depends on the order facts were given to us.

[[nodiscard]] bool PreferredFact(const QF::RawFact& lhs, const QF::RawFact& rhs);

[[nodiscard]] std::optional<int> DistanceToPeriodEnd(const QF::RawFact& fact);

[[nodiscard]] std::optional<QF::RawFact> PickPreferredFact(const std::vector<QF::RawFact>& candidates);

[[nodiscard]] std::vector<QF::RawFact> FindCandidates(const std::vector<QF::RawFact>& facts, QF::PeriodMode mode);

[[nodiscard]] std::vector<QF::RawFact> FactsFromFiling(const std::vector<QF::RawFact>& facts,
                                                       QF::CanonicalPeriod filing_period);

// the per-period rules. Each is given the facts from the filing(s) for that period.

[[nodiscard]] std::optional<QF::RawFact> SelectQ1(const std::vector<QF::RawFact>& facts);

// returns either a 'quarter' fact (direct Q2) or a 'semester' fact which can
// be used later to derive Q2. The semester fact is only returned if Q1 is known.

[[nodiscard]] std::optional<QF::RawFact> SelectQ2(const std::vector<QF::RawFact>& facts, bool have_Q1);

// returns either a 'threeQuarter' fact (to derive Q3 from) or a 'quarter' fact (direct Q3).
// The cumulative fact is only usable if the earlier periods needed to subtract
// from it are known.

[[nodiscard]] std::optional<QF::RawFact> SelectQ3(const std::vector<QF::RawFact>& facts, bool have_semester,
                                                  bool have_Q1_and_Q2, Q3Policy policy);

[[nodiscard]] std::optional<QF::RawFact> SelectFY(const std::vector<QF::RawFact>& facts);

[[nodiscard]] std::optional<QF::RawFact> SelectInstant(const std::vector<QF::RawFact>& facts);

[[nodiscard]] PartialTable SelectDirectPeriods(const QF::FactGroup& group, Q3Policy policy);

#endif /* ----- #ifndef _CANDIDATESELECTOR_INC_  ----- */
