// =====================================================================================
//
//       Filename:  QuarterDeriver.cpp
//
//    Description:  fill in the quarters which were not filed directly using
//                  the cumulative values which were.
//
//        Version:  1.0
//        Created:  09/05/2025 10:36:21 AM
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

#include "QuarterDeriver.h"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <range/v3/algorithm/for_each.hpp>

#include "spdlog/spdlog.h"

#include "Derivability.h"
#include "QF_Utils.h"

std::string SelectionResult::ProvenanceTag () const
{
    switch (provenance_)
    {
        case Provenance::e_direct:
            return "direct";
        case Provenance::e_derived:
            return catenate("derived:", formula_);
        case Provenance::e_copied:
            return catenate("copied:", formula_);
    }
    return "direct";
}		// -----  end of method SelectionResult::ProvenanceTag  -----

SelectionResult DirectResult (const QF::RawFact& fact)
{
    return SelectionResult{.value_ = fact.value, .provenance_ = Provenance::e_direct, .formula_ = {}, .sources_ = {fact}};
}		// -----  end of function DirectResult  -----

std::optional<SelectionResult> SeriesTable::Find (QF::CanonicalPeriod period) const
{
    if (auto pos = periods_.find(period); pos != periods_.end())
    {
        return pos->second;
    }
    return std::nullopt;
}		// -----  end of method SeriesTable::Find  -----

// ===  FUNCTION  ======================================================================
//         Name:  AsFiled
//  Description:  raw mode. Just the direct selections and the cumulative values.
// =====================================================================================
SeriesTable AsFiled (const PartialTable& filed)
{
    SeriesTable table;

    for (auto period : {QF::CanonicalPeriod::e_Q1, QF::CanonicalPeriod::e_Q2, QF::CanonicalPeriod::e_Q3, QF::CanonicalPeriod::e_FY})
    {
        if (const auto& fact = filed.Direct(period); fact)
        {
            table.periods_.emplace(period, DirectResult(fact.value()));
        }
    }
    if (filed.semester_)
    {
        table.semester_ = DirectResult(filed.semester_.value());
    }
    if (filed.three_quarter_)
    {
        table.three_quarter_ = DirectResult(filed.three_quarter_.value());
    }
    return table;
}		// -----  end of function AsFiled  -----

double RoundToDecimals (double value, std::optional<int> decimals)
{
    if (! decimals)
    {
        return value;
    }
    if (decimals.value() < 0)
    {
        return std::round(value);
    }
    const double scale = std::pow(10.0, decimals.value());
    return std::round(value * scale) / scale;
}		// -----  end of function RoundToDecimals  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  QuarterDeriver
 *      Method:  QuarterDeriver
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
QuarterDeriver::QuarterDeriver (const QF::ConceptMetadata& concept_data, const PartialTable& filed)
    : concept_data_{concept_data}, filed_{filed}, derivability_{ClassifyDerivability(concept_data)}
{
}  /* -----  end of method QuarterDeriver::QuarterDeriver  (constructor)  ----- */

SeriesTable QuarterDeriver::operator() () const
{
    SeriesTable table = AsFiled(filed_);

    if (concept_data_.duration_nature == QF::DurationNature::e_instant)
    {
        // a balance sheet at year end is the balance sheet at the end of Q4.

        if (auto FY = table.Find(QF::CanonicalPeriod::e_FY); FY)
        {
            table.periods_.emplace(QF::CanonicalPeriod::e_Q4, SelectionResult{.value_ = FY->value_,
                .provenance_ = Provenance::e_copied, .formula_ = "FY", .sources_ = FY->sources_});
        }
        return table;
    }

    // order matters. A derived Q2 can feed Q3 and a derived Q3 can feed Q4.

    if (! table.Has(QF::CanonicalPeriod::e_Q2))
    {
        if (auto Q2 = DeriveQ2(table); Q2)
        {
            table.periods_.emplace(QF::CanonicalPeriod::e_Q2, std::move(Q2.value()));
        }
    }
    if (! table.Has(QF::CanonicalPeriod::e_Q3))
    {
        if (auto Q3 = DeriveQ3(table); Q3)
        {
            table.periods_.emplace(QF::CanonicalPeriod::e_Q3, std::move(Q3.value()));
        }
    }
    if (auto Q4 = DeriveQ4(table); Q4)
    {
        table.periods_.insert_or_assign(QF::CanonicalPeriod::e_Q4, std::move(Q4.value()));
    }

    ranges::for_each(QF::ALL_PERIODS, [this, &table] (auto period)
        {
            if (! table.Has(period))
            {
                spdlog::debug(catenate(concept_data_.name, ": ", to_string(period), " not filed and can't be derived."));
            }
        });

    return table;
}		// -----  end of method QuarterDeriver::operator()  -----

// ===  FUNCTION  ======================================================================
//         Name:  DeriveQ2
//  Description:  Q2 = 6M - Q1
// =====================================================================================
std::optional<SelectionResult> QuarterDeriver::DeriveQ2 (const SeriesTable& table) const
{
    if (! table.semester_ || ! table.Has(QF::CanonicalPeriod::e_Q1))
    {
        return std::nullopt;
    }
    return SubtractOrCopy({SEMESTER_LABEL, table.semester_.value()},
        {{"Q1", table.periods_.at(QF::CanonicalPeriod::e_Q1)}});
}		// -----  end of method QuarterDeriver::DeriveQ2  -----

// ===  FUNCTION  ======================================================================
//         Name:  DeriveQ3
//  Description:  Q3 = 9M - 6M if we can, else Q3 = 9M - Q1 - Q2
// =====================================================================================
std::optional<SelectionResult> QuarterDeriver::DeriveQ3 (const SeriesTable& table) const
{
    if (! table.three_quarter_)
    {
        return std::nullopt;
    }
    if (table.semester_)
    {
        return SubtractOrCopy({THREE_QUARTER_LABEL, table.three_quarter_.value()},
            {{SEMESTER_LABEL, table.semester_.value()}});
    }
    if (table.Has(QF::CanonicalPeriod::e_Q1) && table.Has(QF::CanonicalPeriod::e_Q2))
    {
        return SubtractOrCopy({THREE_QUARTER_LABEL, table.three_quarter_.value()},
            {{"Q1", table.periods_.at(QF::CanonicalPeriod::e_Q1)}, {"Q2", table.periods_.at(QF::CanonicalPeriod::e_Q2)}});
    }
    return std::nullopt;
}		// -----  end of method QuarterDeriver::DeriveQ3  -----

// ===  FUNCTION  ======================================================================
//         Name:  DeriveQ4
//  Description:  Q4 = FY - 9M if we can, else Q4 = FY - Q1 - Q2 - Q3.
//                Nothing is filed for Q4 so this is always tried.
// =====================================================================================
std::optional<SelectionResult> QuarterDeriver::DeriveQ4 (const SeriesTable& table) const
{
    if (! table.Has(QF::CanonicalPeriod::e_FY))
    {
        return std::nullopt;
    }
    const auto& FY = table.periods_.at(QF::CanonicalPeriod::e_FY);

    if (table.three_quarter_)
    {
        return SubtractOrCopy({"FY", FY}, {{THREE_QUARTER_LABEL, table.three_quarter_.value()}});
    }
    if (table.Has(QF::CanonicalPeriod::e_Q1) && table.Has(QF::CanonicalPeriod::e_Q2) && table.Has(QF::CanonicalPeriod::e_Q3))
    {
        return SubtractOrCopy({"FY", FY}, {{"Q1", table.periods_.at(QF::CanonicalPeriod::e_Q1)},
            {"Q2", table.periods_.at(QF::CanonicalPeriod::e_Q2)}, {"Q3", table.periods_.at(QF::CanonicalPeriod::e_Q3)}});
    }
    return std::nullopt;
}		// -----  end of method QuarterDeriver::DeriveQ4  -----

SelectionResult QuarterDeriver::SubtractOrCopy (const Operand& minuend, const std::vector<Operand>& subtrahends) const
{
    SelectionResult result;

    if (derivability_ == QF::Derivability::e_copy_only)
    {
        result.value_ = minuend.result_.value_;
        result.provenance_ = Provenance::e_copied;
        result.formula_ = minuend.label_;
        result.sources_ = minuend.result_.sources_;

        spdlog::debug(catenate(concept_data_.name, ": copy-only concept. Copied: ", minuend.label_, " value: ", result.value_));
        return result;
    }

    double value = minuend.result_.value_;
    result.formula_ = minuend.label_;
    result.sources_ = minuend.result_.sources_;

    for (const auto& subtrahend : subtrahends)
    {
        value -= subtrahend.result_.value_;
        result.formula_ += '-';
        result.formula_ += subtrahend.label_;
        std::copy(subtrahend.result_.sources_.begin(), subtrahend.result_.sources_.end(), std::back_inserter(result.sources_));
    }

    result.value_ = RoundToDecimals(value, concept_data_.decimals);
    result.provenance_ = Provenance::e_derived;

    spdlog::debug(catenate(concept_data_.name, ": derived: ", result.formula_, " = ", result.value_));
    return result;
}		// -----  end of method QuarterDeriver::SubtractOrCopy  -----
