// =====================================================================================
//
//       Filename:  QuarterDeriver.h
//
//    Description:  fill in the quarters which were not filed directly using
//                  the cumulative values which were.
//
//        Version:  1.0
//        Created:  09/05/2025 10:03:48 AM
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

#ifndef _QUARTERDERIVER_INC_
#define _QUARTERDERIVER_INC_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "CandidateSelector.h"
#include "QuarterlyFacts.h"

// labels used in formulas for the 6 and 9 month cumulative values.

inline const std::string SEMESTER_LABEL{"6M"};
inline const std::string THREE_QUARTER_LABEL{"9M"};

enum class Provenance
{
    e_direct,
    e_derived,
    e_copied
};

// a value for 1 period along with where it came from.
// formula_ is empty for direct values, the arithmetic used for derived values
// (e.g. 'FY-9M') and the period copied from for copied values (e.g. 'FY').
// sources_ holds every filed fact the value rests on.

struct SelectionResult
{
    double value_ = 0.0;
    Provenance provenance_ = Provenance::e_direct;
    std::string formula_;
    std::vector<QF::RawFact> sources_;

    // 'direct', 'derived:<formula>' or 'copied:<source>'

    [[nodiscard]] std::string ProvenanceTag() const;
};

[[nodiscard]] SelectionResult DirectResult(const QF::RawFact& fact);

// a missing period is simply not in the map. We never put a zero in its place.

struct SeriesTable
{
    std::map<QF::CanonicalPeriod, SelectionResult> periods_;
    std::optional<SelectionResult> semester_;
    std::optional<SelectionResult> three_quarter_;

    [[nodiscard]] std::optional<SelectionResult> Find(QF::CanonicalPeriod period) const;
    [[nodiscard]] bool Has(QF::CanonicalPeriod period) const { return periods_.contains(period); }
};

// what we have when nothing is derived.

[[nodiscard]] SeriesTable AsFiled(const PartialTable& filed);

// match the precision of the filed values.
// decimals >= 0 means that many places, < 0 means whole numbers
// (the value is in thousands, millions...). No decimals means leave it alone.

[[nodiscard]] double RoundToDecimals(double value, std::optional<int> decimals);

// =====================================================================================
//        Class:  QuarterDeriver
//  Description:  Q2, Q3 then Q4.  Each step may use the results of the earlier ones
//                but only for the same concept and fiscal year.
// =====================================================================================

class QuarterDeriver
{
   public:
    // ====================  LIFECYCLE     =======================================

    QuarterDeriver(const QF::ConceptMetadata& concept_data, const PartialTable& filed);

    QuarterDeriver() = delete;
    QuarterDeriver(const QuarterDeriver& rhs) = delete;
    QuarterDeriver(QuarterDeriver&& rhs) = delete;

    ~QuarterDeriver() = default;

    QuarterDeriver& operator=(const QuarterDeriver& rhs) = delete;
    QuarterDeriver& operator=(QuarterDeriver&& rhs) = delete;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] QF::Derivability GetDerivability() const { return derivability_; }

    // ====================  OPERATORS     =======================================

    [[nodiscard]] SeriesTable operator()() const;

   private:
    struct Operand
    {
        std::string label_;
        const SelectionResult& result_;
    };

    // ====================  METHODS       =======================================

    [[nodiscard]] std::optional<SelectionResult> DeriveQ2(const SeriesTable& table) const;
    [[nodiscard]] std::optional<SelectionResult> DeriveQ3(const SeriesTable& table) const;
    [[nodiscard]] std::optional<SelectionResult> DeriveQ4(const SeriesTable& table) const;

    // subtract when we can, copy the minuend when we can't.

    [[nodiscard]] SelectionResult SubtractOrCopy(const Operand& minuend, const std::vector<Operand>& subtrahends) const;

    // ====================  DATA MEMBERS  =======================================

    const QF::ConceptMetadata& concept_data_;
    const PartialTable& filed_;
    const QF::Derivability derivability_;

};    // -----  end of class QuarterDeriver  -----

#endif /* ----- #ifndef _QUARTERDERIVER_INC_  ----- */
