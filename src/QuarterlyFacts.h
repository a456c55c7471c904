// =====================================================================================
//
//       Filename:  QuarterlyFacts.h
//
//    Description:  holds some common type defs shared by the selection and
//                  derivation code.
//
//        Version:  1.0
//        Created:  09/02/2025 10:14:27 AM
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

#ifndef QUARTERLYFACTS_H_
#define QUARTERLYFACTS_H_


#include <array>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <date/date.h>

namespace QuarterlyFacts
{
    // thanks to Jonathan Boccara of fluentcpp.com for his articles on
    // Strong Types and the NamedType library.
    //
    // this code is a simplified and somewhat stripped down version of his.

    // =====================================================================================
    //        Class:  UniqType
    //  Description: Provides a wrapper which makes embedded common data types distinguisable
    // =====================================================================================

    template <typename T, typename Uniqueifier>
    class UniqType
    {
    public:
        // ====================  LIFECYCLE     =======================================

        UniqType() requires std::is_default_constructible_v<T>
            : value_{} {}

        UniqType(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_constructible_v<T>
            : value_{rhs.value_} {}

        explicit UniqType(T const& value) requires std::is_copy_constructible_v<T>
            : value_{value} {}

        UniqType(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_constructible_v<T>
            : value_(std::move(rhs.value_)) {}

        explicit UniqType(T&& value) requires std::is_move_constructible_v<T>
            : value_(std::move(value)) {}

        // ====================  ACCESSORS     =======================================

        T& get() { return value_; }
        const T& get() const { return value_; }

        // ====================  OPERATORS     =======================================

        UniqType& operator=(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = rhs.value_;
            }
            return *this;
        }
        UniqType& operator=(const T& rhs) requires std::is_copy_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = rhs;
            }
            return *this;
        }
        UniqType& operator=(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = std::move(rhs.value_);
            }
            return *this;
        }
        UniqType& operator=(T&& rhs) requires std::is_move_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = std::move(rhs);
            }
            return *this;
        }

    private:
        // ====================  DATA MEMBERS  =======================================

        T value_;

    }; // -----  end of class UniqType  -----

    using sv = std::string_view;
    using std::filesystem::path;

    using FileName = UniqType<path, struct FileNameTag>;
    using FactsContent = UniqType<sv, struct FactsContentTag>;

    // how long a reported interval is.  'other' is the catch-all and
    // never matches any selection rule.

    enum class PeriodMode
    {
        e_instant,
        e_quarter,
        e_semester,
        e_threeQuarter,
        e_year,
        e_other
    };

    // the periods we index our output by.

    enum class CanonicalPeriod
    {
        e_Q1,
        e_Q2,
        e_Q3,
        e_Q4,
        e_FY
    };

    constexpr std::array<CanonicalPeriod, 5> ALL_PERIODS{CanonicalPeriod::e_Q1, CanonicalPeriod::e_Q2,
        CanonicalPeriod::e_Q3, CanonicalPeriod::e_Q4, CanonicalPeriod::e_FY};

    enum class DurationNature
    {
        e_instant,
        e_duration
    };

    // XBRL 'balance' attribute.  'unspecified' means we were given something
    // we don't recognize.

    enum class SignConvention
    {
        e_debit,
        e_credit,
        e_none,
        e_unspecified
    };

    enum class Derivability
    {
        e_derivable,
        e_copy_only
    };

    // shared by all facts of one concept.  Never changes once built.

    struct ConceptMetadata
    {
        std::string name;
        std::string tag_text;
        DurationNature duration_nature = DurationNature::e_duration;
        SignConvention sign_convention = SignConvention::e_none;
        std::optional<int> decimals;                    // empty means 'INF'
        std::optional<Derivability> derivability;       // explicit override, if any
    };

    struct RawFact
    {
        double value = 0.0;
        std::optional<date::year_month_day> start_date;    // empty for instant facts
        date::year_month_day end_date;
        std::optional<date::year_month_day> doc_period_end;
        CanonicalPeriod filing_period = CanonicalPeriod::e_FY;
        std::string fact_ID;
    };

    // all the facts for 1 concept in 1 fiscal year plus the concept's metadata.

    struct FactGroup
    {
        std::shared_ptr<const ConceptMetadata> concept_data;
        int fiscal_year = 0;
        std::vector<RawFact> facts;
    };

    using FactGroupList = std::vector<FactGroup>;

    //  seems to be needed by boost program options.
    //  kept in our namespace so lexical_cast finds them by ADL.

    template <typename T, typename Uniqueifier>
    std::ostream& operator<<(std::ostream& os, const UniqType<T, Uniqueifier>& a_type)
    {
        os << a_type.get();
        return os;
    }

    template <typename T, typename Uniqueifier>
    std::istream& operator>>(std::istream& is, UniqType<T, Uniqueifier>& a_type)
    {
        T temp = a_type.get();
        is >> temp;
        a_type = temp;
        return is;
    }

}		// namespace QuarterlyFacts

namespace QF = QuarterlyFacts;

#endif /* end of include guard: QUARTERLYFACTS_H_ */
