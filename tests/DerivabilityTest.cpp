// =====================================================================================
//
//       Filename:  DerivabilityTest.cpp
//
//    Description:  tests for deciding which concepts may be subtracted.
//
//        Version:  1.0
//        Created:  09/11/2025 11:05:52 AM
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

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "Derivability.h"
#include "TestFacts.h"

using QF::Derivability;
using QF::SignConvention;

TEST_CASE("Tag text markers", "[derivability]")
{
    REQUIRE(TagMentionsAverage("WeightedAverageNumberOfSharesOutstandingBasic"));
    REQUIRE(TagMentionsAverage("Weighted average shares - diluted"));
    REQUIRE_FALSE(TagMentionsAverage("NetIncomeLoss"));

    REQUIRE(TagMentionsEarningsPerShare("EarningsPerShareDiluted"));
    REQUIRE(TagMentionsEarningsPerShare("Earnings per share - basic"));
    REQUIRE(TagMentionsEarningsPerShare("earnings_per_share"));
    REQUIRE_FALSE(TagMentionsEarningsPerShare("Earnings before taxes"));
}

TEST_CASE("Sign convention decides when the tag doesn't", "[derivability]")
{
    REQUIRE(ClassifyDerivability(*MakeConcept("Revenues", "Revenues", SignConvention::e_credit)) == Derivability::e_derivable);
    REQUIRE(ClassifyDerivability(*MakeConcept("CostOfRevenue", "CostOfRevenue", SignConvention::e_debit)) == Derivability::e_derivable);
    REQUIRE(ClassifyDerivability(*MakeConcept("NetCashProvidedByOperatingActivities",
        "NetCashProvidedByUsedInOperatingActivities", SignConvention::e_none)) == Derivability::e_derivable);
    REQUIRE(ClassifyDerivability(*MakeConcept("Mystery", "SomethingElse", SignConvention::e_unspecified)) == Derivability::e_copy_only);
}

TEST_CASE("Averages are never derivable from the tag or the sign", "[derivability]")
{
    for (auto sign : {SignConvention::e_debit, SignConvention::e_credit, SignConvention::e_none, SignConvention::e_unspecified})
    {
        auto concept_data = MakeConcept("WeightedAverageShares", "WeightedAverageNumberOfDilutedSharesOutstanding", sign);
        REQUIRE(ClassifyDerivability(*concept_data) == Derivability::e_copy_only);
    }
}

TEST_CASE("Earnings per share is derivable without a balance attribute", "[derivability]")
{
    REQUIRE(ClassifyDerivability(*MakeConcept("EPS", "EarningsPerShareBasic", SignConvention::e_unspecified)) == Derivability::e_derivable);
    REQUIRE(ClassifyDerivability(*MakeConcept("EPS", "EarningsPerShareBasic", SignConvention::e_none)) == Derivability::e_derivable);
}

TEST_CASE("Instant concepts are always copied", "[derivability]")
{
    auto cash = MakeConcept("Cash", "CashAndCashEquivalentsAtCarryingValue", SignConvention::e_debit,
        QF::DurationNature::e_instant, std::nullopt, Derivability::e_derivable);
    REQUIRE(ClassifyDerivability(*cash) == Derivability::e_copy_only);
}

TEST_CASE("An explicit derivability wins over the tag and sign", "[derivability]")
{
    auto average_but_additive = MakeConcept("AverageCost", "AverageCostOfSales", SignConvention::e_debit,
        QF::DurationNature::e_duration, std::nullopt, Derivability::e_derivable);
    REQUIRE(ClassifyDerivability(*average_but_additive) == Derivability::e_derivable);

    auto ratio = MakeConcept("GrossMargin", "GrossProfit", SignConvention::e_credit,
        QF::DurationNature::e_duration, std::nullopt, Derivability::e_copy_only);
    REQUIRE(ClassifyDerivability(*ratio) == Derivability::e_copy_only);
}
