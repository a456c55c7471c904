// =====================================================================================
//
//       Filename:  PeriodClassifierTest.cpp
//
//    Description:  tests for mapping reporting intervals to period modes.
//
//        Version:  1.0
//        Created:  09/11/2025 10:31:08 AM
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

#include <map>

#include "PeriodClassifier.h"
#include "TestFacts.h"

TEST_CASE("Facts without a start date are instants", "[classifier]")
{
    REQUIRE(ClassifyPeriod(std::nullopt, YMD("2024-12-31")) == QF::PeriodMode::e_instant);

    auto fact = MakeFact(100.0, "", "2024-06-30", QF::CanonicalPeriod::e_Q2);
    REQUIRE(ClassifyPeriod(fact) == QF::PeriodMode::e_instant);
}

TEST_CASE("Duration range edges", "[classifier]")
{
    REQUIRE(ClassifyDuration(87) == QF::PeriodMode::e_other);
    REQUIRE(ClassifyDuration(88) == QF::PeriodMode::e_quarter);
    REQUIRE(ClassifyDuration(95) == QF::PeriodMode::e_quarter);
    REQUIRE(ClassifyDuration(96) == QF::PeriodMode::e_other);

    REQUIRE(ClassifyDuration(169) == QF::PeriodMode::e_other);
    REQUIRE(ClassifyDuration(170) == QF::PeriodMode::e_semester);
    REQUIRE(ClassifyDuration(185) == QF::PeriodMode::e_semester);
    REQUIRE(ClassifyDuration(186) == QF::PeriodMode::e_other);

    REQUIRE(ClassifyDuration(259) == QF::PeriodMode::e_other);
    REQUIRE(ClassifyDuration(260) == QF::PeriodMode::e_threeQuarter);
    REQUIRE(ClassifyDuration(275) == QF::PeriodMode::e_threeQuarter);
    REQUIRE(ClassifyDuration(276) == QF::PeriodMode::e_other);

    REQUIRE(ClassifyDuration(349) == QF::PeriodMode::e_other);
    REQUIRE(ClassifyDuration(350) == QF::PeriodMode::e_year);
    REQUIRE(ClassifyDuration(373) == QF::PeriodMode::e_year);
    REQUIRE(ClassifyDuration(374) == QF::PeriodMode::e_other);
}

TEST_CASE("Typical fiscal calendars", "[classifier]")
{
    SECTION("calendar quarters")
    {
        REQUIRE(ClassifyPeriod(YMD("2024-01-01"), YMD("2024-03-31")) == QF::PeriodMode::e_quarter);
        REQUIRE(ClassifyPeriod(YMD("2024-01-01"), YMD("2024-06-30")) == QF::PeriodMode::e_semester);
        REQUIRE(ClassifyPeriod(YMD("2024-01-01"), YMD("2024-09-30")) == QF::PeriodMode::e_threeQuarter);
        REQUIRE(ClassifyPeriod(YMD("2024-01-01"), YMD("2024-12-31")) == QF::PeriodMode::e_year);
    }
    SECTION("52/53 week retail year")
    {
        REQUIRE(ClassifyPeriod(YMD("2025-05-04"), YMD("2025-08-02")) == QF::PeriodMode::e_quarter);
        REQUIRE(ClassifyPeriod(YMD("2025-02-02"), YMD("2025-08-02")) == QF::PeriodMode::e_semester);
        REQUIRE(ClassifyPeriod(YMD("2024-02-04"), YMD("2025-02-01")) == QF::PeriodMode::e_year);
    }
}

TEST_CASE("Malformed intervals are other", "[classifier]")
{
    REQUIRE(ClassifyPeriod(YMD("2024-03-31"), YMD("2024-01-01")) == QF::PeriodMode::e_other);
    REQUIRE(ClassifyPeriod(YMD("2024-03-31"), YMD("2024-03-31")) == QF::PeriodMode::e_other);
    REQUIRE(ClassifyPeriod(YMD("2020-01-01"), YMD("2024-12-31")) == QF::PeriodMode::e_other);
    REQUIRE(ClassifyDuration(-91) == QF::PeriodMode::e_other);
}

TEST_CASE("Each length lands in the expected mode", "[classifier]")
{
    std::map<QF::PeriodMode, int> counts;
    for (int days = -400; days <= 800; ++days)
    {
        ++counts[ClassifyDuration(days)];
    }

    REQUIRE(counts[QF::PeriodMode::e_quarter] == 8);
    REQUIRE(counts[QF::PeriodMode::e_semester] == 16);
    REQUIRE(counts[QF::PeriodMode::e_threeQuarter] == 16);
    REQUIRE(counts[QF::PeriodMode::e_year] == 24);
    REQUIRE(counts[QF::PeriodMode::e_instant] == 0);
    REQUIRE(counts[QF::PeriodMode::e_other] == 1201 - 8 - 16 - 16 - 24);
}
