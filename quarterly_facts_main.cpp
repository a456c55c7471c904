// =====================================================================================
//
//       Filename:  quarterly_facts_main.cpp
//
//    Description:  Select and derive quarterly values from a listing of
//                  XBRL facts taken from 10-Q and 10-K filings.
//
//        Version:  1.0
//        Created:  09/10/2025 02:41:17 PM
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

#include <exception>
#include <iostream>
#include <tuple>

#include "spdlog/spdlog.h"

#include "QuarterlyFactsApp.h"

int main(int argc, char* argv[])
{
    auto result{0};

    try
    {
        QuarterlyFactsApp my_app{argc, argv};

        if (! my_app.Startup())
        {
            return 1;
        }

        const auto counters = my_app.Run();
        my_app.Shutdown();

        // some groups could not be processed.

        if (std::get<2>(counters) > 0)
        {
            result = 2;
        }
    }
    catch (std::exception& e)
    {
        spdlog::error(catenate("Problem running QuarterlyFacts: ", e.what()));
        std::cerr << e.what() << '\n';
        result = 1;
    }

    return result;
}        // -----  end of method main  -----
