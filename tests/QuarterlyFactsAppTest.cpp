// =====================================================================================
//
//       Filename:  QuarterlyFactsAppTest.cpp
//
//    Description:  run the whole application using predefined options.
//
//        Version:  1.0
//        Created:  09/12/2025 02:55:41 PM
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

#include <algorithm>
#include <fstream>
#include <sstream>

#include "QF_Utils.h"
#include "QuarterlyFactsApp.h"

namespace
{
    const std::string facts_listing{
        "concept\ttag\tnature\tbalance\tdecimals\tderivability\tfiscal_year\tfiling_period\tstart_date\tend_date\tdoc_period_end\tvalue\tfact_id\n"
        "NetCash\tNetCashProvidedByUsedInOperatingActivities\tduration\t\t1\t\t2024\tQ1\t2024-01-01\t2024-03-31\t2024-03-31\t29.9\ta1\n"
        "NetCash\tNetCashProvidedByUsedInOperatingActivities\tduration\t\t1\t\t2024\tQ2\t2024-01-01\t2024-06-30\t2024-06-30\t77.5\ta2\n"
        "NetCash\tNetCashProvidedByUsedInOperatingActivities\tduration\t\t1\t\t2024\tQ3\t2024-01-01\t2024-09-30\t2024-09-30\t121.25\ta3\n"
        "NetCash\tNetCashProvidedByUsedInOperatingActivities\tduration\t\t1\t\t2024\tFY\t2024-01-01\t2024-12-31\t2024-12-31\t242\ta4\n"
        "NetCash\tNetCashProvidedByUsedInOperatingActivities\tduration\t\t1\t\t2023\tFY\t2023-01-01\t2023-12-31\t2023-12-31\t200\tb4\n"
        "Shares\tWeightedAverageNumberOfDilutedSharesOutstanding\tduration\t\t\t\t2024\tQ1\t2024-01-01\t2024-03-31\t2024-03-31\t49854\tc1\n"
        "Shares\tWeightedAverageNumberOfDilutedSharesOutstanding\tduration\t\t\t\t2024\tQ2\t2024-04-01\t2024-06-30\t2024-06-30\t49854\tc2\n"
        "Shares\tWeightedAverageNumberOfDilutedSharesOutstanding\tduration\t\t\t\t2024\tQ3\t2024-07-01\t2024-09-30\t2024-09-30\t49854\tc3\n"
        "Shares\tWeightedAverageNumberOfDilutedSharesOutstanding\tduration\t\t\t\t2024\tFY\t2024-01-01\t2024-12-31\t2024-12-31\t49922\tc4\n"};

    struct AppFixture
    {
        AppFixture()
        {
            const auto test_dir = fs::temp_directory_path() / "QuarterlyFactsAppTest";
            fs::create_directories(test_dir);
            facts_path_ = test_dir / "facts.tsv";
            output_path_ = test_dir / "series.tsv";
            config_path_ = test_dir / "quarterly_facts.conf";

            std::ofstream facts_file{facts_path_};
            facts_file << facts_listing;
            fs::remove(output_path_);
        }

        ~AppFixture()
        {
            std::error_code ec;
            fs::remove_all(fs::temp_directory_path() / "QuarterlyFactsAppTest", ec);
        }

        std::vector<std::string> ReadOutput() const
        {
            const std::string content = LoadDataFileForUse(QF::FileName{output_path_});
            std::vector<std::string> lines;
            std::istringstream input{content};
            for (std::string line; std::getline(input, line); )
            {
                lines.push_back(line);
            }
            return lines;
        }

        fs::path facts_path_;
        fs::path output_path_;
        fs::path config_path_;
    };
}

TEST_CASE_METHOD(AppFixture, "Derived run writes every group", "[app]")
{
    QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "-o", output_path_.string(), "--log-level", "none"});
    REQUIRE(my_app.Startup());

    auto [success_counter, skipped_counter, error_counter] = my_app.Run();
    my_app.Shutdown();

    REQUIRE(success_counter == 3);
    REQUIRE(skipped_counter == 0);
    REQUIRE(error_counter == 0);

    auto lines = ReadOutput();
    REQUIRE(lines.size() == 1 + 3 * 5);
    REQUIRE(lines[0] == "concept\tfiscal_year\tperiod\tvalue\tprovenance");
    REQUIRE(lines[1] == "NetCash\t2023\tQ1\t-\tabsent");
    REQUIRE(lines[5] == "NetCash\t2023\tFY\t200\tdirect");
    REQUIRE(lines[7] == "NetCash\t2024\tQ2\t47.6\tderived:6M-Q1");
    REQUIRE(lines[8] == "NetCash\t2024\tQ3\t43.8\tderived:9M-6M");
    REQUIRE(lines[9] == "NetCash\t2024\tQ4\t120.8\tderived:FY-9M");
    REQUIRE(lines[14] == "Shares\t2024\tQ4\t49922\tcopied:FY");
}

TEST_CASE_METHOD(AppFixture, "Raw run with concept and year filters", "[app]")
{
    QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "-o", output_path_.string(), "--log-level", "none",
        "--mode", "raw", "--concept", "NetCash", "--begin-year", "2024", "--end-year", "2024"});
    REQUIRE(my_app.Startup());

    auto [success_counter, skipped_counter, error_counter] = my_app.Run();

    REQUIRE(success_counter == 1);
    REQUIRE(skipped_counter == 2);
    REQUIRE(error_counter == 0);

    auto lines = ReadOutput();
    REQUIRE(lines.size() == 1 + 7);
    REQUIRE(lines[3] == "NetCash\t2024\t6M\t77.5\tdirect");
    REQUIRE(lines[5] == "NetCash\t2024\t9M\t121.25\tdirect");
    REQUIRE(lines[6] == "NetCash\t2024\tQ4\t-\tabsent");
}

TEST_CASE_METHOD(AppFixture, "Instant and duration concepts can be reported separately", "[app]")
{
    {
        std::ofstream facts_file{facts_path_, std::ios::out | std::ios::app};
        facts_file << "Cash\tCashAndCashEquivalentsAtCarryingValue\tinstant\tdebit\t\t\t2024\tQ1\t\t2024-03-31\t2024-03-31\t90\td1\n"
                   << "Cash\tCashAndCashEquivalentsAtCarryingValue\tinstant\tdebit\t\t\t2024\tFY\t\t2024-12-31\t2024-12-31\t105\td4\n";
    }

    SECTION("instant only")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "-o", output_path_.string(),
            "--log-level", "none", "--nature", "instant"});
        REQUIRE(my_app.Startup());

        auto [success_counter, skipped_counter, error_counter] = my_app.Run();
        REQUIRE(success_counter == 1);
        REQUIRE(skipped_counter == 3);
        REQUIRE(error_counter == 0);

        std::vector<std::string> expected{
            "concept\tfiscal_year\tperiod\tvalue\tprovenance",
            "Cash\t2024\tQ1\t90\tdirect",
            "Cash\t2024\tQ2\t-\tabsent",
            "Cash\t2024\tQ3\t-\tabsent",
            "Cash\t2024\tQ4\t105\tcopied:FY",
            "Cash\t2024\tFY\t105\tdirect"
        };
        REQUIRE(ReadOutput() == expected);
    }
    SECTION("duration only")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "-o", output_path_.string(),
            "--log-level", "none", "--nature", "duration"});
        REQUIRE(my_app.Startup());

        auto [success_counter, skipped_counter, error_counter] = my_app.Run();
        REQUIRE(success_counter == 3);
        REQUIRE(skipped_counter == 1);
        REQUIRE(error_counter == 0);

        auto lines = ReadOutput();
        REQUIRE(lines.size() == 1 + 3 * 5);
        REQUIRE(std::none_of(lines.begin(), lines.end(), [](const auto& line) { return line.starts_with("Cash\t"); }));
    }
}

TEST_CASE_METHOD(AppFixture, "Concurrent run gives the same output", "[app]")
{
    QuarterlyFactsApp single_app(std::vector<std::string>{"-f", facts_path_.string(), "-o", output_path_.string(), "--log-level", "none"});
    REQUIRE(single_app.Startup());
    single_app.Run();
    auto single_lines = ReadOutput();

    QuarterlyFactsApp concurrent_app(std::vector<std::string>{"-f", facts_path_.string(), "-o", output_path_.string(), "--log-level", "none",
        "-k", "2"});
    REQUIRE(concurrent_app.Startup());
    auto [success_counter, skipped_counter, error_counter] = concurrent_app.Run();

    REQUIRE(success_counter == 3);
    REQUIRE(ReadOutput() == single_lines);
}

TEST_CASE_METHOD(AppFixture, "Options from a config file", "[app]")
{
    {
        std::ofstream config_file{config_path_};
        config_file << "mode = raw\n"
                    << "periods = yearly\n"
                    << "concept = Shares\n";
    }

    // the command line wins over the config file.

    QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "-o", output_path_.string(), "--log-level", "none",
        "--config-file", config_path_.string(), "--mode", "derived"});
    REQUIRE(my_app.Startup());
    my_app.Run();

    auto lines = ReadOutput();
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1] == "Shares\t2024\tFY\t49922\tdirect");
}

TEST_CASE_METHOD(AppFixture, "Bad options fail startup", "[app]")
{
    SECTION("unknown mode")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "--log-level", "none", "--mode", "cooked"});
        REQUIRE_FALSE(my_app.Startup());
    }
    SECTION("unknown nature")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "--log-level", "none", "--nature", "flow"});
        REQUIRE_FALSE(my_app.Startup());
    }
    SECTION("unknown Q3 policy")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "--log-level", "none", "--Q3-policy", "latest"});
        REQUIRE_FALSE(my_app.Startup());
    }
    SECTION("missing facts file")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"-f", (fs::temp_directory_path() / "no_such_facts.tsv").string(), "--log-level", "none"});
        REQUIRE_FALSE(my_app.Startup());
    }
    SECTION("years out of order")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"-f", facts_path_.string(), "--log-level", "none", "--begin-year", "2025",
            "--end-year", "2024"});
        REQUIRE_FALSE(my_app.Startup());
    }
    SECTION("no facts file given")
    {
        QuarterlyFactsApp my_app(std::vector<std::string>{"--log-level", "none"});
        REQUIRE_FALSE(my_app.Startup());
    }
}
