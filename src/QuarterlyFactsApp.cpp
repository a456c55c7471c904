// =====================================================================================
//
//       Filename:  QuarterlyFactsApp.cpp
//
//    Description:  main application
//
//        Version:  1.0
//        Created:  09/10/2025 09:27:14 AM
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

#include "QuarterlyFactsApp.h"

#include <algorithm>
#include <csignal>
#include <exception>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <system_error>

#include <range/v3/algorithm/for_each.hpp>

#include "spdlog/sinks/basic_file_sink.h"

#include "FactsFile.h"

using namespace std::string_literals;

bool QuarterlyFactsApp::had_signal_ = false;

/*
 *--------------------------------------------------------------------------------------
 *       Class:  QuarterlyFactsApp
 *      Method:  QuarterlyFactsApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
QuarterlyFactsApp::QuarterlyFactsApp (int argc, char* argv[])
    : mArgc{argc}, mArgv{argv}
{
}  /* -----  end of method QuarterlyFactsApp::QuarterlyFactsApp  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  QuarterlyFactsApp
 *      Method:  QuarterlyFactsApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
QuarterlyFactsApp::QuarterlyFactsApp (const std::vector<std::string>& tokens)
    : tokens_{tokens}
{
}  /* -----  end of method QuarterlyFactsApp::QuarterlyFactsApp  (constructor)  ----- */

void QuarterlyFactsApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.

    if (! log_file_path_name_.get().empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.get().filename();
        logger_ = spdlog::get(logger_name);
        if (! logger_)
        {
            fs::path log_dir = log_file_path_name_.get().parent_path();
            if (! log_dir.empty() && ! fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt(logger_name, log_file_path_name_.get().c_str());
            spdlog::set_default_logger(logger_);
        }
    }

    // we are running before 'CheckArgs' so we need to do a little editiing ourselves.

    std::map<std::string, spdlog::level::level_enum> levels
    {
        {"none", spdlog::level::off},
        {"error", spdlog::level::err},
        {"information", spdlog::level::info},
        {"debug", spdlog::level::debug}
    };

    auto which_level = levels.find(logging_level_);
    if (which_level != levels.end())
    {
        spdlog::set_level(which_level->second);
    }

}		/* -----  end of method QuarterlyFactsApp::ConfigureLogging  ----- */

bool QuarterlyFactsApp::Startup()
{
    spdlog::info(catenate("\n\n*** Begin run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
    bool result{true};
	try
	{
		SetupProgramOptions();
        if (tokens_.empty())
        {
            ParseProgramOptions();
        }
        else
        {
            ParseProgramOptions(tokens_);
        }
        ConfigureLogging();
		result = CheckArgs ();
	}
	catch(std::exception& e)
	{
        spdlog::error(catenate("Problem in startup: ", e.what(), '\n'));
		//	we're outta here!

		this->Shutdown();
        result = false;
    }
    return result;
}		/* -----  end of method QuarterlyFactsApp::Startup  ----- */

void QuarterlyFactsApp::SetupProgramOptions ()
{
    mNewOptions = std::make_unique<po::options_description>();

	mNewOptions->add_options()
		("help,h", "produce help message")
		("file,f", po::value<QF::FileName>(&facts_file_name_)->required(), "tab delimited file of facts to be processed.")
		("output,o", po::value<QF::FileName>(&output_file_name_), "file to write results to. Default is stdout.")
		("mode,m", po::value<std::string>(&mode_)->default_value("derived"),
         "Must be either 'raw' or 'derived'. Default is 'derived'.")
		("Q3-policy", po::value<std::string>(&Q3_policy_)->default_value("cumulative"),
         "which Q3 value wins when both are filed. Must be either 'cumulative' or 'direct'. Default is 'cumulative'.")
		("concept", po::value<std::string>(&concept_),
         "concept[s] we are processing. May be comma-delimited list. Default is all.")
		("nature", po::value<std::string>(&nature_),
         "only concepts measured at an instant or over a duration. Must be 'instant|duration'. Default is both.")
		("begin-year", po::value<int>(&begin_year_)->default_value(-1),
         "process fiscal years greater than or equal to. Default of -1 means no limit.")
		("end-year", po::value<int>(&end_year_)->default_value(-1),
         "process fiscal years less than or equal to. Default of -1 means no limit.")
		("periods", po::value<std::string>(&periods_)->default_value("all"),
         "periods to report. Must be 'all|quarterly|yearly'. Default is 'all'.")
		("log-level,l", po::value<std::string>(&logging_level_),
         "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		("log-path", po::value<QF::FileName>(&log_file_path_name_),	"path name for log file.")
		("concurrent,k", po::value<int>(&max_at_a_time_)->default_value(-1),
         "Maximun number of concept/year groups to evaluate at once. Default of -1 means 1 at a time.")
		("config-file", po::value<QF::FileName>(&config_file_name_),
         "file of 'option = value' lines. Command line values take precedence.")
		;
}		/* -----  end of method QuarterlyFactsApp::SetupProgramOptions  ----- */

void QuarterlyFactsApp::ParseProgramOptions ()
{
	auto options = po::parse_command_line(mArgc, mArgv, *mNewOptions);
	po::store(options, mVariableMap);
	if (this->mArgc == 1 ||	mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
    ParseConfigFile();
	po::notify(mVariableMap);

}		/* -----  end of method QuarterlyFactsApp::ParseProgramOptions  ----- */

void QuarterlyFactsApp::ParseProgramOptions (const std::vector<std::string>& tokens)
{
	auto options = po::command_line_parser(tokens).options(*mNewOptions).run();
	po::store(options, mVariableMap);
	if (mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
    ParseConfigFile();
	po::notify(mVariableMap);
}		/* -----  end of method QuarterlyFactsApp::ParseProgramOptions  ----- */

void QuarterlyFactsApp::ParseConfigFile ()
{
    // values already stored from the command line are not replaced.

    if (mVariableMap.count("config-file") == 0)
    {
        return;
    }
    const auto config_path = mVariableMap["config-file"].as<QF::FileName>().get();
    std::ifstream config_file{config_path};
    if (! config_file)
    {
        throw QuarterlyFactsException(catenate("Unable to open config file: ", config_path.string()));
    }
    po::store(po::parse_config_file(config_file, *mNewOptions), mVariableMap);
}		/* -----  end of method QuarterlyFactsApp::ParseConfigFile  ----- */

bool QuarterlyFactsApp::CheckArgs ()
{
    BOOST_ASSERT_MSG(fs::exists(facts_file_name_.get()), catenate("Can't find file: ", facts_file_name_.get().string()).c_str());
    BOOST_ASSERT_MSG(fs::is_regular_file(facts_file_name_.get()), catenate("Path :", facts_file_name_.get().string(),
                " is not a regular file.").c_str());

    BOOST_ASSERT_MSG(mode_ == "raw" || mode_ == "derived", "Mode must be: 'raw' or 'derived'.");
    series_options_.mode_ = (mode_ == "raw" ? SeriesMode::e_raw : SeriesMode::e_derived);

    BOOST_ASSERT_MSG(Q3_policy_ == "cumulative" || Q3_policy_ == "direct", "Q3-policy must be: 'cumulative' or 'direct'.");
    series_options_.Q3_policy_ = (Q3_policy_ == "direct" ? Q3Policy::e_direct_first : Q3Policy::e_cumulative_first);

    BOOST_ASSERT_MSG(periods_ == "all" || periods_ == "quarterly" || periods_ == "yearly",
            "Periods must be: 'all' or 'quarterly' or 'yearly'.");
    if (periods_ == "quarterly")
    {
        period_filter_ = PeriodFilter::e_quarterly;
    }
    else if (periods_ == "yearly")
    {
        period_filter_ = PeriodFilter::e_yearly;
    }

    //  the user may specify multiple concepts in a comma delimited list. We need to parse the entries out
    //  of that list and place into ultimate home.

    if (! concept_.empty())
    {
        concept_list_ = split_string<std::string>(concept_, ',');
        BOOST_ASSERT_MSG(std::none_of(concept_list_.cbegin(), concept_list_.cend(), [](const auto& e) { return e.empty(); }),
                "Concept list has an empty entry.");
    }

    BOOST_ASSERT_MSG(nature_.empty() || nature_ == "instant" || nature_ == "duration",
            "Nature must be: 'instant' or 'duration'.");

    if (begin_year_ > 0 && end_year_ > 0)
    {
        BOOST_ASSERT_MSG(begin_year_ <= end_year_, catenate("Begin year: ", begin_year_,
                    " is after end year: ", end_year_, ".").c_str());
    }
    if (begin_year_ < 0 && end_year_ < 0)
    {
        spdlog::info("Neither begin year nor end year specified. No year range filtering to be done.");
    }

    BuildFilterList();

    return true;
}		/* -----  end of method QuarterlyFactsApp::CheckArgs  ----- */

void QuarterlyFactsApp::BuildFilterList()
{
    if (begin_year_ > 0 || end_year_ > 0)
    {
        filters_.emplace_back(GroupIsWithinYearRange{begin_year_ > 0 ? begin_year_ : 0,
            end_year_ > 0 ? end_year_ : std::numeric_limits<int>::max()});
    }

    if (! concept_list_.empty())
    {
        filters_.emplace_back(GroupHasConcept{concept_list_});
    }

    if (! nature_.empty())
    {
        filters_.emplace_back(GroupHasNature{StringToDurationNature(nature_)});
    }
}		/* -----  end of method QuarterlyFactsApp::BuildFilterList  ----- */

bool QuarterlyFactsApp::ApplyFilters (const QF::FactGroup& group) const
{
    for (const auto& filter : filters_)
    {
        bool use_group = std::visit([&group](const auto& f) -> bool { return f(group); }, filter);
        if (! use_group)
        {
            spdlog::debug(catenate(group.concept_data->name, ": ", group.fiscal_year,
                ": skipped because of filter: ", std::visit([](const auto& f) -> std::string { return f.filter_name_; }, filter), "."));
            return false;
        }
    }
    return true;
}		/* -----  end of method QuarterlyFactsApp::ApplyFilters  ----- */

std::tuple<int, int, int> QuarterlyFactsApp::Run()
{
    const auto groups = LoadFactsFile(facts_file_name_);
    spdlog::info(catenate("Loaded: ", groups.size(), " concept/year groups from: ", facts_file_name_.get().string()));

    std::ofstream output_file;
    if (! output_file_name_.get().empty())
    {
        output_file.open(output_file_name_.get(), std::ios::out | std::ios::trunc);
        if (! output_file)
        {
            throw QuarterlyFactsException(catenate("Unable to open output file: ", output_file_name_.get().string()));
        }
    }
    std::ostream& output = output_file_name_.get().empty() ? std::cout : output_file;

    output << "concept\tfiscal_year\tperiod\tvalue\tprovenance\n";

    std::tuple<int, int, int> counters{0, 0, 0};

    if (max_at_a_time_ < 2)
    {
        counters = this->ProcessGroups(groups, output);
    }
    else
    {
        counters = this->ProcessGroupsConcurrently(groups, output);
    }

    output.flush();

    auto [success_counter, skipped_counter, error_counter] = counters;

    spdlog::info(catenate("Processed: ", SumT(counters), " groups. Successes: ",
            success_counter, ". Skips: ", skipped_counter , ". Errors: ", error_counter, "."));

    return counters;
}		/* -----  end of method QuarterlyFactsApp::Run  ----- */

std::tuple<int, int, int> QuarterlyFactsApp::ProcessGroup (const QF::FactGroup& group, std::vector<std::string>* rows) const
{
    if (! this->ApplyFilters(group))
    {
        return {0, 1, 0};
    }
    try
    {
        auto series = BuildQuarterlySeries(group, series_options_);
        *rows = SeriesAsRows(series, series_options_.mode_, period_filter_);
        return {1, 0, 0};
    }
    catch(const std::exception& e)
    {
        spdlog::error(catenate("Problem processing: ", group.concept_data->name, ": ", group.fiscal_year, ". ", e.what()));
        return {0, 0, 1};
    }
}		/* -----  end of method QuarterlyFactsApp::ProcessGroup  ----- */

std::tuple<int, int, int> QuarterlyFactsApp::ProcessGroups (const QF::FactGroupList& groups, std::ostream& output)
{
    std::tuple<int, int, int> counters{0, 0, 0};  // success, skips, errors

    ranges::for_each(groups, [this, &counters, &output] (const auto& group)
        {
            std::vector<std::string> rows;
            counters = AddTs(counters, this->ProcessGroup(group, &rows));
            ranges::for_each(rows, [&output] (const auto& row) { output << row << '\n'; });
        });

    return counters;
}		/* -----  end of method QuarterlyFactsApp::ProcessGroups  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  ProcessGroupsConcurrently
//  Description:  groups are independent so evaluate up to max_at_a_time_ of them at once.
//                Each batch is written out in group order before the next one starts.
// =====================================================================================
std::tuple<int, int, int> QuarterlyFactsApp::ProcessGroupsConcurrently (const QF::FactGroupList& groups, std::ostream& output)
{
    // a big facts file can take a while so provide a way to break into this
    // processing and shut it down cleanly.
    // so, a little bit of C...(taken from "Advanced Unix Programming" by Warren W. Gay, p. 317)

    struct sigaction sa_old;
    struct sigaction sa_new;

    sa_new.sa_handler = QuarterlyFactsApp::HandleSignal;
    sigemptyset(&sa_new.sa_mask);
    sa_new.sa_flags = 0;
    sigaction(SIGINT, &sa_new, &sa_old);

    QuarterlyFactsApp::had_signal_= false;

    // If some kind of system error occurs, it may affect more than 1 of
    // our our tasks so let's check each of them and log any exceptions
    // which occur. We'll then rethrow our first exception.

    std::exception_ptr ep{nullptr};

    std::tuple<int, int, int> counters{0, 0, 0};  // success, skips, errors

    std::vector<std::future<std::tuple<int, int, int>>> tasks;
    std::vector<std::vector<std::string>> batch_rows;

    for (std::size_t next_group = 0; next_group < groups.size() && ! ep; )
    {
        tasks.clear();
        batch_rows.clear();
        batch_rows.resize(std::min<std::size_t>(max_at_a_time_, groups.size() - next_group));

        for (auto& rows : batch_rows)
        {
            tasks.emplace_back(std::async(std::launch::async, &QuarterlyFactsApp::ProcessGroup, this,
                std::cref(groups[next_group]), &rows));
            ++next_group;
        }

        for (std::size_t i = 0; i < tasks.size(); ++i)
        {
            try
            {
                counters = AddTs(counters, tasks[i].get());
                ranges::for_each(batch_rows[i], [&output] (const auto& row) { output << row << '\n'; });
            }
            catch (std::system_error& e)
            {
                // any system problems, we eventually abort, but only after finishing work in process.

                spdlog::error(e.what());
                auto ec = e.code();
                spdlog::error(catenate("Category: ", ec.category().name(), ". Value: ", ec.value(),
                        ". Message: ", ec.message()));
                counters = AddTs(counters, {0, 0, 1});

                if (! ep)
                {
                    ep = std::current_exception();
                }
            }
        }

        if (QuarterlyFactsApp::had_signal_)
        {
            break;
        }
    }

    auto [success_counter, skipped_counter, error_counter] = counters;

    if (ep)
    {
        spdlog::error(catenate("Processed: ", SumT(counters), " groups. Successes: ", success_counter,
                ". Skips: ", skipped_counter, ". Errors: ", error_counter, "."));
        sigaction(SIGINT, &sa_old, 0);
        std::rethrow_exception(ep);
    }

    if (QuarterlyFactsApp::had_signal_)
    {
        spdlog::error(catenate("Processed: ", SumT(counters), " groups. Successes: ", success_counter,
                ". Skips: ", skipped_counter, ". Errors: ", error_counter, "."));
        sigaction(SIGINT, &sa_old, 0);
        throw std::runtime_error("Received keyboard interrupt.  Processing manually terminated after: "
            + std::to_string(SumT(counters)) + " groups.");
    }

    // if we return successfully, let's just restore the default

    sigaction(SIGINT, &sa_old, 0);

    return counters;
}		/* -----  end of method QuarterlyFactsApp::ProcessGroupsConcurrently  ----- */

void QuarterlyFactsApp::HandleSignal(int signal)

{
    std::signal(SIGINT, QuarterlyFactsApp::HandleSignal);

    // only thing we need to do

    QuarterlyFactsApp::had_signal_ = true;

}		/* -----  end of method QuarterlyFactsApp::HandleSignal  ----- */

void QuarterlyFactsApp::Shutdown ()
{
    spdlog::info(catenate("\n\n*** End run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
}       // -----  end of method QuarterlyFactsApp::Shutdown  -----
