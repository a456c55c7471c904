// =====================================================================================
//
//       Filename:  QuarterlyFactsApp.h
//
//    Description:  main application
//
//        Version:  1.0
//        Created:  09/10/2025 09:18:33 AM
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

// =====================================================================================
//        Class:  QuarterlyFactsApp
//  Description:
// =====================================================================================

#ifndef QUARTERLYFACTSAPP_H_
#define QUARTERLYFACTSAPP_H_

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <tuple>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "QF_Utils.h"
#include "QuarterlyFacts.h"
#include "QuarterlySeries.h"

class QuarterlyFactsApp
{
public:
    QuarterlyFactsApp(int argc, char *argv[]);

    // use ctor below for testing with predefined options

    explicit QuarterlyFactsApp(const std::vector<std::string> &tokens);

    QuarterlyFactsApp() = delete;
    QuarterlyFactsApp(const QuarterlyFactsApp &rhs) = delete;
    QuarterlyFactsApp(QuarterlyFactsApp &&rhs) = delete;

    ~QuarterlyFactsApp() = default;

    QuarterlyFactsApp &operator=(const QuarterlyFactsApp &rhs) = delete;
    QuarterlyFactsApp &operator=(QuarterlyFactsApp &&rhs) = delete;

    bool Startup();
    std::tuple<int, int, int> Run();
    void Shutdown();

protected:
    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);
    void ParseConfigFile();

    void ConfigureLogging();

    bool CheckArgs();

    void BuildFilterList();
    [[nodiscard]] bool ApplyFilters(const QF::FactGroup &group) const;

    // success, skips, errors for 1 group.  The rows are only filled in on success.

    std::tuple<int, int, int> ProcessGroup(const QF::FactGroup &group, std::vector<std::string> *rows) const;

    std::tuple<int, int, int> ProcessGroups(const QF::FactGroupList &groups, std::ostream &output);
    std::tuple<int, int, int> ProcessGroupsConcurrently(const QF::FactGroupList &groups, std::ostream &output);

private:
    static void HandleSignal(int signal);

    // ====================  DATA MEMBERS  =======================================

    using FilterTypes = std::variant<GroupHasConcept, GroupIsWithinYearRange, GroupHasNature>;
    using FilterList = std::vector<FilterTypes>;

    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    int mArgc = 0;
    char **mArgv = nullptr;
    const std::vector<std::string> tokens_;

    std::string mode_{"derived"};
    std::string Q3_policy_{"cumulative"};
    std::string periods_{"all"};
    std::string concept_;
    std::string nature_;
    std::string logging_level_{"information"};

    std::vector<std::string> concept_list_;

    FilterList filters_;

    SeriesOptions series_options_;
    PeriodFilter period_filter_ = PeriodFilter::e_all;

    QF::FileName facts_file_name_;
    QF::FileName output_file_name_;
    QF::FileName log_file_path_name_;
    QF::FileName config_file_name_;

    std::shared_ptr<spdlog::logger> logger_;

    int begin_year_{-1};
    int end_year_{-1};
    int max_at_a_time_{-1}; // how many groups to evaluate at once

    static bool had_signal_;

}; // -----  end of class QuarterlyFactsApp  -----

#endif /* QUARTERLYFACTSAPP_H_ */
