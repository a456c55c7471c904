// =====================================================================================
//
//       Filename:  FactsFile.cpp
//
//    Description:  load the tab delimited facts listing produced by our
//                  XBRL extract into per concept, per fiscal year groups.
//
//        Version:  1.0
//        Created:  09/09/2025 01:32:07 PM
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

#include "FactsFile.h"

#include <charconv>
#include <map>
#include <system_error>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "spdlog/spdlog.h"

#include "QF_Utils.h"

namespace
{
    using ColumnMap = std::map<std::string, std::size_t>;

    // ===  FUNCTION  ======================================================================
    //         Name:  ConvertField
    //  Description:  the whole field must convert.  '12abc' is an error, not 12.
    // =====================================================================================
    template<typename T>
    T ConvertField (QF::sv field, QF::sv column_name)
    {
        T result{};
        const auto* field_end = field.data() + field.size();
        if (auto [ptr, ec] = std::from_chars(field.data(), field_end, result); ec != std::errc() || ptr != field_end)
        {
            throw FactsFileException(catenate("Unable to convert column: ", column_name, " value: '", field, "'."));
        }
        return result;
    }		// -----  end of function ConvertField  -----

    std::optional<date::year_month_day> ConvertOptionalDate (QF::sv field)
    {
        if (field.empty())
        {
            return std::nullopt;
        }
        return StringToDateYMD("%F", std::string{field});
    }		// -----  end of function ConvertOptionalDate  -----

    std::optional<int> ConvertDecimals (QF::sv field)
    {
        if (field.empty() || boost::algorithm::iequals(field, "INF"))
        {
            return std::nullopt;
        }
        return ConvertField<int>(field, "decimals");
    }		// -----  end of function ConvertDecimals  -----

    // ===  FUNCTION  ======================================================================
    //         Name:  BuildColumnMap
    //  Description:  find where each of our columns is in this file.
    // =====================================================================================
    ColumnMap BuildColumnMap (const std::vector<QF::sv>& header_fields)
    {
        ColumnMap columns;
        for (std::size_t i = 0; i < header_fields.size(); ++i)
        {
            columns[boost::algorithm::trim_copy(std::string{header_fields[i]})] = i;
        }
        for (const auto& column_name : FACTS_FILE_COLUMNS)
        {
            if (! columns.contains(column_name))
            {
                throw FactsFileException(catenate("Facts file header is missing column: '", column_name, "'."));
            }
        }
        return columns;
    }		// -----  end of function BuildColumnMap  -----

    std::shared_ptr<const QF::ConceptMetadata> ConceptFromFields (const std::vector<QF::sv>& fields,
            const ColumnMap& columns)
    {
        auto concept_data = std::make_shared<QF::ConceptMetadata>();
        concept_data->name = fields[columns.at("concept")];
        concept_data->tag_text = fields[columns.at("tag")];
        concept_data->duration_nature = StringToDurationNature(fields[columns.at("nature")]);
        concept_data->sign_convention = StringToSignConvention(fields[columns.at("balance")]);
        concept_data->decimals = ConvertDecimals(fields[columns.at("decimals")]);
        concept_data->derivability = StringToDerivability(fields[columns.at("derivability")]);
        return concept_data;
    }		// -----  end of function ConceptFromFields  -----

    QF::RawFact FactFromFields (const std::vector<QF::sv>& fields, const ColumnMap& columns)
    {
        QF::RawFact fact;
        fact.value = ConvertField<double>(fields[columns.at("value")], "value");
        fact.start_date = ConvertOptionalDate(fields[columns.at("start_date")]);

        auto end_date = ConvertOptionalDate(fields[columns.at("end_date")]);
        if (! end_date)
        {
            throw FactsFileException("Fact has no end_date.");
        }
        fact.end_date = end_date.value();
        fact.doc_period_end = ConvertOptionalDate(fields[columns.at("doc_period_end")]);
        fact.filing_period = StringToCanonicalPeriod(fields[columns.at("filing_period")]);

        if (auto pos = columns.find(FACT_ID_COLUMN); pos != columns.end())
        {
            fact.fact_ID = fields[pos->second];
        }
        return fact;
    }		// -----  end of function FactFromFields  -----

}		// end of anonymous namespace

// ===  FUNCTION  ======================================================================
//         Name:  ParseFactsContent
//  Description:
// =====================================================================================
QF::FactGroupList ParseFactsContent (QF::FactsContent content)
{
    std::map<std::string, std::shared_ptr<const QF::ConceptMetadata>> concepts;
    std::map<std::pair<std::string, int>, QF::FactGroup> groups;

    std::optional<ColumnMap> columns;
    std::size_t expected_fields{0};

    int line_no{0};
    int fact_count{0};

    for (auto line : split_string<QF::sv>(content.get(), '\n'))
    {
        ++line_no;

        if (line.ends_with('\r'))
        {
            line.remove_suffix(1);
        }
        if (line.empty() || line.starts_with('#'))
        {
            continue;
        }

        auto fields = split_string<QF::sv>(line, '\t');

        try
        {
            if (! columns)
            {
                columns = BuildColumnMap(fields);
                expected_fields = fields.size();
                continue;
            }

            if (fields.size() != expected_fields)
            {
                throw FactsFileException(catenate("Expected: ", expected_fields, " fields. Found: ", fields.size(), "."));
            }

            std::string concept_name{fields[columns->at("concept")]};
            if (concept_name.empty())
            {
                throw FactsFileException("Concept name is empty.");
            }
            const int fiscal_year = ConvertField<int>(fields[columns->at("fiscal_year")], "fiscal_year");

            auto concept_pos = concepts.find(concept_name);
            if (concept_pos == concepts.end())
            {
                concept_pos = concepts.emplace(concept_name, ConceptFromFields(fields, columns.value())).first;
            }

            auto group_key = std::make_pair(concept_name, fiscal_year);
            auto group_pos = groups.find(group_key);
            if (group_pos == groups.end())
            {
                group_pos = groups.emplace(group_key, QF::FactGroup{.concept_data = concept_pos->second,
                    .fiscal_year = fiscal_year, .facts = {}}).first;
            }
            group_pos->second.facts.push_back(FactFromFields(fields, columns.value()));
            ++fact_count;
        }
        catch (const std::exception& e)
        {
            throw FactsFileException(catenate("Facts file line: ", line_no, ": ", e.what()));
        }
    }

    QF::FactGroupList results;
    results.reserve(groups.size());
    for (auto& [key, group] : groups)
    {
        results.push_back(std::move(group));
    }

    spdlog::debug(catenate("Loaded: ", fact_count, " facts for: ", concepts.size(), " concepts in: ",
        results.size(), " groups."));

    return results;
}		// -----  end of function ParseFactsContent  -----

// ===  FUNCTION  ======================================================================
//         Name:  LoadFactsFile
//  Description:
// =====================================================================================
QF::FactGroupList LoadFactsFile (const QF::FileName& file_name)
{
    const std::string content{LoadDataFileForUse(file_name)};
    try
    {
        return ParseFactsContent(QF::FactsContent{QF::sv{content}});
    }
    catch (const FactsFileException& e)
    {
        throw FactsFileException(catenate(file_name.get().string(), ": ", e.what()));
    }
}		// -----  end of function LoadFactsFile  -----
