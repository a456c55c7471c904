// =====================================================================================
//
//       Filename:  Derivability.cpp
//
//    Description:  decide whether a concept's quarters can be reconstructed by
//                  subtracting cumulative values or must be copied.
//
//        Version:  1.0
//        Created:  09/04/2025 02:44:18 PM
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

#include "Derivability.h"

#include <boost/regex.hpp>

#include "spdlog/spdlog.h"

#include "QF_Utils.h"

// tags come to us either as XBRL local names (WeightedAverageNumberOfSharesOutstandingBasic,
// EarningsPerShareDiluted) or as labels (Earnings per share - basic) so allow for both.

const boost::regex regex_average{R"***(average)***", boost::regex_constants::normal | boost::regex_constants::icase};
const boost::regex regex_earnings_per_share{R"***(earnings[\s_-]*per[\s_-]*share)***",
    boost::regex_constants::normal | boost::regex_constants::icase};

bool TagMentionsAverage (QF::sv tag_text)
{
    return boost::regex_search(tag_text.begin(), tag_text.end(), regex_average);
}		// -----  end of function TagMentionsAverage  -----

bool TagMentionsEarningsPerShare (QF::sv tag_text)
{
    return boost::regex_search(tag_text.begin(), tag_text.end(), regex_earnings_per_share);
}		// -----  end of function TagMentionsEarningsPerShare  -----

// ===  FUNCTION  ======================================================================
//         Name:  ClassifyDerivability
//  Description:  total -- every concept is exactly one of derivable or copy-only
// =====================================================================================
QF::Derivability ClassifyDerivability (const QF::ConceptMetadata& concept_data)
{
    // balance sheet values are snapshots. There is nothing to subtract.

    if (concept_data.duration_nature == QF::DurationNature::e_instant)
    {
        return QF::Derivability::e_copy_only;
    }

    if (concept_data.derivability)
    {
        return concept_data.derivability.value();
    }

    if (TagMentionsAverage(concept_data.tag_text))
    {
        spdlog::debug(catenate(concept_data.name, ": tag: ", concept_data.tag_text, " is an average. Will copy, not subtract."));
        return QF::Derivability::e_copy_only;
    }

    if (TagMentionsEarningsPerShare(concept_data.tag_text))
    {
        return QF::Derivability::e_derivable;
    }

    switch (concept_data.sign_convention)
    {
        case QF::SignConvention::e_debit:
        case QF::SignConvention::e_credit:
        case QF::SignConvention::e_none:
            return QF::Derivability::e_derivable;

        case QF::SignConvention::e_unspecified:
            break;
    }

    spdlog::debug(catenate(concept_data.name, ": sign convention: ", to_string(concept_data.sign_convention),
        ". Defaulting to copy-only."));
    return QF::Derivability::e_copy_only;
}		// -----  end of function ClassifyDerivability  -----
