// =====================================================================================
//
//       Filename:  FactsFile.h
//
//    Description:  load the tab delimited facts listing produced by our
//                  XBRL extract into per concept, per fiscal year groups.
//
//        Version:  1.0
//        Created:  09/09/2025 01:14:50 PM
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

#ifndef _FACTSFILE_INC_
#define _FACTSFILE_INC_

#include <array>
#include <string>

#include "QuarterlyFacts.h"

// file layout:
//
//  # comment lines and blank lines are skipped
//  header line naming the columns (any order, 'fact_id' may be left out)
//  1 line per fact
//
// an empty start_date means an instant fact. An empty doc_period_end means the
// filing didn't give us one. decimals may be empty or 'INF'.
// The first line seen for a concept supplies that concept's metadata.

inline const std::array<std::string, 12> FACTS_FILE_COLUMNS{"concept", "tag", "nature", "balance", "decimals",
    "derivability", "fiscal_year", "filing_period", "start_date", "end_date", "doc_period_end", "value"};

inline const std::string FACT_ID_COLUMN{"fact_id"};

// groups come back ordered by concept name then fiscal year.

QF::FactGroupList ParseFactsContent(QF::FactsContent content);

QF::FactGroupList LoadFactsFile(const QF::FileName& file_name);

#endif /* ----- #ifndef _FACTSFILE_INC_  ----- */
