// =====================================================================================
//
//       Filename:  Derivability.h
//
//    Description:  decide whether a concept's quarters can be reconstructed by
//                  subtracting cumulative values or must be copied.
//
//        Version:  1.0
//        Created:  09/04/2025 02:31:55 PM
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

#ifndef _DERIVABILITY_INC_
#define _DERIVABILITY_INC_

#include "QuarterlyFacts.h"

// rules are applied in this order, first match wins:
//
//  instant concept                     -> copy-only
//  explicit derivability on concept    -> as given
//  tag mentions 'average'              -> copy-only
//  tag mentions earnings per share     -> derivable
//  sign convention debit/credit/none   -> derivable
//  anything else                       -> copy-only
//
// the 'average' test must come before the sign convention tests since
// weighted average share counts usually have no balance attribute.

[[nodiscard]] QF::Derivability ClassifyDerivability(const QF::ConceptMetadata& concept_data);

[[nodiscard]] bool TagMentionsAverage(QF::sv tag_text);

[[nodiscard]] bool TagMentionsEarningsPerShare(QF::sv tag_text);

#endif /* ----- #ifndef _DERIVABILITY_INC_  ----- */
