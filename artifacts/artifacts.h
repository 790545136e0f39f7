
//    --------------------------------------------------------------------
//
//    This file is part of eprune.
//
//    eprune is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    eprune is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with eprune. If not, see <http://www.gnu.org/licenses/>.
//
//    --------------------------------------------------------------------

#ifndef __ARTIFACTS_H__
#define __ARTIFACTS_H__

#include <string>

#include <Eigen/Dense>

#include "intervals/intervals.h"

struct timeline_t;

//
// Invalid-data detection: a sample column is invalid if any channel
// holds NaN; every maximal run of invalid columns becomes one span
//

// pure scan of a channels x samples matrix; empty set if nothing found
spanset_t nan_spans( const Eigen::MatrixXd & data );

// scan a timeline, adding any NaN-filled regions still pending; the
// result is stamped with the timeline's revision.  Throws
// invalid_span_error if a pending region lies off the timeline
spanset_t nan_spans( const timeline_t & timeline );

// one line per span, then a count/duration summary
void log_spans( const spanset_t & spans , double sr , const std::string & what );

#endif
