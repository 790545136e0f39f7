
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

#ifndef __EPRUNE_EXCISE_H__
#define __EPRUNE_EXCISE_H__

#include "timeline/timeline.h"
#include "intervals/intervals.h"

//
// Result of removing (or NaN-filling) a set of spans
//

struct excision_t {

  excision_t() : removed(0) , dropped(0) , protected_moved(0) , boundaries(0) ,
		 boundaries_merged(0) , leading(0) , trailing(0) { }

  timeline_t timeline;

  diagnostics_t diags;

  // samples removed
  int64_t removed;

  // events deleted because they sat inside a span
  int dropped;

  // earlier boundary markers inside a span, kept and moved to the seam
  int protected_moved;

  // boundary markers inserted
  int boundaries;

  // seams that already carried a marker (its duration grows instead)
  int boundaries_merged;

  // events removed for lying before sample 1
  int leading;

  // events removed by the trailing check
  int trailing;

};


// Delete the spans' columns from the matrix, clock and index tables,
// drop events inside them (boundary markers excepted), shift the rest
// back by the samples removed before them and mark each seam with a
// boundary event (one per seam: an earlier marker on the same seam takes
// the new span's length into its duration).  Events before sample 1 or
// past the new end are dropped.  Throws excision_range_error for spans off [1,N],
// spans computed against another revision, or unstamped spans once the
// timeline has been excised.  Empty spans: no-op.

excision_t excise( const timeline_t & timeline , const spanset_t & spans );


// Set every channel to NaN over the spans and record them as pending;
// samples, clock and events are left as they are

excision_t fill( const timeline_t & timeline , const spanset_t & spans );


#endif
