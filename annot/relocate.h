
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

#ifndef __EPRUNE_RELOCATE_H__
#define __EPRUNE_RELOCATE_H__

#include "annot/event.h"
#include "intervals/intervals.h"

struct timeline_t;

//
// Moves events of interest out of spans that are about to be excised
//

struct relocation_t {

  relocation_t() : moved(0) , unmoved(0) , unresolved(0) { }

  event_list_t events;

  diagnostics_t diags;

  // events of interest inside a span and moved past it
  int moved;

  // events of interest not inside any span
  int unmoved;

  // events of interest inside a span with no valid sample after it
  int unresolved;

};


// For each event matching 'filter' whose latency lies in a span, the new
// latency is span.stop + buffer (continuing past any later span that
// target lands in).  If that passes the last sample the event is left
// where it is, with an UnresolvableRelocation diagnostic.  Original
// latency/time are recorded on first move only.  The input is not changed.

relocation_t relocate_events( const timeline_t & timeline ,
			      const spanset_t & spans ,
			      int buffer ,
			      const event_filter_t & filter );

#endif
