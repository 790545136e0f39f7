
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

#ifndef __EPRUNE_PROTOCOLS_H__
#define __EPRUNE_PROTOCOLS_H__

#include "annot/event.h"

#include <set>
#include <string>
#include <vector>

//
// Stimulation protocols: a stim start paired with the next stim end of
// the same protocol-type
//

struct protocol_t {

  int proto;

  // 1-based, in order of the start marker
  int number;

  // event ids
  int start;
  int end;

};

struct protocols_t {

  std::vector<protocol_t> protocols;

  diagnostics_t diags;

};

// pair stim start/end events of one protocol-type
protocols_t pair_protocols( const event_list_t & events , int proto );

// protocol-types carried by any stim event
std::set<int> stim_protos( const event_list_t & events );


struct pruned_protocols_t {

  pruned_protocols_t() : removed(0) , remaining(0) { }

  event_list_t events;

  int removed;

  int remaining;

  diagnostics_t diags;

};

// remove protocols whose start or end immediately follows a marker of
// an unwanted sleep stage (empty 'protos' means every protocol-type)
pruned_protocols_t prune_protocols( const event_list_t & events ,
				    const std::set<int> & unwanted ,
				    const std::set<int> & protos ,
				    double sr );

// one ProtocolCountMismatch per protocol-type with unequal start/end
// counts; never edits the events
diagnostics_t check_protocol_counts( const event_list_t & events ,
				     const std::set<int> & protos );

// keep events whose label is in 'keep' (any, if empty) and whose
// protocol-type is in 'protos' (events without one are kept only if
// 'protos' is empty)
event_list_t filter_events( const event_list_t & events ,
			    const std::set<std::string> & keep ,
			    const std::set<int> & protos );

#endif
