
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

#ifndef __HYPNO_H__
#define __HYPNO_H__

#include <map>
#include <set>
#include <vector>

#include "defs/defs.h"
#include "intervals/intervals.h"
#include "annot/event.h"

struct timeline_t;

//
// Spans of unwanted sleep stages, from the scored stage markers
//

struct stage_spans_t {

  spanset_t spans;

  // seconds covered, per stage code
  std::map<int,double> seconds;

  // bouts found, per stage code
  std::map<int,int> bouts;

  diagnostics_t diags;

};


// a bout runs from a marker of an unwanted stage to one sample before
// the next sleep-stage marker (or to the last sample)
stage_spans_t stage_spans( const timeline_t & timeline , const std::set<int> & unwanted );


//
// Sleep stage in effect at a sample: the most recent stage marker at or
// before it
//

struct stage_lookup_t {

  stage_lookup_t() { }

  explicit stage_lookup_t( const event_list_t & events );

  // false if no marker precedes 'latency' or that marker has no valid code
  bool lookup( int64_t latency , int * stage ) const;

  std::string as_string( int64_t latency ) const;

  int size() const { return latency.size(); }

 private:

  std::vector<int64_t> latency;

  // -1 for markers whose code did not parse
  std::vector<int> stage;

};

#endif
