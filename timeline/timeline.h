
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

#ifndef __TIMELINE_H__
#define __TIMELINE_H__

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "defs/defs.h"
#include "annot/event.h"
#include "intervals/intervals.h"


//
// One recording: the sample matrix, its per-sample wall-clock table and
// the event list, plus what is needed to map back to the recording as
// it was loaded
//

// A timeline is edited only by building a new one (see edf/excise.h);
// the original clock table is shared between all revisions

struct timeline_t
{

 public:

  timeline_t() : srate(0) , revision(0) { }

  // after load: original clock := clock, original index := 1..N
  void init_provenance();

  // capture original latency and wall-clock on every event that does
  // not yet carry them; events off the timeline get a diagnostic
  diagnostics_t stamp_provenance();

  int64_t samples() const { return data.cols(); }

  int nchannels() const { return data.rows(); }

  double duration_sec() const { return srate > 0 ? samples() / srate : 0; }

  // wall-clock at a 1-based sample of the current timeline
  double clock_at( int64_t s ) const { return clock[ s - 1 ]; }

  // wall-clock at a 1-based sample of the original recording
  bool original_clock_at( int64_t s , double * c ) const;

  // original sample index of a current 1-based sample
  int64_t original_sample( int64_t s ) const { return orig_index[ s - 1 ]; }

  int64_t original_samples() const
  { return original_clock ? (int64_t)original_clock->size() : 0; }

  // sample count, clock and index tables agree, clock non-decreasing
  bool consistent( std::string * msg ) const;

  // count events by category
  int count( event_type_t t , int proto = -1 ) const;

  std::string id;

  // Hz
  double srate;

  std::vector<std::string> labels;

  // channels x samples
  Eigen::MatrixXd data;

  // wall-clock seconds for each current sample
  std::vector<double> clock;

  // original 1-based sample for each current sample
  std::vector<int64_t> orig_index;

  // clock table as loaded, never edited
  std::shared_ptr<const std::vector<double> > original_clock;

  event_list_t events;

  // bumped by every excision
  int revision;

  // everything excised so far, in original sample coordinates
  spanset_t excised;

  // regions set to NaN (current coordinates) still to be excised
  spanset_t pending;

};


#endif
