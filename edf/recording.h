
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

#ifndef __EPRUNE_RECORDING_H__
#define __EPRUNE_RECORDING_H__

#include <string>
#include <vector>

#include "defs/defs.h"
#include "timeline/timeline.h"

//
// Text-based recording I/O: everything here throws load_error on
// malformed input, and eprune_error (step 'write') on output failures
//

// tab-delimited  ID  data  [events]  [times]  ('.' = absent); a file
// ending .txt/.txt.gz/.dat is taken as a single recording
std::vector<sample_list_t> read_sample_list( const std::string & filename );

// one row per sample, whitespace-separated channels; NaN = invalid
void load_data( const std::string & filename , timeline_t * timeline );

// tab-delimited  type  latency  [proto]  [code]
event_list_t load_events( const std::string & filename , diagnostics_t * diags );

// one wall-clock per sample: seconds, or hh:mm:ss[.sss]
void load_times( const std::string & filename , timeline_t * timeline );

// all of the above, then clock (from 'start' if no times file) and
// provenance tables
timeline_t load_recording( const sample_list_t & rec , double sr , double start ,
			   diagnostics_t * diags );

// <folder>/<id>-pruned.txt[.gz], .times and .events
void write_recording( const timeline_t & timeline , const std::string & folder , bool compress );

#endif
