
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

#ifndef __EPRUNE_PIPELINE_H__
#define __EPRUNE_PIPELINE_H__

#include <map>
#include <set>
#include <string>
#include <vector>

#include "defs/defs.h"
#include "timeline/timeline.h"
#include "db/report.h"
#include "db/db.h"

struct param_t;

//
// Options for one run, from key=value parameters
//

struct prune_options_t {

  prune_options_t();

  // read (and check) options; halts on bad values
  void set( const param_t & param );

  // every key set() understands
  static std::set<std::string> keys();

  double sr;

  std::string out;

  // protocol-types of interest (empty = all)
  std::set<int> protos;

  int buffer;

  std::set<int> unwanted;

  bool prune_protocols;

  // NaN-fill unwanted stages instead of excising them
  bool stage_fill;

  // event labels kept by the final filter (empty = no filter)
  std::set<std::string> keep;

  bool csv;

  bool json;

  std::string db;

  bool compress;

  // wall-clock of sample 1 when there is no timestamps file
  double start;

};


//
// Everything a run produces for one recording
//

struct prune_result_t {

  timeline_t timeline;

  report_t report;

  diagnostics_t diags;

  std::vector<span_record_t> spans;

  std::map<std::string,double> summary;

};


//
// Per-recording driver: load -> provenance -> prune -> detect ->
// relocate -> excise -> stages -> filter -> check -> report -> write.
// Fatal errors carry the step they happened in; a failed recording
// never stops the batch
//

struct pipeline_t {

  pipeline_t( const prune_options_t & opt ) : opt(opt) , db(NULL) , step("load") { }

  // all steps after 'load' (no file I/O)
  prune_result_t run( const timeline_t & loaded , const diagnostics_t & load_diags = diagnostics_t() );

  // load, run and write one recording
  prune_result_t process( const sample_list_t & rec );

  // every recording in turn; returns the number that failed
  int batch( const std::vector<sample_list_t> & recs );

  // step in progress
  const std::string & current_step() const { return step; }

  prune_options_t opt;

  // optional SQLite output (not owned)
  prune_db_t * db;

 private:

  void write( const prune_result_t & r );

  std::string step;

};

#endif
