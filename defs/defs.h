
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

#ifndef __DEFS_H__
#define __DEFS_H__

#include <map>
#include <set>
#include <string>
#include <stdint.h>
#include <vector>

struct param_t;

//
// One row of a sample-list:  ID, data, optional events and timestamps
//

struct sample_list_t {
  std::string id;
  std::string data;
  std::string events;
  std::string times;
};


//
// Event categories; anything not recognised is a generic marker
//

enum event_type_t
  {
    EVT_GENERIC ,
    EVT_STIM_START ,
    EVT_STIM_END ,
    EVT_SLEEP_STAGE ,
    EVT_BOUNDARY
  };


//
// Sleep stage codes as scored upstream (0 = wake, 5 = REM)
//

enum sleep_stage_t
  {
    STAGE_WAKE = 0 ,
    STAGE_N1   = 1 ,
    STAGE_N2   = 2 ,
    STAGE_N3   = 3 ,
    STAGE_N4   = 4 ,
    STAGE_REM  = 5
  };


//
// Recoverable anomalies (reported, never thrown)
//

enum diag_kind_t
  {
    DIAG_UNRESOLVABLE_RELOCATION ,
    DIAG_PROTOCOL_COUNT_MISMATCH ,
    DIAG_MISSING_PROVENANCE ,
    DIAG_TRAILING_EVENT_DROPPED ,
    DIAG_LEADING_EVENT_DROPPED ,
    DIAG_SPANS_MERGED ,
    DIAG_INVALID_STAGE_CODE ,
    DIAG_UNPAIRED_STIM
  };


//
// A recoverable anomaly, returned next to the result of a step
//

struct diagnostic_t {

  diagnostic_t( diag_kind_t kind , const std::string & step ,
		const std::string & msg , int event = -1 )
  : kind(kind) , step(step) , msg(msg) , event(event) { }

  diag_kind_t kind;

  // pipeline step that raised it (detect, relocate, excise, ...)
  std::string step;

  std::string msg;

  // event id, or -1 if not about a single event
  int event;

  std::string as_string() const;

};

typedef std::vector<diagnostic_t> diagnostics_t;


struct globals
{

  static std::string version;
  static std::string date;

  // return code for the batch (non-zero if any recording failed)
  static int retcode;

  //
  // event labels, as they appear in event files
  //

  static std::map<event_type_t,std::string> event_label;

  static std::string event( event_type_t );

  static event_type_t event_type( const std::string & );

  static std::string diag( diag_kind_t );

  // stage codes that can be scored
  static int stage_min;
  static int stage_max;

  static bool valid_stage( int s ) { return s >= stage_min && s <= stage_max; }

  // default relocation buffer (samples past the end of a span)
  static int relocation_buffer;

  // number of decimal places for seconds in text output
  static int time_format_dp;

  static char folder_delimiter;

  static std::string mkdir_command;

  // sample-list missing-field marker
  static std::string missing_field;

  // function to bail to if needed (e.g. throw, when embedded)
  static void (*bail_function) ( const std::string & msg );

  static bool bail_on_fail;

  // suppress console logging
  static bool silent;

  // log every event of interest, not only moved ones
  static bool verbose;

  // generic global parameters
  static param_t param;

  // global functions: primary initiation of all globals
  void init_defs();

  // embedded mode: halt() throws rather than exits
  void api();

};

#endif
