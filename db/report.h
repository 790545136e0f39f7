
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

#ifndef __EPRUNE_REPORT_H__
#define __EPRUNE_REPORT_H__

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "annot/event.h"

struct timeline_t;
struct stage_lookup_t;

//
// One row of the reconciliation report (one retained event of interest)
//

struct report_row_t {

  report_row_t()
  : event(-1) , original_latency(0) , latency(0) ,
    original_sec(0) , new_sec(0) , clock(0) , has_clock(false) , shift_sec(0) ,
    moved(false) , relocated(false) , fallback(false) { }

  int event;

  std::string type;

  // protocol-type, or '.'
  std::string proto;

  // samples
  int64_t original_latency;
  int64_t latency;

  // latency / sr
  double original_sec;
  double new_sec;

  // wall-clock seconds at the original latency
  double clock;
  bool has_clock;

  // (new - original) / sr
  double shift_sec;

  // latency differs from the original one
  bool moved;

  // moved out of an invalid span
  bool relocated;

  // original latency/time not recorded: current values used instead
  bool fallback;

  // stage code in effect, or 'unknown'
  std::string stage;

  // HH:MM:SS, or N/A
  std::string actual_time() const;

};


struct report_t {

  std::string id;

  double srate;

  std::vector<report_row_t> rows;

  diagnostics_t diags;

  // column names, in output order
  static std::vector<std::string> columns();

  // row as text cells, in column order
  std::vector<std::string> cells( const report_row_t & row ) const;

  int moved() const;

  int fallbacks() const;

  nlohmann::json as_json() const;

  void write_csv( const std::string & filename ) const;

  void write_json( const std::string & filename ) const;

};


// Rows for every event in 'after' that 'filter' selects, joined with the
// provenance recorded on it (or on the same event in 'before'), ordered
// by original time.  Neither event list is modified.

report_t reconcile( const event_list_t & before ,
		    const event_list_t & after ,
		    const timeline_t & timeline ,
		    const stage_lookup_t & stages ,
		    const event_filter_t & filter );

#endif
