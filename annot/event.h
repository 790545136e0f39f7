
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

#ifndef __EPRUNE_EVENT_H__
#define __EPRUNE_EVENT_H__

#include "defs/defs.h"

#include <stdint.h>
#include <set>
#include <string>
#include <vector>


//
// Where an event came from: captured once, before the first edit
//

struct provenance_t {

  provenance_t()
  : has_original(false) , original_latency(0) , original_clock(0) ,
    relocated(false) , shift_sec(0) { }

  // original latency/clock set?  (false means any report on this
  // event has to fall back to the current values)
  bool has_original;

  int64_t original_latency;

  // wall-clock seconds at the original latency
  double original_clock;

  // moved out of an invalid span
  bool relocated;

  // signed size of that move, (new - original) / sr
  double shift_sec;

};


struct event_t {

  event_t()
  : id(-1) , type(EVT_GENERIC) , latency(0) ,
    has_proto(false) , proto(0) ,
    has_stage(false) , stage(-1) , duration(0) { }

  event_t( event_type_t type , int64_t latency )
  : id(-1) , label( globals::event( type ) ) , type(type) , latency(latency) ,
    has_proto(false) , proto(0) ,
    has_stage(false) , stage(-1) , duration(0) { }

  // identity, stable across pipeline steps (order in the events file;
  // inserted boundary markers take ids after all loaded events)
  int id;

  // label as given in the events file
  std::string label;

  event_type_t type;

  // 1-based sample on the current timeline
  int64_t latency;

  bool has_proto;
  int proto;

  // sleep-stage markers: code parsed once at load
  bool has_stage;
  int stage;

  // raw code text
  std::string code;

  // boundary markers: samples excised at this seam
  int64_t duration;

  provenance_t prov;

  bool is_stim() const { return type == EVT_STIM_START || type == EVT_STIM_END; }

  bool is_boundary() const { return type == EVT_BOUNDARY; }

  bool is_stage() const { return type == EVT_SLEEP_STAGE; }

  std::string proto_string() const;

  std::string stage_string() const;

  std::string as_string() const;

  // order by latency; ties keep their relative order via id
  bool operator<( const event_t & rhs ) const
  {
    if ( latency == rhs.latency ) return id < rhs.id;
    return latency < rhs.latency;
  }

};

typedef std::vector<event_t> event_list_t;


// re-establish latency order
void sort_events( event_list_t * events );

// largest id in use (-1 if none)
int max_event_id( const event_list_t & events );


//
// Selects events of interest by category and protocol-type
//

struct event_filter_t {

  event_filter_t() { }

  // stim start/end; restricted to 'protos' unless empty
  static event_filter_t stimulation( const std::set<int> & protos = std::set<int>() );

  bool matches( const event_t & e ) const;

  // empty means any category
  std::set<event_type_t> types;

  // empty means any protocol-type (including none)
  std::set<int> protos;

};


#endif
