
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

#ifndef __EPRUNE_TEST_FIXTURES_H__
#define __EPRUNE_TEST_FIXTURES_H__

#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include "eprune.h"

extern globals global;

//
// Small synthetic recordings for the tests
//

namespace {

  // labels and defaults, once per test program; keep the console quiet
  inline void setup()
  {
    static bool done = false;
    if ( done ) return;
    global.init_defs();
    globals::silent = true;
    done = true;
  }

  // channel c, sample i (1-based) holds i + 1000 * c, so columns can be
  // traced through excision
  inline timeline_t make_timeline( int64_t n , double sr , int nc = 2 , double start = 0 )
  {
    setup();
    timeline_t t;
    t.id = "test";
    t.srate = sr;
    t.data.resize( nc , n );
    for (int c=0; c<nc; c++)
      for (int64_t i=0; i<n; i++)
	t.data( c , i ) = ( i + 1 ) + 1000.0 * c;
    t.clock.resize( n );
    for (int64_t i=0; i<n; i++)
      t.clock[i] = start + i / sr;
    for (int c=0; c<nc; c++)
      t.labels.push_back( "CH" + Helper::int2str( c + 1 ) );
    t.init_provenance();
    return t;
  }

  inline event_t make_event( event_type_t type , int64_t latency , int proto = -1 , int id = 0 )
  {
    setup();
    event_t e( type , latency );
    e.id = id;
    if ( proto != -1 )
      {
	e.has_proto = true;
	e.proto = proto;
      }
    return e;
  }

  // add an event with the next free id; returns that id
  inline int add_event( timeline_t * t , event_type_t type , int64_t latency , int proto = -1 )
  {
    const int id = max_event_id( t->events ) + 1;
    t->events.push_back( make_event( type , latency , proto , id ) );
    sort_events( &t->events );
    return id;
  }

  inline int add_stage( timeline_t * t , int64_t latency , int stage )
  {
    const int id = max_event_id( t->events ) + 1;
    event_t e = make_event( EVT_SLEEP_STAGE , latency , -1 , id );
    e.code = Helper::int2str( stage );
    e.has_stage = globals::valid_stage( stage );
    e.stage = e.has_stage ? stage : -1;
    t->events.push_back( e );
    sort_events( &t->events );
    return id;
  }

  // NaN in one channel over samples a..b (1-based, inclusive)
  inline void set_nan( timeline_t * t , int64_t a , int64_t b , int channel = 0 )
  {
    for (int64_t i=a; i<=b; i++)
      t->data( channel , i - 1 ) = std::numeric_limits<double>::quiet_NaN();
  }

  inline const event_t * find_event( const event_list_t & events , int id )
  {
    for (int i=0; i<events.size(); i++)
      if ( events[i].id == id ) return &events[i];
    return NULL;
  }

  inline int count_kind( const diagnostics_t & d , diag_kind_t k )
  {
    int n = 0;
    for (int i=0; i<d.size(); i++) if ( d[i].kind == k ) ++n;
    return n;
  }

  inline void write_file( const std::string & f , const std::string & content )
  {
    std::ofstream out( f.c_str() );
    out << content;
  }

  inline std::string read_file( const std::string & f )
  {
    std::ifstream in( f.c_str() );
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

}

#endif
