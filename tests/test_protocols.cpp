
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

#include <catch2/catch.hpp>

#include "tests/fixtures.h"

TEST_CASE( "starts pair with the next end of the same type" , "[protocols]" )
{
  timeline_t t = make_timeline( 1000 , 10 );
  const int s1 = add_event( &t , EVT_STIM_START , 100 , 4 );
  add_event( &t , EVT_STIM_START , 150 , 2 );
  const int e1 = add_event( &t , EVT_STIM_END , 200 , 4 );
  add_event( &t , EVT_STIM_END , 250 , 2 );
  const int s2 = add_event( &t , EVT_STIM_START , 300 , 4 );
  const int e2 = add_event( &t , EVT_STIM_END , 400 , 4 );
  const int dangling = add_event( &t , EVT_STIM_START , 500 , 4 );

  protocols_t p = pair_protocols( t.events , 4 );
  REQUIRE( p.protocols.size() == 2 );
  CHECK( p.protocols[0].start == s1 );
  CHECK( p.protocols[0].end == e1 );
  CHECK( p.protocols[0].number == 1 );
  CHECK( p.protocols[1].start == s2 );
  CHECK( p.protocols[1].end == e2 );

  REQUIRE( count_kind( p.diags , DIAG_UNPAIRED_STIM ) == 1 );
  CHECK( p.diags[0].event == dangling );

  CHECK( pair_protocols( t.events , 2 ).protocols.size() == 1 );
  CHECK( stim_protos( t.events ).size() == 2 );
}

TEST_CASE( "protocols right after an unwanted stage go as a pair" , "[protocols]" )
{
  timeline_t t = make_timeline( 1000 , 10 );
  add_event( &t , EVT_STIM_START , 100 , 4 );
  add_event( &t , EVT_STIM_END , 200 , 4 );
  add_stage( &t , 290 , 3 );
  const int s2 = add_event( &t , EVT_STIM_START , 300 , 4 );
  add_stage( &t , 350 , 2 );
  const int e2 = add_event( &t , EVT_STIM_END , 400 , 4 );
  add_event( &t , EVT_STIM_START , 500 , 4 );
  add_event( &t , EVT_STIM_END , 600 , 4 );

  std::set<int> unwanted;
  unwanted.insert( 3 );

  pruned_protocols_t r = prune_protocols( t.events , unwanted , std::set<int>() , t.srate );

  CHECK( r.removed == 1 );
  CHECK( r.remaining == 2 );
  CHECK( r.events.size() == t.events.size() - 2 );
  CHECK( find_event( r.events , s2 ) == NULL );
  CHECK( find_event( r.events , e2 ) == NULL );
  // stage markers stay
  CHECK( r.events.size() == 6 );
}

TEST_CASE( "a stage marker not directly followed by a stim removes nothing" , "[protocols]" )
{
  timeline_t t = make_timeline( 1000 , 10 );
  add_stage( &t , 90 , 3 );
  add_event( &t , EVT_GENERIC , 95 );
  add_event( &t , EVT_STIM_START , 100 , 4 );
  add_event( &t , EVT_STIM_END , 200 , 4 );

  std::set<int> unwanted;
  unwanted.insert( 3 );

  pruned_protocols_t r = prune_protocols( t.events , unwanted , std::set<int>() , t.srate );
  CHECK( r.removed == 0 );
  CHECK( r.remaining == 1 );
  CHECK( r.events.size() == 4 );
}

TEST_CASE( "unequal start and end counts are reported, not repaired" , "[protocols]" )
{
  timeline_t t = make_timeline( 1000 , 10 );
  for (int i=0; i<5; i++)
    add_event( &t , EVT_STIM_START , 100 + i * 100 , 1 );
  for (int i=0; i<4; i++)
    add_event( &t , EVT_STIM_END , 150 + i * 100 , 1 );
  add_event( &t , EVT_STIM_START , 20 , 2 );
  add_event( &t , EVT_STIM_END , 30 , 2 );

  const event_list_t before = t.events;

  diagnostics_t d = check_protocol_counts( t.events , std::set<int>() );
  REQUIRE( count_kind( d , DIAG_PROTOCOL_COUNT_MISMATCH ) == 1 );
  CHECK( d[0].step == "check" );
  CHECK( d[0].msg.find( "5" ) != std::string::npos );
  CHECK( t.events.size() == before.size() );
  CHECK( t.count( EVT_STIM_END , 1 ) == 4 );
}

TEST_CASE( "filtering by label and protocol-type" , "[protocols]" )
{
  timeline_t t = make_timeline( 1000 , 10 );
  const int a = add_event( &t , EVT_STIM_START , 100 , 4 );
  add_event( &t , EVT_STIM_END , 200 , 4 );
  add_event( &t , EVT_STIM_START , 300 , 2 );
  add_stage( &t , 50 , 1 );

  std::set<std::string> keep;
  keep.insert( " Stim Start" );
  std::set<int> protos;
  protos.insert( 4 );

  event_list_t r = filter_events( t.events , keep , protos );
  REQUIRE( r.size() == 1 );
  CHECK( r[0].id == a );

  CHECK( filter_events( t.events , std::set<std::string>() , std::set<int>() ).size() == 4 );
  // events without a protocol-type go once types are restricted
  CHECK( filter_events( t.events , std::set<std::string>() , protos ).size() == 2 );
}
