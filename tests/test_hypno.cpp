
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

// 1000 samples at 10 Hz:  2 @50, 0 @300, 2 @400, 5 @600, 0 @700, bad @800, 0 @900
static timeline_t scored()
{
  timeline_t t = make_timeline( 1000 , 10 );
  add_stage( &t , 50 , 2 );
  add_stage( &t , 300 , 0 );
  add_stage( &t , 400 , 2 );
  add_stage( &t , 600 , 5 );
  add_stage( &t , 700 , 0 );
  add_stage( &t , 800 , 9 );
  add_stage( &t , 900 , 0 );
  return t;
}

TEST_CASE( "unwanted bouts run to the next stage marker" , "[hypno]" )
{
  timeline_t t = scored();

  std::set<int> unwanted;
  unwanted.insert( 0 );
  unwanted.insert( 5 );

  stage_spans_t s = stage_spans( t , unwanted );

  REQUIRE( s.spans.size() == 3 );
  CHECK( s.spans[0] == span_t( 300 , 399 ) );
  // 5 then 0 back to back: one span
  CHECK( s.spans[1] == span_t( 600 , 799 ) );
  // the last bout runs to the end
  CHECK( s.spans[2] == span_t( 900 , 1000 ) );

  CHECK( s.spans.basis == t.revision );
  CHECK( s.bouts[0] == 3 );
  CHECK( s.bouts[5] == 1 );
  CHECK( s.seconds[0] == Approx( 10 + 10 + 10.1 ) );
  CHECK( s.seconds[5] == Approx( 10 ) );
  CHECK( count_kind( s.diags , DIAG_SPANS_MERGED ) == 1 );
}

TEST_CASE( "stage codes outside the scoring range are ignored" , "[hypno]" )
{
  timeline_t t = scored();

  std::set<int> unwanted;
  unwanted.insert( 9 );
  unwanted.insert( -1 );

  stage_spans_t s = stage_spans( t , unwanted );
  CHECK( s.spans.empty() );

  unwanted.insert( 2 );
  s = stage_spans( t , unwanted );
  REQUIRE( s.spans.size() == 2 );
  CHECK( s.spans[0] == span_t( 50 , 299 ) );
  CHECK( s.spans[1] == span_t( 400 , 599 ) );
}

TEST_CASE( "stage spans excise cleanly" , "[hypno]" )
{
  timeline_t t = scored();
  const int stim = add_event( &t , EVT_STIM_START , 450 , 1 );

  std::set<int> unwanted;
  unwanted.insert( 0 );

  stage_spans_t s = stage_spans( t , unwanted );
  excision_t x = excise( t , s.spans );

  CHECK( x.timeline.samples() == 1000 - 100 - 100 - 101 );
  CHECK( find_event( x.timeline.events , stim )->latency == 350 );
  CHECK( x.timeline.count( EVT_SLEEP_STAGE ) == 4 );
}

TEST_CASE( "stage in effect at a sample" , "[hypno]" )
{
  timeline_t t = scored();
  stage_lookup_t lookup( t.events );

  CHECK( lookup.size() == 7 );

  int s = -1;
  CHECK( ! lookup.lookup( 10 , &s ) );
  CHECK( lookup.as_string( 10 ) == "unknown" );

  CHECK( lookup.lookup( 50 , &s ) );
  CHECK( s == 2 );
  CHECK( lookup.as_string( 350 ) == "0" );
  CHECK( lookup.as_string( 699 ) == "5" );
  // the marker at 800 has no valid code
  CHECK( lookup.as_string( 850 ) == "unknown" );
  CHECK( lookup.as_string( 1000 ) == "0" );
}
