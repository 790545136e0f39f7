
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

TEST_CASE( "no NaN gives an empty set, not an error" , "[detect]" )
{
  timeline_t t = make_timeline( 100 , 10 );
  spanset_t s;
  REQUIRE_NOTHROW( s = nan_spans( t.data ) );
  CHECK( s.empty() );
}

TEST_CASE( "maximal runs of invalid columns become spans" , "[detect]" )
{
  timeline_t t = make_timeline( 100 , 10 , 3 );
  set_nan( &t , 10 , 19 , 0 );
  set_nan( &t , 15 , 24 , 2 );   // overlaps the first run in another channel
  set_nan( &t , 50 , 50 , 1 );   // a single sample

  spanset_t s = nan_spans( t.data );
  REQUIRE( s.size() == 2 );
  CHECK( s[0] == span_t( 10 , 24 ) );
  CHECK( s[1] == span_t( 50 , 50 ) );
}

TEST_CASE( "runs touching either end stay in bounds" , "[detect]" )
{
  timeline_t t = make_timeline( 50 , 10 );
  set_nan( &t , 1 , 3 );
  set_nan( &t , 48 , 50 );

  spanset_t s = nan_spans( t.data );
  REQUIRE( s.size() == 2 );
  CHECK( s[0] == span_t( 1 , 3 ) );
  CHECK( s[1] == span_t( 48 , 50 ) );
}

TEST_CASE( "an all-NaN matrix is one span" , "[detect]" )
{
  timeline_t t = make_timeline( 20 , 10 );
  set_nan( &t , 1 , 20 );
  spanset_t s = nan_spans( t.data );
  REQUIRE( s.size() == 1 );
  CHECK( s[0] == span_t( 1 , 20 ) );
}

TEST_CASE( "timeline scan is stamped with the revision" , "[detect]" )
{
  timeline_t t = make_timeline( 100 , 10 );
  t.revision = 3;
  set_nan( &t , 40 , 45 );

  spanset_t s = nan_spans( t );
  CHECK( s.basis == 3 );
  CHECK( s.category == "NaN" );
  REQUIRE( s.size() == 1 );
}

TEST_CASE( "a pending region off the timeline is fatal" , "[detect]" )
{
  timeline_t t = make_timeline( 100 , 10 );
  t.pending.insert( span_t( 90 , 120 ) );
  CHECK_THROWS_AS( nan_spans( t ) , invalid_span_error );
}

TEST_CASE( "detection does not touch the matrix" , "[detect]" )
{
  timeline_t t = make_timeline( 30 , 10 );
  set_nan( &t , 5 , 6 );
  Eigen::MatrixXd copy = t.data;
  nan_spans( t.data );
  // NaN != NaN, so compare the NaN pattern and the rest separately
  CHECK( ( copy.array().isNaN() == t.data.array().isNaN() ).all() );
  CHECK( ( copy.col( 10 ) == t.data.col( 10 ) ) );
}
