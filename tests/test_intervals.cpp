
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

static std::vector<span_t> spans( std::initializer_list<std::pair<int,int> > s )
{
  std::vector<span_t> r;
  for ( auto p : s ) r.push_back( span_t( p.first , p.second ) );
  return r;
}

TEST_CASE( "touching spans merge, separated spans do not" , "[intervals]" )
{
  spanset_t a;
  a.insert( span_t( 10 , 20 ) );
  a.insert( span_t( 21 , 30 ) );
  REQUIRE( a.size() == 1 );
  CHECK( a[0] == span_t( 10 , 30 ) );

  spanset_t b;
  b.insert( span_t( 10 , 20 ) );
  b.insert( span_t( 25 , 30 ) );
  REQUIRE( b.size() == 2 );
  CHECK( b[0] == span_t( 10 , 20 ) );
  CHECK( b[1] == span_t( 25 , 30 ) );
}

TEST_CASE( "normalizing a normalized set changes nothing" , "[intervals]" )
{
  spanset_t a = spanset_t::normalize( spans( { {50,60} , {1,5} , {3,9} , {12,12} , {61,70} } ) );
  spanset_t b = spanset_t::normalize( a.spans() );
  CHECK( a == b );
  CHECK( b.merged == 0 );
  CHECK( a.total() == b.total() );
}

TEST_CASE( "normalize sorts and merges overlaps" , "[intervals]" )
{
  diagnostics_t diags;
  spanset_t s = spanset_t::normalize( spans( { {50,60} , {1,5} , {3,9} , {55,58} } ) , 1 , &diags );
  REQUIRE( s.size() == 2 );
  CHECK( s[0] == span_t( 1 , 9 ) );
  CHECK( s[1] == span_t( 50 , 60 ) );
  CHECK( s.merged == 2 );
  CHECK( count_kind( diags , DIAG_SPANS_MERGED ) == 1 );
  CHECK( s.total() == 9 + 11 );
}

TEST_CASE( "bad spans are rejected, not coerced" , "[intervals]" )
{
  CHECK_THROWS_AS( spanset_t::normalize( spans( { {20,10} } ) ) , invalid_span_error );
  CHECK_THROWS_AS( spanset_t::normalize( spans( { {0,10} } ) ) , invalid_span_error );

  spanset_t s;
  s.insert( span_t( 5 , 8 ) );
  CHECK_THROWS_AS( s.insert( span_t( 9 , 3 ) ) , invalid_span_error );
  // unchanged after the failed insert
  REQUIRE( s.size() == 1 );
  CHECK( s[0] == span_t( 5 , 8 ) );
}

TEST_CASE( "merge gap is configurable" , "[intervals]" )
{
  spanset_t exact = spanset_t::normalize( spans( { {10,20} , {21,30} } ) , 0 );
  CHECK( exact.size() == 2 );

  spanset_t loose = spanset_t::normalize( spans( { {10,20} , {25,30} } ) , 5 );
  REQUIRE( loose.size() == 1 );
  CHECK( loose[0] == span_t( 10 , 30 ) );
}

TEST_CASE( "single-sample spans and lookups" , "[intervals]" )
{
  spanset_t s = spanset_t::normalize( spans( { {7,7} , {100,200} , {300,310} } ) );

  CHECK( s[0].length() == 1 );
  CHECK( s.find( 7 ) == 0 );
  CHECK( s.find( 8 ) == -1 );
  CHECK( s.find( 100 ) == 1 );
  CHECK( s.find( 200 ) == 1 );
  CHECK( s.find( 201 ) == -1 );
  CHECK( s.find( 305 ) == 2 );
  CHECK( s.find( 1000 ) == -1 );

  CHECK( s.removed_before( 7 ) == 0 );
  CHECK( s.removed_before( 8 ) == 1 );
  CHECK( s.removed_before( 150 ) == 1 + 50 );
  CHECK( s.removed_before( 250 ) == 1 + 101 );
  CHECK( s.removed_before( 400 ) == 1 + 101 + 11 );
}

TEST_CASE( "empty sets" , "[intervals]" )
{
  spanset_t s = spanset_t::normalize( std::vector<span_t>() );
  CHECK( s.empty() );
  CHECK( s.total() == 0 );
  CHECK( s.removed_before( 10 ) == 0 );
  CHECK( s.find( 1 ) == -1 );
}
