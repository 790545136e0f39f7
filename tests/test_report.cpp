
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

// 15000 samples at 3 Hz from 22:00:00; one stim (proto 4) at 13202,
// 6000 samples excised before it
static excision_t three_hertz( int * id )
{
  timeline_t t = make_timeline( 15000 , 3 , 1 , 22 * 3600 );
  *id = add_event( &t , EVT_STIM_START , 13202 , 4 );
  t.stamp_provenance();

  spanset_t s = spanset_t::normalize( std::vector<span_t>( 1 , span_t( 1000 , 6999 ) ) );
  s.basis = t.revision;
  return excise( t , s );
}

TEST_CASE( "latencies and shift in seconds after excision" , "[report]" )
{
  int id = -1;
  excision_t x = three_hertz( &id );

  const event_t * e = find_event( x.timeline.events , id );
  REQUIRE( e != NULL );
  CHECK( e->latency == 7202 );

  report_t r = reconcile( x.timeline.events , x.timeline.events , x.timeline ,
			  stage_lookup_t() , event_filter_t::stimulation() );

  REQUIRE( r.rows.size() == 1 );
  const report_row_t & row = r.rows[0];
  CHECK( row.event == id );
  CHECK( row.original_latency == 13202 );
  CHECK( row.latency == 7202 );
  CHECK( row.original_sec == Approx( 13202 / 3.0 ) );
  CHECK( row.new_sec == Approx( 7202 / 3.0 ) );
  CHECK( row.shift_sec == Approx( -2000 ) );
  CHECK( row.moved );
  CHECK( ! row.relocated );
  CHECK( ! row.fallback );
  CHECK( row.actual_time() == "23:13:20" );
  CHECK( row.stage == "unknown" );
  CHECK( r.moved() == 1 );
  CHECK( r.diags.empty() );

  std::vector<std::string> c = r.cells( row );
  REQUIRE( c.size() == report_t::columns().size() );
  CHECK( c[0] == "stim start" );
  CHECK( c[1] == "4" );
  CHECK( c[2] == "4400.667" );
  CHECK( c[3] == "2400.667" );
  CHECK( c[4] == "23:13:20" );
  CHECK( c[5] == "-2000.000" );
  CHECK( c[6] == "true" );
  CHECK( c[8] == "false" );
  CHECK( c[9] == "original" );
}

TEST_CASE( "rows follow original time, not current latency" , "[report]" )
{
  timeline_t t = make_timeline( 1000 , 10 );
  const int a = add_event( &t , EVT_STIM_START , 150 , 1 );
  const int b = add_event( &t , EVT_STIM_END , 201 , 1 );
  add_stage( &t , 10 , 2 );
  t.stamp_provenance();

  spanset_t s = spanset_t::normalize( std::vector<span_t>( 1 , span_t( 100 , 200 ) ) );
  s.basis = t.revision;

  relocation_t rel = relocate_events( t , s , 2 , event_filter_t::stimulation() );
  timeline_t moved = t;
  moved.events = rel.events;
  excision_t x = excise( moved , s );

  // a now sits after b
  CHECK( find_event( x.timeline.events , a )->latency == 101 );
  CHECK( find_event( x.timeline.events , b )->latency == 100 );

  const event_list_t before = moved.events;
  const event_list_t after = x.timeline.events;

  report_t r = reconcile( before , after , x.timeline ,
			  stage_lookup_t( x.timeline.events ) , event_filter_t::stimulation() );

  REQUIRE( r.rows.size() == 2 );
  CHECK( r.rows[0].event == a );
  CHECK( r.rows[1].event == b );
  CHECK( r.rows[0].relocated );
  CHECK( r.rows[0].original_latency == 150 );
  CHECK( r.rows[0].shift_sec == Approx( -4.9 ) );
  CHECK( r.rows[0].stage == "2" );
  CHECK( r.rows[1].shift_sec == Approx( -10.1 ) );

  // neither list was touched
  CHECK( after.size() == x.timeline.events.size() );
  CHECK( find_event( after , a )->latency == 101 );
  CHECK( find_event( before , a )->latency == 202 );
}

TEST_CASE( "missing provenance falls back to current values" , "[report]" )
{
  timeline_t t = make_timeline( 100 , 10 );
  const int id = add_event( &t , EVT_STIM_START , 40 , 2 );

  report_t r = reconcile( event_list_t() , t.events , t ,
			  stage_lookup_t() , event_filter_t::stimulation() );

  REQUIRE( r.rows.size() == 1 );
  CHECK( r.rows[0].fallback );
  CHECK( r.rows[0].original_latency == 40 );
  CHECK( ! r.rows[0].moved );
  CHECK( r.rows[0].shift_sec == 0 );
  CHECK( r.cells( r.rows[0] )[9] == "fallback" );
  REQUIRE( count_kind( r.diags , DIAG_MISSING_PROVENANCE ) == 1 );
  CHECK( r.diags[0].event == id );
  CHECK( r.fallbacks() == 1 );
}

TEST_CASE( "rows with no time at all come last" , "[report]" )
{
  timeline_t t = make_timeline( 100 , 10 );
  const int early = add_event( &t , EVT_STIM_START , 0 , 2 );
  const int later = add_event( &t , EVT_STIM_END , 40 , 2 );

  report_t r = reconcile( event_list_t() , t.events , t ,
			  stage_lookup_t() , event_filter_t::stimulation() );

  REQUIRE( r.rows.size() == 2 );
  CHECK( r.rows[0].event == later );
  CHECK( r.rows[0].has_clock );
  CHECK( r.rows[1].event == early );
  CHECK( ! r.rows[1].has_clock );
  CHECK( r.rows[1].actual_time() == "N/A" );
}

TEST_CASE( "provenance is taken from the earlier list when missing later" , "[report]" )
{
  timeline_t t = make_timeline( 100 , 10 );
  add_event( &t , EVT_STIM_START , 40 , 2 );
  t.stamp_provenance();

  event_list_t after = t.events;
  after[0].prov = provenance_t();
  after[0].latency = 30;

  report_t r = reconcile( t.events , after , t , stage_lookup_t() , event_filter_t::stimulation() );
  REQUIRE( r.rows.size() == 1 );
  CHECK( ! r.rows[0].fallback );
  CHECK( r.rows[0].original_latency == 40 );
  CHECK( r.rows[0].shift_sec == Approx( -1.0 ) );
}

TEST_CASE( "CSV and JSON reports" , "[report]" )
{
  int id = -1;
  excision_t x = three_hertz( &id );

  report_t r = reconcile( x.timeline.events , x.timeline.events , x.timeline ,
			  stage_lookup_t() , event_filter_t::stimulation() );

  r.write_csv( "report-test.csv" );
  const std::string csv = read_file( "report-test.csv" );
  CHECK( csv.find( "Event_Type,Proto_Type,Original_Latency_sec,New_Latency_sec,Actual_Time,"
		   "Shift_Distance_sec,Moved,Sleep_Stage,Relocated,Provenance\n" ) == 0 );
  CHECK( csv.find( "stim start,4,4400.667,2400.667,23:13:20,-2000.000,true,unknown,false,original" )
	 != std::string::npos );

  r.write_json( "report-test.json" );
  nlohmann::json j = nlohmann::json::parse( read_file( "report-test.json" ) );
  REQUIRE( j.is_array() );
  REQUIRE( j.size() == 1 );
  CHECK( j[0][ "Proto_Type" ].get<int>() == 4 );
  CHECK( j[0][ "Moved" ].get<bool>() );
  CHECK( j[0][ "Sleep_Stage" ].get<std::string>() == "unknown" );
  CHECK( j[0][ "Shift_Distance_sec" ].get<double>() == Approx( -2000 ) );

  std::remove( "report-test.csv" );
  std::remove( "report-test.json" );

  CHECK_THROWS_AS( r.write_csv( "no/such/folder/report.csv" ) , eprune_error );
}
