
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

TEST_CASE( "data file with labels and NaN" , "[recording]" )
{
  setup();
  write_file( "rec-a.txt" ,
	      "# C3\tC4\n"
	      "1.5\t10\n"
	      "2\tNaN\n"
	      "\n"
	      "3 30\n"
	      "nan\t40\n" );

  timeline_t t;
  load_data( "rec-a.txt" , &t );

  REQUIRE( t.samples() == 4 );
  REQUIRE( t.nchannels() == 2 );
  CHECK( t.labels[0] == "C3" );
  CHECK( t.labels[1] == "C4" );
  CHECK( t.data( 0 , 0 ) == 1.5 );
  CHECK( t.data( 1 , 2 ) == 30 );
  CHECK( std::isnan( t.data( 1 , 1 ) ) );
  CHECK( std::isnan( t.data( 0 , 3 ) ) );

  spanset_t s = nan_spans( t.data );
  REQUIRE( s.size() == 2 );
  CHECK( s[0] == span_t( 2 , 2 ) );
  CHECK( s[1] == span_t( 4 , 4 ) );

  std::remove( "rec-a.txt" );
}

TEST_CASE( "malformed data files" , "[recording]" )
{
  setup();
  timeline_t t;

  CHECK_THROWS_AS( load_data( "does-not-exist.txt" , &t ) , load_error );

  write_file( "rec-bad.txt" , "1 2\n3\n" );
  CHECK_THROWS_AS( load_data( "rec-bad.txt" , &t ) , load_error );

  write_file( "rec-bad.txt" , "1 2\n3 x\n" );
  CHECK_THROWS_AS( load_data( "rec-bad.txt" , &t ) , load_error );

  write_file( "rec-bad.txt" , "# only a header\n" );
  CHECK_THROWS_AS( load_data( "rec-bad.txt" , &t ) , load_error );

  std::remove( "rec-bad.txt" );
}

TEST_CASE( "events file" , "[recording]" )
{
  setup();
  write_file( "rec-a.events" ,
	      "type\tlatency\tproto\tcode\n"
	      "Stim Start\t120.4\t4\n"
	      "stim end\t300\t4\t\n"
	      "Sleep Stage\t10\t.\t2\n"
	      "Sleep Stage\t500\t.\tW\n"
	      "Lights off\t5\n" );

  diagnostics_t diags;
  event_list_t ev = load_events( "rec-a.events" , &diags );

  REQUIRE( ev.size() == 5 );
  // back in latency order; ids follow the file
  CHECK( ev[0].label == "Lights off" );
  CHECK( ev[0].type == EVT_GENERIC );
  CHECK( ev[0].id == 4 );
  CHECK( ev[1].type == EVT_SLEEP_STAGE );
  CHECK( ev[1].has_stage );
  CHECK( ev[1].stage == 2 );
  CHECK( ev[2].type == EVT_STIM_START );
  CHECK( ev[2].latency == 120 );
  CHECK( ev[2].has_proto );
  CHECK( ev[2].proto == 4 );
  CHECK( ev[2].id == 0 );
  CHECK( ev[3].type == EVT_STIM_END );
  CHECK( ! ev[4].has_stage );

  REQUIRE( count_kind( diags , DIAG_INVALID_STAGE_CODE ) == 1 );
  CHECK( diags[0].event == 3 );

  write_file( "rec-bad.events" , "stim start\tlater\t4\n" );
  CHECK_THROWS_AS( load_events( "rec-bad.events" , &diags ) , load_error );
  write_file( "rec-bad.events" , "stim start\t100\tfour\n" );
  CHECK_THROWS_AS( load_events( "rec-bad.events" , &diags ) , load_error );

  std::remove( "rec-a.events" );
  std::remove( "rec-bad.events" );
}

TEST_CASE( "clock-times across midnight" , "[recording]" )
{
  timeline_t t = make_timeline( 4 , 1 );

  write_file( "rec-a.times" , "23:59:58\n23:59:59\n00:00:00\n00:00:01\n" );
  load_times( "rec-a.times" , &t );
  REQUIRE( t.clock.size() == 4 );
  CHECK( t.clock[0] == Approx( 86398 ) );
  CHECK( t.clock[2] == Approx( 86400 ) );
  CHECK( t.clock[3] == Approx( 86401 ) );

  write_file( "rec-a.times" , "10\n11\n12\n" );
  CHECK_THROWS_AS( load_times( "rec-a.times" , &t ) , load_error );

  write_file( "rec-a.times" , "10\n11\n10.5\n12\n" );
  CHECK_THROWS_AS( load_times( "rec-a.times" , &t ) , load_error );

  std::remove( "rec-a.times" );
}

TEST_CASE( "sample lists" , "[recording]" )
{
  setup();
  write_file( "rec.lst" ,
	      "% comment\n"
	      "s1\ts1.txt\ts1.events\n"
	      "s2\ts2.txt.gz\t.\ts2.times\n" );

  std::vector<sample_list_t> s = read_sample_list( "rec.lst" );
  REQUIRE( s.size() == 2 );
  CHECK( s[0].id == "s1" );
  CHECK( s[0].events == "s1.events" );
  CHECK( s[0].times == "." );
  CHECK( s[1].data == "s2.txt.gz" );
  CHECK( s[1].events == "." );
  CHECK( s[1].times == "s2.times" );

  write_file( "rec-single.txt" , "1\n" );
  s = read_sample_list( "rec-single.txt" );
  REQUIRE( s.size() == 1 );
  CHECK( s[0].id == "rec-single" );

  write_file( "rec.lst" , "s1\n" );
  CHECK_THROWS_AS( read_sample_list( "rec.lst" ) , load_error );
  CHECK_THROWS_AS( read_sample_list( "no-such.lst" ) , load_error );

  std::remove( "rec.lst" );
  std::remove( "rec-single.txt" );
}

TEST_CASE( "pruned output loads back" , "[recording]" )
{
  timeline_t t = make_timeline( 50 , 10 , 2 , 100 );
  t.id = "rt";
  set_nan( &t , 7 , 8 , 1 );
  add_event( &t , EVT_STIM_START , 20 , 3 );
  t.stamp_provenance();

  for (int z=0; z<2; z++)
    {
      const bool compress = z == 1;
      write_recording( t , "." , compress );

      sample_list_t rec;
      rec.id = "rt";
      rec.data = compress ? "./rt-pruned.txt.gz" : "./rt-pruned.txt";
      rec.events = "./rt-pruned.events";
      rec.times = "./rt-pruned.times";

      diagnostics_t diags;
      timeline_t u = load_recording( rec , 10 , 0 , &diags );

      REQUIRE( u.samples() == 50 );
      CHECK( u.labels == t.labels );
      CHECK( u.data( 0 , 49 ) == 50 );
      CHECK( u.data( 1 , 0 ) == 1001 );
      CHECK( std::isnan( u.data( 1 , 6 ) ) );
      CHECK( u.clock_at( 1 ) == Approx( 100 ) );
      CHECK( u.clock_at( 50 ) == Approx( 104.9 ) );
      REQUIRE( u.events.size() == 1 );
      CHECK( u.events[0].type == EVT_STIM_START );
      CHECK( u.events[0].latency == 20 );
      CHECK( u.events[0].proto == 3 );
      CHECK( diags.empty() );

      std::remove( rec.data.c_str() );
    }

  const std::string ev = read_file( "./rt-pruned.events" );
  CHECK( ev.find( "type\tlatency\tproto\tcode\tduration\toriginal_latency\n" ) == 0 );

  std::remove( "./rt-pruned.events" );
  std::remove( "./rt-pruned.times" );

  CHECK_THROWS_AS( write_recording( t , "no/such/folder" , false ) , eprune_error );
}
