
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

#include "edf/recording.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"
#include "helper/zfile.h"

#include <cmath>
#include <iomanip>
#include <limits>

extern logger_t logger;


static bool is_nan_token( const std::string & s )
{
  return Helper::iequals( s , "nan" ) || Helper::iequals( s , "-nan" );
}


std::vector<sample_list_t> read_sample_list( const std::string & filename )
{

  std::vector<sample_list_t> r;

  if ( ! Helper::fileExists( Helper::expand( filename ) ) )
    throw load_error( "could not find " + filename );

  // single recording?
  if ( Helper::file_extension( filename , "txt" )
       || Helper::file_extension( filename , "txt.gz" )
       || Helper::file_extension( filename , "dat" ) )
    {
      sample_list_t s;
      s.id = Helper::file_root( filename );
      s.data = filename;
      s.events = globals::missing_field;
      s.times = globals::missing_field;
      r.push_back( s );
      return r;
    }

  zfile_t f;
  if ( ! f.open_read( filename ) )
    throw load_error( "could not open sample list " + filename );

  std::string line;
  while ( f.getline( &line ) )
    {
      if ( Helper::lrtrim( line ) == "" ) continue;
      if ( line[0] == '%' || line[0] == '#' ) continue;

      std::vector<std::string> tok = Helper::parse( line , "\t" );
      if ( tok.size() < 2 || tok.size() > 4 )
	throw load_error( "sample list " + filename + " line " + Helper::int2str( f.line_number() )
			  + ": expecting ID, data file, (events file), (timestamps file)" );

      for (int t=0; t<tok.size(); t++)
	tok[t] = Helper::unquote( tok[t] );

      sample_list_t s;
      s.id = tok[0];
      s.data = tok[1];
      s.events = tok.size() >= 3 ? tok[2] : globals::missing_field ;
      s.times = tok.size() >= 4 ? tok[3] : globals::missing_field ;
      r.push_back( s );
    }

  return r;
}


void load_data( const std::string & filename , timeline_t * timeline )
{

  zfile_t f;
  if ( ! f.open_read( filename ) )
    throw load_error( "could not open data file " + filename );

  const double nan = std::numeric_limits<double>::quiet_NaN();

  // row-major: one row per sample
  std::vector<double> values;
  int nc = -1;
  int64_t ns = 0;

  std::vector<std::string> labels;

  std::string line;
  while ( f.getline( &line ) )
    {

      if ( Helper::lrtrim( line ) == "" ) continue;

      if ( line[0] == '#' )
	{
	  if ( ns == 0 && labels.size() == 0 )
	    labels = Helper::parse( line.substr( 1 ) , " \t" );
	  continue;
	}

      std::vector<std::string> tok = Helper::parse( line , " \t" );

      if ( nc == -1 ) nc = tok.size();
      else if ( tok.size() != nc )
	throw load_error( "data file " + filename + " line " + Helper::int2str( f.line_number() )
			  + ": expecting " + Helper::int2str( nc ) + " channels, found "
			  + Helper::int2str( (int)tok.size() ) );

      for (int c=0; c<nc; c++)
	{
	  double d = 0;
	  if ( is_nan_token( tok[c] ) ) d = nan;
	  else if ( ! Helper::str2dbl( tok[c] , &d ) )
	    throw load_error( "data file " + filename + " line " + Helper::int2str( f.line_number() )
			      + ": bad value '" + tok[c] + "'" );
	  values.push_back( d );
	}

      ++ns;
    }

  if ( ns == 0 || nc < 1 )
    throw load_error( "no samples in data file " + filename );

  if ( labels.size() != 0 && labels.size() != nc )
    throw load_error( "data file " + filename + " has " + Helper::int2str( (int)labels.size() )
		      + " channel labels for " + Helper::int2str( nc ) + " channels" );

  if ( labels.size() == 0 )
    for (int c=0; c<nc; c++)
      labels.push_back( "CH" + Helper::int2str( c + 1 ) );

  Eigen::Map<const Eigen::Matrix<double,Eigen::Dynamic,Eigen::Dynamic,Eigen::RowMajor> >
    rows( values.data() , ns , nc );

  timeline->data = rows.transpose();
  timeline->labels = labels;

  logger << "  read " << ns << " samples x " << nc << " channels from " << filename << "\n";
}


event_list_t load_events( const std::string & filename , diagnostics_t * diags )
{

  event_list_t events;

  zfile_t f;
  if ( ! f.open_read( filename ) )
    throw load_error( "could not open events file " + filename );

  std::string line;
  bool first = true;

  while ( f.getline( &line ) )
    {

      if ( Helper::lrtrim( line ) == "" ) continue;
      if ( line[0] == '%' || line[0] == '#' ) continue;

      std::vector<std::string> tok = Helper::parse( line , "\t" , true );

      if ( first )
	{
	  first = false;
	  if ( Helper::iequals( Helper::lrtrim( tok[0] ) , "type" ) ) continue;
	}

      const std::string where = "events file " + filename + " line " + Helper::int2str( f.line_number() );

      if ( tok.size() < 2 )
	throw load_error( where + ": expecting type, latency, (proto), (code)" );

      event_t e;
      e.id = events.size();
      e.label = Helper::lrtrim( Helper::unquote( tok[0] ) );
      e.type = globals::event_type( e.label );

      double lat = 0;
      if ( ! Helper::str2dbl( Helper::lrtrim( tok[1] ) , &lat ) )
	throw load_error( where + ": bad latency '" + tok[1] + "'" );
      e.latency = (int64_t)floor( lat + 0.5 );

      if ( tok.size() >= 3 )
	{
	  const std::string p = Helper::lrtrim( tok[2] );
	  if ( p != globals::missing_field && p != "" )
	    {
	      if ( ! Helper::str2int( p , &e.proto ) )
		throw load_error( where + ": bad proto type '" + p + "'" );
	      e.has_proto = true;
	    }
	}

      if ( tok.size() >= 4 )
	{
	  const std::string c = Helper::lrtrim( Helper::unquote( tok[3] ) );
	  if ( c != globals::missing_field ) e.code = c;
	}

      // stage codes are parsed once, here
      if ( e.is_stage() )
	{
	  int s = -1;
	  if ( Helper::str2int( e.code , &s ) && globals::valid_stage( s ) )
	    {
	      e.has_stage = true;
	      e.stage = s;
	    }
	  else
	    {
	      const std::string msg = "sleep stage marker at " + Helper::int2str( (long)e.latency )
		+ " has invalid code '" + e.code + "', stage unknown";
	      logger << "  " << msg << "\n";
	      if ( diags != NULL )
		diags->push_back( diagnostic_t( DIAG_INVALID_STAGE_CODE , "load" , msg , e.id ) );
	    }
	}

      events.push_back( e );
    }

  sort_events( &events );

  logger << "  read " << events.size() << " events from " << filename << "\n";

  return events;
}


void load_times( const std::string & filename , timeline_t * timeline )
{

  zfile_t f;
  if ( ! f.open_read( filename ) )
    throw load_error( "could not open timestamps file " + filename );

  std::vector<double> clock;
  clock.reserve( timeline->samples() );

  // clock-times past midnight continue from 24:00:00
  double offset = 0;
  double last = 0;

  std::string line;
  while ( f.getline( &line ) )
    {
      line = Helper::lrtrim( line );
      if ( line == "" ) continue;

      double sec = 0;
      if ( ! Helper::timestring( line , &sec ) )
	throw load_error( "timestamps file " + filename + " line " + Helper::int2str( f.line_number() )
			  + ": bad time '" + line + "'" );

      if ( line.find( ':' ) != std::string::npos )
	{
	  if ( clock.size() > 0 && sec + offset < last - 43200 ) offset += 86400;
	  sec += offset;
	}

      if ( clock.size() > 0 && sec < last )
	throw load_error( "timestamps file " + filename + " line " + Helper::int2str( f.line_number() )
			  + ": time goes backwards" );

      clock.push_back( sec );
      last = sec;
    }

  if ( (int64_t)clock.size() != timeline->samples() )
    throw load_error( "timestamps file " + filename + " has " + Helper::int2str( (long)clock.size() )
		      + " entries for " + Helper::int2str( (long)timeline->samples() ) + " samples" );

  timeline->clock = clock;
}


timeline_t load_recording( const sample_list_t & rec , double sr , double start ,
			   diagnostics_t * diags )
{

  if ( sr <= 0 )
    throw load_error( "sample rate must be positive" );

  timeline_t timeline;
  timeline.id = rec.id;
  timeline.srate = sr;

  load_data( rec.data , &timeline );

  if ( rec.events != globals::missing_field && rec.events != "" )
    timeline.events = load_events( rec.events , diags );
  else
    logger << "  no events file\n";

  if ( rec.times != globals::missing_field && rec.times != "" )
    load_times( rec.times , &timeline );
  else
    {
      const int64_t n = timeline.samples();
      timeline.clock.resize( n );
      for (int64_t i=0; i<n; i++)
	timeline.clock[i] = start + i / sr;
    }

  timeline.init_provenance();

  logger << "  " << timeline.samples() << " samples at " << sr << " Hz ("
	 << Helper::dbl2str( timeline.duration_sec() , 2 ) << " s), starting "
	 << Helper::timestring( timeline.clock[0] ) << "\n";

  return timeline;
}


void write_recording( const timeline_t & timeline , const std::string & folder , bool compress )
{

  const std::string root = folder + globals::folder_delimiter + timeline.id + "-pruned";

  //
  // sample matrix
  //

  const std::string datafile = root + ".txt" + ( compress ? ".gz" : "" );

  zfile_t f;
  if ( ! f.open_write( datafile , compress ) )
    throw eprune_error( "write" , "could not open " + datafile + " for writing" );

  if ( timeline.labels.size() != 0 )
    f << "# " << Helper::stringize( timeline.labels , "\t" ) << "\n";

  const int64_t n = timeline.samples();
  const int nc = timeline.nchannels();

  for (int64_t i=0; i<n; i++)
    {
      std::stringstream ss;
      ss << std::setprecision( 10 );
      for (int c=0; c<nc; c++)
	{
	  if ( c ) ss << "\t";
	  const double v = timeline.data( c , i );
	  if ( std::isnan( v ) ) ss << "NaN";
	  else ss << v;
	}
      ss << "\n";
      f.print( ss.str() );
    }

  f.close();

  //
  // clock
  //

  const std::string timesfile = root + ".times";
  if ( ! f.open_write( timesfile ) )
    throw eprune_error( "write" , "could not open " + timesfile + " for writing" );

  for (int64_t i=0; i<n; i++)
    f << Helper::dbl2str( timeline.clock[i] , 6 ) << "\n";

  f.close();

  //
  // events (loadable; extra columns are ignored on reading)
  //

  const std::string eventsfile = root + ".events";
  if ( ! f.open_write( eventsfile ) )
    throw eprune_error( "write" , "could not open " + eventsfile + " for writing" );

  f << "type\tlatency\tproto\tcode\tduration\toriginal_latency\n";

  event_list_t::const_iterator ee = timeline.events.begin();
  while ( ee != timeline.events.end() )
    {
      f << ee->label << "\t"
	<< ee->latency << "\t"
	<< ee->proto_string() << "\t"
	<< ( ee->code == "" ? globals::missing_field : ee->code ) << "\t"
	<< ee->duration << "\t"
	<< ( ee->prov.has_original ? Helper::int2str( (long)ee->prov.original_latency ) : globals::missing_field )
	<< "\n";
      ++ee;
    }

  f.close();

  logger << "  wrote " << n << " samples to " << datafile << ", with "
	 << timeline.events.size() << " events\n";
}
