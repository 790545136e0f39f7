
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

#include "pipeline.h"
#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include "artifacts/artifacts.h"
#include "annot/relocate.h"
#include "annot/protocols.h"
#include "edf/excise.h"
#include "edf/recording.h"
#include "timeline/hypno.h"

extern logger_t logger;


prune_options_t::prune_options_t()
{
  sr = 0;
  out = ".";
  buffer = globals::relocation_buffer;
  prune_protocols = false;
  stage_fill = false;
  csv = true;
  json = false;
  compress = false;
  start = 0;
}


std::set<std::string> prune_options_t::keys()
{
  std::set<std::string> k;
  k.insert( "sr" );
  k.insert( "out" );
  k.insert( "proto" );
  k.insert( "buffer" );
  k.insert( "unwanted" );
  k.insert( "prune-protocols" );
  k.insert( "stage-mode" );
  k.insert( "keep" );
  k.insert( "report" );
  k.insert( "db" );
  k.insert( "compress" );
  k.insert( "silent" );
  k.insert( "verbose" );
  k.insert( "start" );
  return k;
}


void prune_options_t::set( const param_t & param )
{

  param.check( keys() );

  sr = param.requires_dbl( "sr" );
  if ( sr <= 0 ) Helper::halt( "sr must be positive" );

  if ( param.has( "out" ) ) out = param.requires( "out" );

  if ( param.has( "proto" ) )
    {
      std::vector<int> p = param.intvector( "proto" );
      protos = std::set<int>( p.begin() , p.end() );
    }

  if ( param.has( "buffer" ) )
    {
      buffer = param.requires_int( "buffer" );
      if ( buffer < 1 ) Helper::halt( "buffer must be at least 1 sample" );
    }

  if ( param.has( "unwanted" ) )
    {
      std::vector<int> u = param.intvector( "unwanted" );
      unwanted = std::set<int>( u.begin() , u.end() );
    }

  prune_protocols = param.yesno( "prune-protocols" );

  if ( prune_protocols && unwanted.size() == 0 )
    Helper::halt( "prune-protocols requires unwanted stages (unwanted=...)" );

  if ( param.has( "stage-mode" ) )
    {
      const std::string m = param.requires( "stage-mode" );
      if ( Helper::iequals( m , "fill" ) ) stage_fill = true;
      else if ( Helper::iequals( m , "excise" ) ) stage_fill = false;
      else Helper::halt( "stage-mode should be excise or fill" );
    }

  if ( param.has( "keep" ) )
    keep = param.strset( "keep" );

  if ( param.has( "report" ) )
    {
      csv = json = false;
      std::set<std::string> f = param.strset( "report" );
      std::set<std::string>::const_iterator ff = f.begin();
      while ( ff != f.end() )
	{
	  if ( Helper::iequals( *ff , "csv" ) ) csv = true;
	  else if ( Helper::iequals( *ff , "json" ) ) json = true;
	  else Helper::halt( "unknown report format: " + *ff );
	  ++ff;
	}
    }

  if ( param.has( "db" ) ) db = param.requires( "db" );

  compress = param.yesno( "compress" );

  if ( param.has( "start" ) )
    {
      if ( ! Helper::timestring( param.requires( "start" ) , &start ) )
	Helper::halt( "could not parse start=" + param.value( "start" ) );
    }

}


//
// one span record per span, with its original coordinates
//

static void record_spans( const timeline_t & tl , const spanset_t & spans ,
			  const std::string & pass , const std::string & action ,
			  std::vector<span_record_t> * recs )
{
  std::vector<span_t>::const_iterator ss = spans.begin();
  while ( ss != spans.end() )
    {
      span_record_t r;
      r.pass = pass;
      r.action = action;
      r.span = *ss;
      r.orig_start = tl.original_sample( ss->start );
      r.orig_stop = tl.original_sample( ss->stop );
      r.seconds = ss->duration_sec( tl.srate );
      recs->push_back( r );
      ++ss;
    }
}


static void add_diags( diagnostics_t * to , const diagnostics_t & from )
{
  to->insert( to->end() , from.begin() , from.end() );
}


prune_result_t pipeline_t::run( const timeline_t & loaded , const diagnostics_t & load_diags )
{

  prune_result_t r;

  r.diags = load_diags;

  const double sr = loaded.srate;

  const event_filter_t interest = event_filter_t::stimulation( opt.protos );

  const int64_t n0 = loaded.samples();

  timeline_t tl = loaded;

  //
  // provenance
  //

  step = "provenance";
  logger.section( "provenance" );

  add_diags( &r.diags , tl.stamp_provenance() );

  // events as they were before any edit, for the report
  const event_list_t before = tl.events;

  //
  // prune: protocols that start in unwanted stages
  //

  step = "prune";

  if ( opt.prune_protocols )
    {
      logger.section( "removing stimulation protocols in unwanted stages" );
      pruned_protocols_t pp = prune_protocols( tl.events , opt.unwanted , opt.protos , sr );
      tl.events = pp.events;
      add_diags( &r.diags , pp.diags );
      r.summary[ "protocols_removed" ] = pp.removed;
      r.summary[ "protocols_remaining" ] = pp.remaining;
    }

  //
  // detect
  //

  step = "detect";
  logger.section( "detecting NaN segments" );

  spanset_t nans = nan_spans( tl );
  log_spans( nans , sr , "NaN" );

  r.summary[ "nan_spans" ] = nans.size();
  r.summary[ "nan_seconds" ] = nans.total() / sr;

  //
  // relocate
  //

  step = "relocate";
  logger.section( "repositioning stim events in NaN segments" );

  int moved = 0 , unresolved = 0;
  if ( nans.empty() )
    logger << "  no NaN segments, no events to reposition\n";
  else
    {
      relocation_t rel = relocate_events( tl , nans , opt.buffer , interest );
      tl.events = rel.events;
      add_diags( &r.diags , rel.diags );
      moved = rel.moved;
      unresolved = rel.unresolved;
    }

  r.summary[ "events_relocated" ] = moved;
  r.summary[ "events_unresolved" ] = unresolved;

  //
  // excise
  //

  step = "excise";
  logger.section( "rejecting NaN segments" );

  int dropped = 0 , boundaries = 0;

  record_spans( tl , nans , "nan" , "excise" , &r.spans );

  excision_t ex = excise( tl , nans );
  tl = ex.timeline;
  add_diags( &r.diags , ex.diags );
  dropped += ex.dropped + ex.leading;
  boundaries += ex.boundaries;

  //
  // stages
  //

  step = "stages";

  if ( opt.unwanted.size() != 0 )
    {
      logger.section( "removing unwanted sleep stages (" + Helper::stringize( opt.unwanted ) + ")" );

      stage_spans_t st = stage_spans( tl , opt.unwanted );
      add_diags( &r.diags , st.diags );

      std::map<int,double>::const_iterator ss = st.seconds.begin();
      while ( ss != st.seconds.end() )
	{
	  r.summary[ "stage_" + Helper::int2str( ss->first ) + "_seconds" ] = ss->second;
	  ++ss;
	}

      r.summary[ "stage_seconds" ] = st.spans.total() / sr;

      record_spans( tl , st.spans , "stages" , opt.stage_fill ? "fill" : "excise" , &r.spans );

      excision_t sx = opt.stage_fill ? fill( tl , st.spans ) : excise( tl , st.spans );
      tl = sx.timeline;
      add_diags( &r.diags , sx.diags );
      dropped += sx.dropped + sx.leading;
      boundaries += sx.boundaries;
    }

  r.summary[ "events_dropped" ] = dropped;
  r.summary[ "boundaries" ] = boundaries;

  // stage in effect, from the markers that survived
  const stage_lookup_t stages( tl.events );

  //
  // filter
  //

  step = "filter";

  if ( opt.keep.size() != 0 )
    {
      logger.section( "filtering events" );
      tl.events = filter_events( tl.events , opt.keep , opt.protos );
    }

  //
  // check
  //

  step = "check";
  logger.section( "checking protocol counts" );

  diagnostics_t mismatches = check_protocol_counts( tl.events , opt.protos );
  add_diags( &r.diags , mismatches );
  r.summary[ "protocol_mismatches" ] = mismatches.size();

  //
  // report
  //

  step = "report";
  logger.section( "reconciliation report" );

  r.report = reconcile( before , tl.events , tl , stages , interest );
  add_diags( &r.diags , r.report.diags );

  //
  // summary
  //

  r.summary[ "samples_before" ] = n0;
  r.summary[ "samples_after" ] = tl.samples();
  r.summary[ "seconds_removed" ] = ( n0 - tl.samples() ) / sr;
  r.summary[ "events" ] = tl.events.size();
  r.summary[ "report_rows" ] = r.report.rows.size();
  r.summary[ "events_moved" ] = r.report.moved();
  r.summary[ "diagnostics" ] = r.diags.size();

  logger.section( "summary" );

  logger << "  samples: " << n0 << " -> " << tl.samples()
	 << " (" << Helper::dbl2str( ( n0 - tl.samples() ) / sr , 2 ) << " s removed)\n"
	 << "  NaN segments: " << nans.size() << ", "
	 << Helper::dbl2str( nans.total() / sr , 2 ) << " s\n";

  if ( opt.unwanted.size() != 0 )
    logger << "  unwanted stages: " << Helper::dbl2str( r.summary[ "stage_seconds" ] , 2 ) << " s "
	   << ( opt.stage_fill ? "filled" : "removed" ) << "\n";

  logger << "  events: " << moved << " relocated, " << unresolved << " not relocatable, "
	 << dropped << " dropped, " << boundaries << " boundary markers\n";

  std::set<int> protos = opt.protos.size() ? opt.protos : stim_protos( tl.events );
  std::set<int>::const_iterator pp = protos.begin();
  while ( pp != protos.end() )
    {
      logger << "  proto " << *pp << ": "
	     << tl.count( EVT_STIM_START , *pp ) << " stim start, "
	     << tl.count( EVT_STIM_END , *pp ) << " stim end\n";
      ++pp;
    }

  if ( r.diags.size() != 0 )
    {
      logger << "  " << r.diags.size() << " diagnostic(s):\n";
      for (int i=0; i<r.diags.size(); i++)
	logger << "    " << r.diags[i].as_string() << "\n";
    }

  r.timeline = tl;

  return r;
}


void pipeline_t::write( const prune_result_t & r )
{
  const std::string & id = r.timeline.id;
  const std::string root = opt.out + globals::folder_delimiter + id;

  write_recording( r.timeline , opt.out , opt.compress );

  if ( opt.csv ) r.report.write_csv( root + "-report.csv" );

  if ( opt.json ) r.report.write_json( root + "-report.json" );

  if ( db != NULL )
    db->write( id , r.report , r.spans , r.summary , r.diags );
}


prune_result_t pipeline_t::process( const sample_list_t & rec )
{

  step = "load";

  logger.section( "loading " + rec.id );

  diagnostics_t load_diags;

  timeline_t loaded = load_recording( rec , opt.sr , opt.start , &load_diags );

  prune_result_t r = run( loaded , load_diags );

  step = "write";

  logger.section( "writing" );

  write( r );

  return r;
}


int pipeline_t::batch( const std::vector<sample_list_t> & recs )
{

  int failed = 0;

  for (int i=0; i<recs.size(); i++)
    {

      const std::string & id = recs[i].id;

      const std::string logfile = opt.out + globals::folder_delimiter + id + ".log";
      if ( ! logger.write_log( logfile ) )
	logger.warning( "could not open log file " + logfile );

      logger.reset_warnings();

      logger << "\n___________________________________________________________________\n"
	     << "Processing: " << id << " [ #" << i+1 << " of " << recs.size() << " ]\n";

      try
	{
	  prune_result_t r = process( recs[i] );
	  logger << "  done: " << r.report.rows.size() << " events reported, "
		 << logger.warnings() << " warnings\n";
	}
      catch ( const eprune_error & e )
	{
	  ++failed;
	  logger << "  recording " << id << " failed at step " << e.step << ": " << e.what() << "\n";
	  if ( db != NULL ) db->failed( id , e.step , e.what() );
	}
      catch ( const std::exception & e )
	{
	  ++failed;
	  logger << "  recording " << id << " failed at step " << step << ": " << e.what() << "\n";
	  if ( db != NULL ) db->failed( id , step , e.what() );
	}

      logger.stop_writing_log();
    }

  if ( failed ) globals::retcode = 1;

  logger << "\n  processed " << recs.size() << " recordings, " << failed << " failed\n";

  return failed;
}
