
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

#include "edf/excise.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include <limits>
#include <map>

extern logger_t logger;


// spans must index into this revision, within 1..N
static void check_range( const timeline_t & timeline , const spanset_t & spans )
{

  if ( spans.stale( timeline.revision ) )
    {
      if ( spans.basis == -1 )
	throw excision_range_error( "stale span set: not stamped with a revision,"
				    " but the timeline has already been excised (revision "
				    + Helper::int2str( timeline.revision ) + ")" );

      throw excision_range_error( "stale span set: computed against timeline revision "
				  + Helper::int2str( spans.basis )
				  + " but the timeline is at revision "
				  + Helper::int2str( timeline.revision ) );
    }

  const int64_t n = timeline.samples();

  std::vector<span_t>::const_iterator ss = spans.begin();
  while ( ss != spans.end() )
    {
      if ( ss->start > ss->stop || ss->start < 1 || ss->stop > n )
	throw excision_range_error( "span " + ss->as_string()
				    + " is outside the timeline [1,"
				    + Helper::int2str( (long)n ) + "]" );
      ++ss;
    }
}


excision_t excise( const timeline_t & timeline , const spanset_t & input )
{

  excision_t r;

  if ( input.empty() )
    {
      logger << "  nothing to excise\n";
      r.timeline = timeline;
      return r;
    }

  check_range( timeline , input );

  //
  // 1. normalize, in case the caller did not
  //

  spanset_t spans = spanset_t::normalize( input.spans() , input.gap , &r.diags );
  spans.category = input.category;

  const std::string what = spans.category == "" ? "" : spans.category + " ";

  const int64_t n = timeline.samples();
  const int64_t removed = spans.total();
  const int64_t n2 = n - removed;

  std::vector<span_t>::const_iterator ss = spans.begin();
  while ( ss != spans.end() )
    {
      logger << "  excising " << what << "span " << ss->start << " to " << ss->stop
	     << " (" << ss->length() << " samples, "
	     << Helper::dbl2str( ss->duration_sec( timeline.srate ) , 2 ) << " s)\n";
      ++ss;
    }

  timeline_t & t = r.timeline;

  t.id = timeline.id;
  t.srate = timeline.srate;
  t.labels = timeline.labels;
  t.original_clock = timeline.original_clock;
  t.revision = timeline.revision + 1;

  //
  // 2. events inside spans go, unless they mark an earlier seam
  //

  std::map<std::string,int> dropped_by_type;

  event_list_t::const_iterator ee = timeline.events.begin();
  while ( ee != timeline.events.end() )
    {
      if ( spans.find( ee->latency ) != -1 )
	{
	  if ( ee->is_boundary() )
	    ++r.protected_moved;
	  else
	    {
	      ++r.dropped;
	      ++dropped_by_type[ ee->label ];
	      if ( globals::verbose )
		logger << "  dropping event inside excised span: " << ee->as_string() << "\n";
	      ++ee;
	      continue;
	    }
	}

      t.events.push_back( *ee );
      ++ee;
    }

  //
  // 3, 4. one set of kept runs drives matrix, clock and index tables
  //

  t.data.resize( timeline.nchannels() , n2 );
  t.clock.resize( n2 );
  t.orig_index.resize( n2 );

  int64_t dst = 0;
  int64_t from = 1;

  for (int i=0; i<=spans.size(); i++)
    {
      // kept run: [from, to]
      const int64_t to = i < spans.size() ? spans[i].start - 1 : n;
      const int64_t len = to - from + 1;

      if ( len > 0 )
	{
	  t.data.middleCols( dst , len ) = timeline.data.middleCols( from - 1 , len );

	  std::copy( timeline.clock.begin() + ( from - 1 ) ,
		     timeline.clock.begin() + to ,
		     t.clock.begin() + dst );

	  std::copy( timeline.orig_index.begin() + ( from - 1 ) ,
		     timeline.orig_index.begin() + to ,
		     t.orig_index.begin() + dst );

	  dst += len;
	}

      if ( i < spans.size() )
	from = spans[i].stop + 1;
    }

  //
  // 5. single pass: each survivor moves back by what was removed before it
  //    (a protected marker inside a span lands on that span's seam)
  //

  event_list_t::iterator tt = t.events.begin();
  while ( tt != t.events.end() )
    {
      tt->latency -= spans.removed_before( tt->latency );
      ++tt;
    }

  //
  // 6. boundary markers at each seam; a marker already on the seam
  //    (from an earlier pass) absorbs the new span
  //

  int next_id = max_event_id( timeline.events ) + 1;

  ss = spans.begin();
  while ( ss != spans.end() )
    {
      const int64_t seam = ss->start - spans.removed_before( ss->start );
      const int64_t orig = timeline.original_sample( ss->start );

      event_t * prior = NULL;
      event_list_t::iterator bb = t.events.begin();
      while ( bb != t.events.end() )
	{
	  if ( bb->is_boundary() && bb->latency == seam ) { prior = &(*bb); break; }
	  ++bb;
	}

      if ( prior != NULL )
	{
	  prior->duration += ss->length();
	  if ( prior->code == "" ) prior->code = spans.category;
	  if ( ! prior->prov.has_original || orig < prior->prov.original_latency )
	    {
	      prior->prov.has_original = true;
	      prior->prov.original_latency = orig;
	      prior->prov.original_clock = timeline.clock_at( ss->start );
	    }
	  ++r.boundaries_merged;
	  ++ss;
	  continue;
	}

      event_t b( EVT_BOUNDARY , seam );
      b.id = next_id++;
      b.duration = ss->length();
      b.code = spans.category;
      b.prov.has_original = true;
      b.prov.original_latency = orig;
      b.prov.original_clock = timeline.clock_at( ss->start );
      t.events.push_back( b );
      ++r.boundaries;
      ++ss;
    }

  //
  // 7. restore order
  //

  sort_events( &t.events );

  //
  // 8. events outside the new timeline: before sample 1 (as loaded)
  //    or past the new end
  //

  while ( t.events.size() > 0 && t.events.front().latency < 1 )
    {
      const event_t & e = t.events.front();

      const std::string msg = "dropping event before the first sample: " + e.as_string();
      logger.warning( msg );
      r.diags.push_back( diagnostic_t( DIAG_LEADING_EVENT_DROPPED , "excise" , msg , e.id ) );

      ++r.leading;
      t.events.erase( t.events.begin() );
    }

  while ( t.events.size() > 0 && t.events.back().latency > n2 )
    {
      const event_t & e = t.events.back();

      if ( e.is_boundary() )
	logger << "  removing boundary marker at " << e.latency
	       << ", past the last sample (" << n2 << ")\n";
      else
	{
	  const std::string msg = "dropping trailing event past the last sample ("
	    + Helper::int2str( (long)n2 ) + "): " + e.as_string();
	  logger.warning( msg );
	  r.diags.push_back( diagnostic_t( DIAG_TRAILING_EVENT_DROPPED , "excise" , msg , e.id ) );
	}

      ++r.trailing;
      t.events.pop_back();
    }

  //
  // provenance: cumulative excised spans (original coordinates)
  //

  t.excised = timeline.excised;
  ss = spans.begin();
  while ( ss != spans.end() )
    {
      t.excised.insert( span_t( timeline.original_sample( ss->start ) ,
				timeline.original_sample( ss->stop ) ) );
      ++ss;
    }

  // pending (NaN-filled) regions that survive, in new coordinates

  std::vector<span_t>::const_iterator pp = timeline.pending.begin();
  while ( pp != timeline.pending.end() )
    {
      int64_t a = pp->start;
      int k = spans.find( a );
      while ( k != -1 ) { a = spans[k].stop + 1; k = spans.find( a ); }

      int64_t b = pp->stop;
      k = spans.find( b );
      while ( k != -1 ) { b = spans[k].start - 1; k = spans.find( b ); }

      if ( a <= b )
	t.pending.insert( span_t( a - spans.removed_before( a ) ,
				  b - spans.removed_before( b ) ) );
      ++pp;
    }

  r.removed = removed;

  std::string msg;
  if ( ! t.consistent( &msg ) )
    throw excision_range_error( "timeline inconsistent after excision: " + msg );

  //
  // summary
  //

  std::map<std::string,int>::const_iterator dd = dropped_by_type.begin();
  while ( dd != dropped_by_type.end() )
    {
      logger << "  dropped " << dd->second << " " << dd->first << " event(s) inside excised spans\n";
      ++dd;
    }

  logger << "  keeping " << n2 << " samples of " << n
	 << ", removed " << removed << " ("
	 << Helper::dbl2str( removed / timeline.srate , 2 ) << " s) in "
	 << spans.size() << " " << what << "spans; "
	 << r.boundaries << " boundary markers inserted\n";

  return r;
}


excision_t fill( const timeline_t & timeline , const spanset_t & input )
{

  excision_t r;

  r.timeline = timeline;

  if ( input.empty() )
    {
      logger << "  nothing to fill\n";
      return r;
    }

  check_range( timeline , input );

  spanset_t spans = spanset_t::normalize( input.spans() , input.gap , &r.diags );

  const double nan = std::numeric_limits<double>::quiet_NaN();

  std::vector<span_t>::const_iterator ss = spans.begin();
  while ( ss != spans.end() )
    {
      r.timeline.data.middleCols( ss->start - 1 , ss->length() ).setConstant( nan );
      r.timeline.pending.insert( *ss );

      logger << "  filling " << ( input.category == "" ? "" : input.category + " " )
	     << "span " << ss->start << " to " << ss->stop
	     << " with NaN (" << Helper::dbl2str( ss->duration_sec( timeline.srate ) , 2 ) << " s)\n";
      ++ss;
    }

  logger << "  " << spans.total() << " samples marked for later rejection\n";

  return r;
}
