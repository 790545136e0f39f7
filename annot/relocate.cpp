
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

#include "annot/relocate.h"
#include "timeline/timeline.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

extern logger_t logger;

relocation_t relocate_events( const timeline_t & timeline ,
			      const spanset_t & spans ,
			      int buffer ,
			      const event_filter_t & filter )
{

  if ( buffer < 1 )
    throw eprune_error( "relocate" , "relocation buffer must be at least 1 sample" );

  if ( spans.stale( timeline.revision ) )
    throw eprune_error( "relocate" , "spans were computed against timeline revision "
			+ ( spans.basis == -1 ? std::string( "(unstamped)" ) : Helper::int2str( spans.basis ) )
			+ ", not the current revision "
			+ Helper::int2str( timeline.revision ) );

  relocation_t r;

  r.events = timeline.events;

  const int64_t n = timeline.samples();

  const double sr = timeline.srate;

  int start_remained = 0 , end_remained = 0;

  event_list_t::iterator ee = r.events.begin();
  while ( ee != r.events.end() )
    {

      if ( ! filter.matches( *ee ) ) { ++ee; continue; }

      const int idx = spans.find( ee->latency );

      if ( idx == -1 )
	{
	  ++r.unmoved;
	  if ( ee->type == EVT_STIM_START ) ++start_remained;
	  else if ( ee->type == EVT_STIM_END ) ++end_remained;

	  if ( globals::verbose )
	    logger << "  Unmoved Event: " << ee->as_string() << "\n";

	  ++ee;
	  continue;
	}

      // first sample at least 'buffer' past the span that also survives
      int64_t target = spans[idx].stop + buffer;
      int j = spans.find( target );
      while ( j != -1 )
	{
	  target = spans[j].stop + buffer;
	  j = spans.find( target );
	}

      if ( target > n )
	{
	  const std::string msg = "event \"" + ee->label + "\" at latency "
	    + Helper::int2str( (long)ee->latency )
	    + " cannot be repositioned beyond data length ("
	    + Helper::int2str( (long)n ) + "), left in place";

	  logger.warning( msg );
	  r.diags.push_back( diagnostic_t( DIAG_UNRESOLVABLE_RELOCATION , "relocate" , msg , ee->id ) );
	  ++r.unresolved;
	  ++ee;
	  continue;
	}

      // first mover wins: never overwrite an earlier original
      if ( ! ee->prov.has_original && ee->latency >= 1 && ee->latency <= n )
	{
	  ee->prov.has_original = true;
	  ee->prov.original_latency = timeline.original_sample( ee->latency );
	  ee->prov.original_clock = timeline.clock_at( ee->latency );
	}

      const double shift = ( target - ee->latency ) / sr;

      logger << "  Moved Event: Type=" << ee->label
	     << ", Proto_Type=" << ee->proto_string()
	     << ", Original Latency=" << ee->latency
	     << ", New Latency=" << target
	     << ", Shift=" << Helper::dbl2str( shift , 2 ) << " seconds\n";

      ee->latency = target;
      ee->prov.relocated = true;
      ee->prov.shift_sec += shift;

      ++r.moved;
      ++ee;
    }

  // a moved event can now sit after events that used to follow it
  sort_events( &r.events );

  logger << "  relocation summary: " << r.moved << " moved, "
	 << r.unresolved << " could not be moved, "
	 << start_remained << " stim start and "
	 << end_remained << " stim end remained in place\n";

  return r;
}
