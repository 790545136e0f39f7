
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

#include "timeline/hypno.h"
#include "timeline/timeline.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <algorithm>

extern logger_t logger;

stage_spans_t stage_spans( const timeline_t & timeline , const std::set<int> & unwanted0 )
{

  stage_spans_t r;

  r.spans.basis = timeline.revision;
  r.spans.category = "stage";

  std::set<int> unwanted;
  std::set<int>::const_iterator uu = unwanted0.begin();
  while ( uu != unwanted0.end() )
    {
      if ( globals::valid_stage( *uu ) )
	unwanted.insert( *uu );
      else
	logger.warning( "ignoring unwanted stage code " + Helper::int2str( *uu )
			+ ", valid codes are " + Helper::int2str( globals::stage_min )
			+ " to " + Helper::int2str( globals::stage_max ) );
      ++uu;
    }

  if ( unwanted.size() == 0 )
    {
      logger << "  no valid unwanted stages requested\n";
      return r;
    }

  const int64_t n = timeline.samples();

  // stage markers, in order
  std::vector<const event_t*> markers;
  event_list_t::const_iterator ee = timeline.events.begin();
  while ( ee != timeline.events.end() )
    {
      if ( ee->is_stage() ) markers.push_back( &(*ee) );
      ++ee;
    }

  for (int i=1; i<markers.size(); i++)
    if ( markers[i]->latency == markers[i-1]->latency )
      {
	logger.warning( "sleep stage markers share latency "
			+ Helper::int2str( (long)markers[i]->latency ) );
	break;
      }

  std::vector<span_t> raw;

  for (int i=0; i<markers.size(); i++)
    {
      const event_t & m = *markers[i];

      if ( ! m.has_stage )
	{
	  logger << "  ignoring sleep stage marker at " << m.latency
		 << " with invalid code '" << m.code << "'\n";
	  continue;
	}

      if ( unwanted.find( m.stage ) == unwanted.end() ) continue;

      int64_t start = m.latency;
      int64_t stop = i + 1 < markers.size() ? markers[i+1]->latency - 1 : n;

      if ( start < 1 ) start = 1;
      if ( stop > n ) stop = n;

      if ( stop < start )
	{
	  logger.warning( "stage " + Helper::int2str( m.stage ) + " marker at "
			  + Helper::int2str( (long)m.latency ) + " gives an empty bout, skipped" );
	  continue;
	}

      span_t s( start , stop );
      raw.push_back( s );
      r.seconds[ m.stage ] += s.duration_sec( timeline.srate );
      ++r.bouts[ m.stage ];
    }

  if ( raw.size() == 0 )
    {
      logger << "  no unwanted stages found\n";
      return r;
    }

  spanset_t spans = spanset_t::normalize( raw , 1 , &r.diags );
  spans.basis = timeline.revision;
  spans.category = "stage";
  r.spans = spans;

  std::set<int>::const_iterator ss = unwanted.begin();
  while ( ss != unwanted.end() )
    {
      logger << "  stage " << *ss << ": " << r.bouts[ *ss ] << " bouts, "
	     << Helper::dbl2str( r.seconds[ *ss ] , 2 ) << " s\n";
      ++ss;
    }

  return r;
}


stage_lookup_t::stage_lookup_t( const event_list_t & events )
{
  event_list_t sorted = events;
  sort_events( &sorted );

  event_list_t::const_iterator ee = sorted.begin();
  while ( ee != sorted.end() )
    {
      if ( ee->is_stage() )
	{
	  latency.push_back( ee->latency );
	  stage.push_back( ee->has_stage ? ee->stage : -1 );
	}
      ++ee;
    }
}


bool stage_lookup_t::lookup( int64_t lat , int * s ) const
{
  // last marker with latency <= lat
  std::vector<int64_t>::const_iterator ii = std::upper_bound( latency.begin() , latency.end() , lat );
  if ( ii == latency.begin() ) return false;
  const int idx = ( ii - latency.begin() ) - 1;
  if ( stage[ idx ] == -1 ) return false;
  *s = stage[ idx ];
  return true;
}


std::string stage_lookup_t::as_string( int64_t lat ) const
{
  int s = -1;
  return lookup( lat , &s ) ? Helper::int2str( s ) : "unknown";
}
