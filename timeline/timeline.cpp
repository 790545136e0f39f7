
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

#include "timeline/timeline.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;

void timeline_t::init_provenance()
{
  const int64_t n = samples();

  orig_index.resize( n );
  for (int64_t i=0; i<n; i++)
    orig_index[i] = i + 1;

  original_clock.reset( new std::vector<double>( clock ) );

  revision = 0;
  excised.clear();
  pending.clear();
}


diagnostics_t timeline_t::stamp_provenance()
{
  diagnostics_t diags;

  const int64_t n = samples();

  int stamped = 0;

  event_list_t::iterator ee = events.begin();
  while ( ee != events.end() )
    {
      if ( ee->prov.has_original ) { ++ee; continue; }

      if ( ee->latency < 1 || ee->latency > n )
	{
	  diags.push_back( diagnostic_t( DIAG_MISSING_PROVENANCE , "provenance" ,
					 "latency " + Helper::int2str( (long)ee->latency )
					 + " is outside 1.." + Helper::int2str( (long)n )
					 + ", no original time recorded" ,
					 ee->id ) );
	  ++ee;
	  continue;
	}

      ee->prov.has_original = true;
      ee->prov.original_latency = original_sample( ee->latency );
      ee->prov.original_clock = clock_at( ee->latency );
      ++stamped;
      ++ee;
    }

  logger << "  recorded original latency and time for " << stamped << " events\n";

  return diags;
}


bool timeline_t::original_clock_at( int64_t s , double * c ) const
{
  if ( ! original_clock ) return false;
  if ( s < 1 || s > (int64_t)original_clock->size() ) return false;
  *c = (*original_clock)[ s - 1 ];
  return true;
}


bool timeline_t::consistent( std::string * msg ) const
{
  const int64_t n = samples();

  if ( (int64_t)clock.size() != n )
    {
      *msg = "clock table has " + Helper::int2str( (long)clock.size() )
	+ " entries for " + Helper::int2str( (long)n ) + " samples";
      return false;
    }

  if ( (int64_t)orig_index.size() != n )
    {
      *msg = "original-index table has " + Helper::int2str( (long)orig_index.size() )
	+ " entries for " + Helper::int2str( (long)n ) + " samples";
      return false;
    }

  for (int64_t i=1; i<n; i++)
    if ( clock[i] < clock[i-1] )
      {
	*msg = "clock table decreases at sample " + Helper::int2str( (long)(i+1) );
	return false;
      }

  return true;
}


int timeline_t::count( event_type_t t , int proto ) const
{
  int c = 0;
  event_list_t::const_iterator ee = events.begin();
  while ( ee != events.end() )
    {
      if ( ee->type == t && ( proto == -1 || ( ee->has_proto && ee->proto == proto ) ) )
	++c;
      ++ee;
    }
  return c;
}
