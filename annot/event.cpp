
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

#include "annot/event.h"
#include "helper/helper.h"

#include <algorithm>

std::string event_t::proto_string() const
{
  return has_proto ? Helper::int2str( proto ) : globals::missing_field ;
}

std::string event_t::stage_string() const
{
  return has_stage ? Helper::int2str( stage ) : "unknown" ;
}

std::string event_t::as_string() const
{
  std::stringstream ss;
  ss << "Type=" << label
     << ", Proto_Type=" << proto_string()
     << ", Latency=" << latency;
  return ss.str();
}

void sort_events( event_list_t * events )
{
  std::sort( events->begin() , events->end() );
}

int max_event_id( const event_list_t & events )
{
  int m = -1;
  event_list_t::const_iterator ee = events.begin();
  while ( ee != events.end() )
    {
      if ( ee->id > m ) m = ee->id;
      ++ee;
    }
  return m;
}

event_filter_t event_filter_t::stimulation( const std::set<int> & protos )
{
  event_filter_t f;
  f.types.insert( EVT_STIM_START );
  f.types.insert( EVT_STIM_END );
  f.protos = protos;
  return f;
}

bool event_filter_t::matches( const event_t & e ) const
{
  if ( types.size() != 0 && types.find( e.type ) == types.end() ) return false;
  if ( protos.size() == 0 ) return true;
  return e.has_proto && protos.find( e.proto ) != protos.end();
}
