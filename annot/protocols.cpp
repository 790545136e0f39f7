
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

#include "annot/protocols.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <map>

extern logger_t logger;

protocols_t pair_protocols( const event_list_t & events0 , int proto )
{
  protocols_t r;

  event_list_t events = events0;
  sort_events( &events );

  const int n = events.size();

  int i = 0;
  while ( i < n )
    {
      const event_t & e = events[i];

      if ( ! ( e.type == EVT_STIM_START && e.has_proto && e.proto == proto ) )
	{
	  ++i;
	  continue;
	}

      int j = i + 1;
      while ( j < n )
	{
	  if ( events[j].type == EVT_STIM_END && events[j].has_proto && events[j].proto == proto )
	    break;
	  ++j;
	}

      if ( j == n )
	{
	  const std::string msg = "stim start (proto " + Helper::int2str( proto )
	    + ") at latency " + Helper::int2str( (long)e.latency )
	    + " has no following stim end, not paired";
	  logger.warning( msg );
	  r.diags.push_back( diagnostic_t( DIAG_UNPAIRED_STIM , "prune" , msg , e.id ) );
	  ++i;
	  continue;
	}

      protocol_t p;
      p.proto = proto;
      p.number = r.protocols.size() + 1;
      p.start = e.id;
      p.end = events[j].id;
      r.protocols.push_back( p );

      i = j + 1;
    }

  return r;
}


std::set<int> stim_protos( const event_list_t & events )
{
  std::set<int> s;
  event_list_t::const_iterator ee = events.begin();
  while ( ee != events.end() )
    {
      if ( ee->is_stim() && ee->has_proto ) s.insert( ee->proto );
      ++ee;
    }
  return s;
}


pruned_protocols_t prune_protocols( const event_list_t & events0 ,
				    const std::set<int> & unwanted ,
				    const std::set<int> & protos0 ,
				    double sr )
{

  pruned_protocols_t r;

  event_list_t events = events0;
  sort_events( &events );

  const std::set<int> protos = protos0.size() == 0 ? stim_protos( events ) : protos0;

  // event id -> index into 'all'
  std::vector<protocol_t> all;
  std::map<int,int> member;

  std::set<int>::const_iterator pp = protos.begin();
  while ( pp != protos.end() )
    {
      protocols_t p = pair_protocols( events , *pp );
      r.diags.insert( r.diags.end() , p.diags.begin() , p.diags.end() );
      for (int i=0; i<p.protocols.size(); i++)
	{
	  member[ p.protocols[i].start ] = all.size();
	  member[ p.protocols[i].end ] = all.size();
	  all.push_back( p.protocols[i] );
	}
      ++pp;
    }

  std::set<int> remove;

  for (int i=0; i + 1 < (int)events.size(); i++)
    {
      const event_t & e = events[i];

      if ( ! e.is_stage() ) continue;
      if ( ! e.has_stage ) continue;
      if ( unwanted.find( e.stage ) == unwanted.end() ) continue;

      const event_t & next = events[i+1];
      if ( ! next.is_stim() ) continue;

      std::map<int,int>::const_iterator mm = member.find( next.id );
      if ( mm == member.end() ) continue;
      if ( remove.find( mm->second ) != remove.end() ) continue;

      remove.insert( mm->second );

      const protocol_t & p = all[ mm->second ];
      logger << "  removing protocol " << p.number << " (" << next.label
	     << " of type " << p.proto << " at "
	     << Helper::dbl2str( next.latency / sr , 2 ) << " s (sample "
	     << next.latency << ") and its counterpart) during sleep stage "
	     << e.stage << "\n";
    }

  std::set<int> drop;
  std::set<int>::const_iterator rr = remove.begin();
  while ( rr != remove.end() )
    {
      drop.insert( all[ *rr ].start );
      drop.insert( all[ *rr ].end );
      ++rr;
    }

  event_list_t::const_iterator ee = events.begin();
  while ( ee != events.end() )
    {
      if ( drop.find( ee->id ) == drop.end() )
	r.events.push_back( *ee );
      ++ee;
    }

  r.removed = remove.size();
  r.remaining = all.size() - remove.size();

  if ( r.removed == 0 )
    logger << "  no stimulation protocols follow the unwanted sleep stages\n";
  else
    logger << "  total protocols removed: " << r.removed << "\n";

  logger << "  total protocols remaining: " << r.remaining << "\n";

  return r;
}


diagnostics_t check_protocol_counts( const event_list_t & events ,
				     const std::set<int> & protos0 )
{
  diagnostics_t diags;

  const std::set<int> protos = protos0.size() == 0 ? stim_protos( events ) : protos0;

  std::set<int>::const_iterator pp = protos.begin();
  while ( pp != protos.end() )
    {
      int starts = 0 , ends = 0;
      event_list_t::const_iterator ee = events.begin();
      while ( ee != events.end() )
	{
	  if ( ee->has_proto && ee->proto == *pp )
	    {
	      if ( ee->type == EVT_STIM_START ) ++starts;
	      else if ( ee->type == EVT_STIM_END ) ++ends;
	    }
	  ++ee;
	}

      logger << "  proto " << *pp << ": " << starts << " stim start, " << ends << " stim end\n";

      if ( starts != ends )
	{
	  const std::string msg = "protocol-type " + Helper::int2str( *pp ) + " has "
	    + Helper::int2str( starts ) + " stim start but "
	    + Helper::int2str( ends ) + " stim end events";
	  logger.warning( msg );
	  diags.push_back( diagnostic_t( DIAG_PROTOCOL_COUNT_MISMATCH , "check" , msg ) );
	}

      ++pp;
    }

  return diags;
}


event_list_t filter_events( const event_list_t & events ,
			    const std::set<std::string> & keep ,
			    const std::set<int> & protos )
{

  logger << "  keeping events of types: "
	 << ( keep.size() == 0 ? "(any)" : Helper::stringize( keep , ", " ) ) << "\n";
  if ( protos.size() != 0 )
    logger << "  keeping proto types: " << Helper::stringize( protos , ", " ) << "\n";

  event_list_t r;

  event_list_t::const_iterator ee = events.begin();
  while ( ee != events.end() )
    {
      bool type_ok = keep.size() == 0;
      std::set<std::string>::const_iterator kk = keep.begin();
      while ( ! type_ok && kk != keep.end() )
	{
	  if ( Helper::iequals( Helper::lrtrim( *kk ) , ee->label ) ) type_ok = true;
	  ++kk;
	}

      const bool proto_ok = protos.size() == 0
	|| ( ee->has_proto && protos.find( ee->proto ) != protos.end() );

      if ( type_ok && proto_ok )
	r.push_back( *ee );

      ++ee;
    }

  logger << "  original number of events: " << events.size() << "\n"
	 << "  number of remaining events: " << r.size() << "\n";

  for (int i=0; i<r.size(); i++)
    logger << "  event " << i+1 << ": '" << r[i].label << "', proto "
	   << r[i].proto_string() << ", latency " << r[i].latency << "\n";

  return r;
}
