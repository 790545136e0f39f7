
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

#include "db/report.h"
#include "timeline/timeline.h"
#include "timeline/hypno.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"
#include "helper/zfile.h"

#include <algorithm>
#include <map>

extern logger_t logger;


std::string report_row_t::actual_time() const
{
  return has_clock ? Helper::timestring( clock ) : "N/A" ;
}


std::vector<std::string> report_t::columns()
{
  std::vector<std::string> c;
  c.push_back( "Event_Type" );
  c.push_back( "Proto_Type" );
  c.push_back( "Original_Latency_sec" );
  c.push_back( "New_Latency_sec" );
  c.push_back( "Actual_Time" );
  c.push_back( "Shift_Distance_sec" );
  c.push_back( "Moved" );
  c.push_back( "Sleep_Stage" );
  c.push_back( "Relocated" );
  c.push_back( "Provenance" );
  return c;
}


std::vector<std::string> report_t::cells( const report_row_t & row ) const
{
  std::vector<std::string> c;
  c.push_back( row.type );
  c.push_back( row.proto );
  c.push_back( Helper::dbl2str( row.original_sec , 3 ) );
  c.push_back( Helper::dbl2str( row.new_sec , 3 ) );
  c.push_back( row.actual_time() );
  c.push_back( Helper::dbl2str( row.shift_sec , 3 ) );
  c.push_back( row.moved ? "true" : "false" );
  c.push_back( row.stage );
  c.push_back( row.relocated ? "true" : "false" );
  c.push_back( row.fallback ? "fallback" : "original" );
  return c;
}


int report_t::moved() const
{
  int m = 0;
  for (int i=0; i<rows.size(); i++) if ( rows[i].moved ) ++m;
  return m;
}


int report_t::fallbacks() const
{
  int m = 0;
  for (int i=0; i<rows.size(); i++) if ( rows[i].fallback ) ++m;
  return m;
}


nlohmann::json report_t::as_json() const
{
  nlohmann::json j = nlohmann::json::array();

  for (int i=0; i<rows.size(); i++)
    {
      const report_row_t & r = rows[i];

      nlohmann::json row = nlohmann::json::object();
      row[ "Event_Type" ] = r.type;

      int p = 0;
      if ( Helper::str2int( r.proto , &p ) ) row[ "Proto_Type" ] = p;
      else row[ "Proto_Type" ] = nullptr;

      row[ "Original_Latency_sec" ] = r.original_sec;
      row[ "New_Latency_sec" ] = r.new_sec;
      row[ "Actual_Time" ] = r.actual_time();
      row[ "Shift_Distance_sec" ] = r.shift_sec;
      row[ "Moved" ] = r.moved;

      int s = 0;
      if ( Helper::str2int( r.stage , &s ) ) row[ "Sleep_Stage" ] = s;
      else row[ "Sleep_Stage" ] = r.stage;

      row[ "Relocated" ] = r.relocated;
      row[ "Provenance" ] = r.fallback ? "fallback" : "original";

      j.push_back( row );
    }

  return j;
}


void report_t::write_csv( const std::string & filename ) const
{
  zfile_t f;
  if ( ! f.open_write( filename ) )
    throw eprune_error( "write" , "could not open " + filename + " for writing" );

  f << Helper::stringize( columns() , "," ) << "\n";

  for (int i=0; i<rows.size(); i++)
    {
      std::vector<std::string> c = cells( rows[i] );
      // labels may carry commas
      for (int j=0; j<c.size(); j++)
	if ( c[j].find( ',' ) != std::string::npos ) c[j] = "\"" + c[j] + "\"";
      f << Helper::stringize( c , "," ) << "\n";
    }

  f.close();

  logger << "  stim report saved to " << filename << "\n";
}


void report_t::write_json( const std::string & filename ) const
{
  zfile_t f;
  if ( ! f.open_write( filename ) )
    throw eprune_error( "write" , "could not open " + filename + " for writing" );

  f << as_json().dump( 2 ) << "\n";

  f.close();

  logger << "  stim report saved to " << filename << "\n";
}


// original time (rows without one last), then original latency, then id
static bool report_order( const report_row_t & a , const report_row_t & b )
{
  if ( a.has_clock != b.has_clock ) return a.has_clock;
  if ( a.has_clock && a.clock != b.clock ) return a.clock < b.clock;
  if ( a.original_latency != b.original_latency ) return a.original_latency < b.original_latency;
  return a.event < b.event;
}


report_t reconcile( const event_list_t & before ,
		    const event_list_t & after ,
		    const timeline_t & timeline ,
		    const stage_lookup_t & stages ,
		    const event_filter_t & filter )
{

  report_t r;

  r.id = timeline.id;
  r.srate = timeline.srate;

  const double sr = timeline.srate;

  std::map<int,const event_t*> prior;
  event_list_t::const_iterator ee = before.begin();
  while ( ee != before.end() )
    {
      prior[ ee->id ] = &(*ee);
      ++ee;
    }

  ee = after.begin();
  while ( ee != after.end() )
    {

      if ( ! filter.matches( *ee ) ) { ++ee; continue; }

      // provenance: on the event itself, else on its earlier self
      const provenance_t * prov = NULL;

      if ( ee->prov.has_original )
	prov = &ee->prov;
      else
	{
	  std::map<int,const event_t*>::const_iterator pp = prior.find( ee->id );
	  if ( pp != prior.end() && pp->second->prov.has_original )
	    prov = &pp->second->prov;
	}

      report_row_t row;
      row.event = ee->id;
      row.type = ee->label;
      row.proto = ee->proto_string();
      row.latency = ee->latency;
      row.new_sec = ee->latency / sr;
      row.relocated = ee->prov.relocated;

      if ( prov != NULL )
	{
	  row.original_latency = prov->original_latency;

	  // the original clock table is authoritative
	  row.has_clock = timeline.original_clock_at( prov->original_latency , &row.clock );
	  if ( ! row.has_clock )
	    {
	      row.clock = prov->original_clock;
	      row.has_clock = true;
	    }
	}
      else
	{
	  row.fallback = true;
	  row.original_latency = ee->latency;

	  if ( ee->latency >= 1 && ee->latency <= timeline.samples() )
	    {
	      row.clock = timeline.clock_at( ee->latency );
	      row.has_clock = true;
	    }

	  const std::string msg = "no original latency/time for " + ee->as_string()
	    + ", reporting current values";
	  logger.warning( msg );
	  r.diags.push_back( diagnostic_t( DIAG_MISSING_PROVENANCE , "report" , msg , ee->id ) );
	}

      row.original_sec = row.original_latency / sr;
      row.shift_sec = ( row.latency - row.original_latency ) / sr;
      row.moved = row.latency != row.original_latency;
      row.stage = stages.as_string( ee->latency );

      r.rows.push_back( row );
      ++ee;
    }

  std::stable_sort( r.rows.begin() , r.rows.end() , report_order );

  logger << "  reconciliation report: " << r.rows.size() << " events, "
	 << r.moved() << " moved";
  if ( r.fallbacks() )
    logger << ", " << r.fallbacks() << " using fallback values";
  logger << "\n";

  return r;
}
