
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

#include "defs/defs.h"
#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <iostream>
#include <sstream>

extern logger_t logger;

std::string globals::version = "v0.4.1";
std::string globals::date    = "02-Sep-2026";

int globals::retcode = 0;

std::map<event_type_t,std::string> globals::event_label = {
  { EVT_GENERIC     , "event" } ,
  { EVT_STIM_START  , "stim start" } ,
  { EVT_STIM_END    , "stim end" } ,
  { EVT_SLEEP_STAGE , "Sleep Stage" } ,
  { EVT_BOUNDARY    , "boundary" } };

int globals::stage_min = STAGE_WAKE;
int globals::stage_max = STAGE_REM;

int globals::relocation_buffer = 2;

int globals::time_format_dp = 3;

char globals::folder_delimiter = '/';

std::string globals::mkdir_command = "mkdir -p";

std::string globals::missing_field = ".";

void (*globals::bail_function) ( const std::string & ) = NULL;

bool globals::bail_on_fail = true;

bool globals::silent = false;

bool globals::verbose = false;

param_t globals::param;


void globals::api()
{
  silent = true;
  bail_on_fail = false;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.4.1";

  date    = "02-Sep-2026";

  retcode = 0;

  //
  // Events
  //

  event_label[ EVT_GENERIC ]     = "event";
  event_label[ EVT_STIM_START ]  = "stim start";
  event_label[ EVT_STIM_END ]    = "stim end";
  event_label[ EVT_SLEEP_STAGE ] = "Sleep Stage";
  event_label[ EVT_BOUNDARY ]    = "boundary";

  stage_min = STAGE_WAKE;
  stage_max = STAGE_REM;

  relocation_buffer = 2;

  //
  // Output formats
  //

  time_format_dp = 3;

  folder_delimiter = '/';

  mkdir_command = "mkdir -p";

  missing_field = ".";

  //
  // Behaviour on errors
  //

  bail_function = NULL;

  bail_on_fail = true;

  silent = false;

  verbose = false;

}


std::string globals::event( event_type_t t )
{
  std::map<event_type_t,std::string>::const_iterator ii = event_label.find( t );
  if ( ii == event_label.end() ) return "?";
  return ii->second;
}


event_type_t globals::event_type( const std::string & s )
{
  // labels are matched case-insensitively, ignoring surrounding space
  const std::string t = Helper::lrtrim( s );
  std::map<event_type_t,std::string>::const_iterator ii = event_label.begin();
  while ( ii != event_label.end() )
    {
      if ( ii->first != EVT_GENERIC && Helper::iequals( t , ii->second ) )
	return ii->first;
      ++ii;
    }
  return EVT_GENERIC;
}


std::string globals::diag( diag_kind_t k )
{
  switch ( k )
    {
    case DIAG_UNRESOLVABLE_RELOCATION : return "UnresolvableRelocation";
    case DIAG_PROTOCOL_COUNT_MISMATCH : return "ProtocolCountMismatch";
    case DIAG_MISSING_PROVENANCE      : return "MissingProvenanceField";
    case DIAG_TRAILING_EVENT_DROPPED  : return "TrailingEventDropped";
    case DIAG_LEADING_EVENT_DROPPED   : return "LeadingEventDropped";
    case DIAG_SPANS_MERGED            : return "SpansMerged";
    case DIAG_INVALID_STAGE_CODE      : return "InvalidStageCode";
    case DIAG_UNPAIRED_STIM           : return "UnpairedStimulation";
    }
  return "?";
}


std::string diagnostic_t::as_string() const
{
  std::stringstream ss;
  ss << globals::diag( kind ) << " [" << step << "]";
  if ( event != -1 ) ss << " event " << event;
  ss << ": " << msg;
  return ss.str();
}
