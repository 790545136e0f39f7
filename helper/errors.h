
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

#ifndef __EPRUNE_ERRORS_H__
#define __EPRUNE_ERRORS_H__

#include <stdexcept>
#include <string>

//
// Fatal conditions abort the current recording (never the batch); the
// step tag ends up in the 'failed at step' line written by the driver
//

struct eprune_error : public std::runtime_error
{
  eprune_error( const std::string & step , const std::string & msg )
    : std::runtime_error( msg ) , step( step ) { }

  std::string step;
};

// a span with start > stop, or outside the data at detection time
struct invalid_span_error : public eprune_error
{
  invalid_span_error( const std::string & msg )
    : eprune_error( "detect" , msg ) { }
};

// a span outside [1,N] (or computed against another revision) at excision time
struct excision_range_error : public eprune_error
{
  excision_range_error( const std::string & msg )
    : eprune_error( "excise" , msg ) { }
};

// malformed or missing input files
struct load_error : public eprune_error
{
  load_error( const std::string & msg )
    : eprune_error( "load" , msg ) { }
};

#endif
