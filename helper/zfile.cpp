
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

#include "helper/zfile.h"
#include "helper/helper.h"

#include <cstring>

bool zfile_t::open_read( const std::string & f )
{
  close();

  filename = Helper::expand( f );
  writing = false;
  nlines = 0;

  gz = gzopen( filename.c_str() , "rb" );
  if ( gz == NULL ) return false;

  // zlib reads uncompressed files transparently; note which we have
  compressed = ! gzdirect( gz );

  return true;
}


bool zfile_t::open_write( const std::string & f , bool compress )
{
  close();

  filename = Helper::expand( f );
  writing = true;
  nlines = 0;

  compressed = compress || Helper::file_extension( filename , "gz" );

  if ( compressed )
    {
      gz = gzopen( filename.c_str() , "wb" );
      return gz != NULL;
    }

  out.open( filename.c_str() );
  return out.good();
}


bool zfile_t::getline( std::string * line )
{

  line->clear();

  if ( gz == NULL || writing ) return false;

  char buffer[ 65536 ];

  bool any = false;

  while ( true )
    {

      if ( gzgets( gz , buffer , sizeof( buffer ) ) == NULL )
	break;

      any = true;

      const size_t n = strlen( buffer );

      if ( n > 0 && buffer[ n - 1 ] == '\n' )
	{
	  line->append( buffer , n - 1 );
	  break;
	}

      // line longer than the buffer: keep reading
      line->append( buffer , n );
    }

  if ( ! any ) return false;

  if ( line->size() > 0 && (*line)[ line->size() - 1 ] == '\r' )
    line->resize( line->size() - 1 );

  ++nlines;

  return true;
}


void zfile_t::print( const std::string & s )
{
  if ( ! writing ) return;

  if ( compressed )
    {
      if ( gz != NULL && s.size() > 0 )
	gzwrite( gz , s.data() , (unsigned)s.size() );
    }
  else if ( out.is_open() )
    out << s;
}


void zfile_t::close()
{
  if ( gz != NULL )
    {
      gzclose( gz );
      gz = NULL;
    }

  if ( out.is_open() )
    out.close();
}
