
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

#ifndef __HELPER_H__
#define __HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm>
#include <cctype>
#include <stdint.h>
#include <map>
#include <cmath>

namespace Helper
{

  //
  // strings
  //

  std::string toupper( const std::string & );

  std::string lrtrim( const std::string & s );

  // drop one enclosing pair of quotes (" or q2)
  std::string unquote( const std::string & s , const char q2 = '"' );

  // drop every quote character (" or q2)
  std::string strip_quotes( const std::string & s , const char q2 = '"' );

  // case insensitive comparison
  bool iequals( const std::string & a , const std::string & b );

  // 0 n N f F (or empty) is 'no', anything else 'yes'
  bool yesno( const std::string & );

  template<typename T>
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;

      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }

  //
  // splitting: any character in 'delim' separates tokens; with 'empty',
  // empty slots come back as '.', otherwise they are skipped
  //

  std::vector<std::string> parse( const std::string & item ,
				  const std::string & delim = " \t\n" ,
				  bool empty = false );

  // as parse(), but delimiters inside quotes (" q q2) do not split
  std::vector<std::string> quoted_parse( const std::string & item ,
					 const std::string & delim ,
					 const char q = '"' , const char q2 = '\'' ,
					 bool empty = false );

  //
  // numbers: conversions fail on trailing junk ('12x')
  //

  std::string int2str( int n );
  std::string int2str( long n );
  std::string dbl2str( double n );
  std::string dbl2str( double n , int dp );

  bool str2dbl( const std::string & , double * );
  bool str2int( const std::string & , int * );

  //
  // files
  //

  bool fileExists( const std::string & );

  // ~ as the first character is the home folder
  std::string expand( const std::string & f );

  // case-insensitive match on '.ext' at the end of the name
  bool file_extension( const std::string & f , const std::string & ext );

  // name without folders, .gz or the last extension
  std::string file_root( const std::string & f );

  //
  // time-strings:  seconds <--> hh:mm:ss(.sss)
  //

  std::string timestring( double sec , char delim = ':' , bool fractional = false );

  bool timestring( const std::string & , double * sec );

  //
  // errors in the command line or options: exits, unless a bail
  // function is registered or bail_on_fail is off
  //

  void halt( const std::string & msg );

}

#endif
