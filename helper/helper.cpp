
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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

extern logger_t logger;


std::string Helper::toupper( const std::string & s )
{
  std::string u = s;
  std::string::iterator ii = u.begin();
  while ( ii != u.end() )
    {
      *ii = std::toupper( (unsigned char)*ii );
      ++ii;
    }
  return u;
}


std::string Helper::lrtrim( const std::string & s )
{
  size_t a = 0 , b = s.size();
  while ( a < b && std::isspace( (unsigned char)s[a] ) ) ++a;
  while ( b > a && std::isspace( (unsigned char)s[b-1] ) ) --b;
  return s.substr( a , b - a );
}


static bool is_quote( char c , char q2 )
{
  return c == '"' || c == q2;
}


std::string Helper::unquote( const std::string & s , const char q2 )
{
  if ( s.size() == 0 ) return s;
  const int a = is_quote( s[0] , q2 ) ? 1 : 0;
  const int b = s.size() > 1 && is_quote( s[ s.size() - 1 ] , q2 ) ? 1 : 0;
  return s.substr( a , s.size() - a - b );
}


std::string Helper::strip_quotes( const std::string & s , const char q2 )
{
  std::string r;
  r.reserve( s.size() );
  for (int i=0; i<s.size(); i++)
    if ( ! is_quote( s[i] , q2 ) ) r += s[i];
  return r;
}


bool Helper::iequals( const std::string & a , const std::string & b )
{
  if ( a.size() != b.size() ) return false;
  for (int i=0; i<a.size(); i++)
    if ( std::tolower( (unsigned char)a[i] ) != std::tolower( (unsigned char)b[i] ) )
      return false;
  return true;
}


bool Helper::yesno( const std::string & s )
{
  // 'var' alone is handled by param_t (as var=T)
  if ( s.size() == 0 ) return false;
  const char c = s[0];
  return ! ( c == '0' || c == 'n' || c == 'N' || c == 'f' || c == 'F' );
}


//
// one splitter behind parse() and quoted_parse()
//

static std::vector<std::string> tokenize( const std::string & s ,
					  const std::string & delim ,
					  bool empty ,
					  const std::string & quotes )
{
  std::vector<std::string> tok;

  if ( s.size() == 0 ) return tok;

  std::string cur;
  bool in_quote = false;

  for (int j=0; j<s.size(); j++)
    {
      const char c = s[j];

      if ( quotes.find( c ) != std::string::npos )
	in_quote = ! in_quote;

      if ( ! in_quote && delim.find( c ) != std::string::npos )
	{
	  if ( cur.size() != 0 ) tok.push_back( cur );
	  else if ( empty ) tok.push_back( "." );
	  cur.clear();
	}
      else
	cur += c;
    }

  if ( cur.size() != 0 ) tok.push_back( cur );
  else if ( empty ) tok.push_back( "." );

  return tok;
}


std::vector<std::string> Helper::parse( const std::string & item , const std::string & delim , bool empty )
{
  return tokenize( item , delim , empty , "" );
}


std::vector<std::string> Helper::quoted_parse( const std::string & item , const std::string & delim ,
					       const char q , const char q2 , bool empty )
{
  std::string quotes = "\"";
  quotes += q;
  quotes += q2;
  return tokenize( item , delim , empty , quotes );
}


std::string Helper::int2str( int n )
{
  std::ostringstream ss;
  ss << n;
  return ss.str();
}


std::string Helper::int2str( long n )
{
  std::ostringstream ss;
  ss << n;
  return ss.str();
}


std::string Helper::dbl2str( double n )
{
  std::ostringstream ss;
  ss << n;
  return ss.str();
}


std::string Helper::dbl2str( double n , int dp )
{
  std::ostringstream ss;
  ss << std::fixed << std::setprecision( dp ) << n;
  return ss.str();
}


bool Helper::str2dbl( const std::string & s , double * d )
{
  if ( s.size() == 0 ) return false;
  const char * p = s.c_str();
  char * end = NULL;
  errno = 0;
  const double v = strtod( p , &end );
  if ( end == p || *end != '\0' || errno == ERANGE ) return false;
  *d = v;
  return true;
}


bool Helper::str2int( const std::string & s , int * i )
{
  if ( s.size() == 0 ) return false;
  const char * p = s.c_str();
  char * end = NULL;
  errno = 0;
  const long v = strtol( p , &end , 10 );
  if ( end == p || *end != '\0' || errno == ERANGE ) return false;
  if ( v < -2147483647L - 1 || v > 2147483647L ) return false;
  *i = (int)v;
  return true;
}


bool Helper::fileExists( const std::string & f )
{
  FILE * file = fopen( f.c_str() , "r" );
  if ( file == NULL ) return false;
  fclose( file );
  return true;
}


std::string Helper::expand( const std::string & f )
{
  if ( f.size() == 0 || f[0] != '~' ) return f;
  const char * home = getenv( "HOME" );
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr( 1 );
}


bool Helper::file_extension( const std::string & f , const std::string & ext )
{
  const std::string e = "." + ext;
  if ( f.size() < e.size() ) return false;
  return iequals( f.substr( f.size() - e.size() ) , e );
}


std::string Helper::file_root( const std::string & f )
{
  std::string s = f;
  size_t p = s.rfind( globals::folder_delimiter );
  if ( p != std::string::npos ) s = s.substr( p + 1 );
  if ( file_extension( s , "gz" ) ) s = s.substr( 0 , s.size() - 3 );
  p = s.rfind( '.' );
  if ( p != std::string::npos && p > 0 ) s = s.substr( 0 , p );
  return s;
}


std::string Helper::timestring( double sec , char delim , bool fractional )
{

  // wraps around the 24-hour clock
  if ( sec < 0 ) sec = 0;
  sec = fmod( sec , 86400.0 );

  const int h = (int)( sec / 3600 );
  const int m = (int)( ( sec - h * 3600 ) / 60 );
  const double s = sec - h * 3600 - m * 60;

  std::stringstream ss;
  ss << std::setfill( '0' ) << std::setw( 2 ) << h << delim
     << std::setw( 2 ) << m << delim;

  if ( fractional )
    ss << std::fixed << std::setprecision( globals::time_format_dp )
       << std::setw( 3 + globals::time_format_dp ) << s;
  else
    ss << std::setw( 2 ) << (int)floor( s );

  return ss.str();
}


bool Helper::timestring( const std::string & t , double * sec )
{

  // ss.sss, or hh:mm, hh:mm:ss, hh:mm:ss.sss

  *sec = 0;

  std::vector<std::string> tok = Helper::parse( t , ":" , true );

  if ( tok.size() == 1 )
    return Helper::str2dbl( tok[0] , sec );

  if ( tok.size() != 2 && tok.size() != 3 ) return false;

  int h = 0 , m = 0;
  double s = 0;
  if ( ! Helper::str2int( tok[0] , &h ) ) return false;
  if ( ! Helper::str2int( tok[1] , &m ) ) return false;
  if ( tok.size() == 3 && ! Helper::str2dbl( tok[2] , &s ) ) return false;

  if ( h < 0 || m < 0 || m > 59 || s < 0 || s >= 60 ) return false;

  *sec = h * 3600.0 + m * 60.0 + s;
  return true;
}


void Helper::halt( const std::string & msg )
{

  // embedding code may handle it
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  if ( ! globals::bail_on_fail ) return;

  // no close-out banner
  logger.off();

  std::cerr << "error : " << msg << "\n";

  std::exit( 1 );
}
