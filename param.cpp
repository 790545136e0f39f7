
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

#include "param.h"
#include "helper/helper.h"
#include "helper/zfile.h"
#include "defs/defs.h"

//
// param_t
//

void param_t::add( const std::string & option , const std::string & value )
{

  if ( option == "" ) return;

  // key+=value appends to any existing comma-delimited list

  const bool append_mode = option[ option.size() - 1 ] == '+';

  if ( append_mode )
    {
      const std::string option1 = option.substr( 0 , option.size() - 1 );
      if ( option1 == "" ) return;
      if ( opt.find( option1 ) == opt.end() )
	opt[ option1 ] = value;
      else
	opt[ option1 ] = opt[ option1 ] + "," + value;
      return;
    }

  if ( opt.find( option ) != opt.end() )
    Helper::halt( option + " parameter specified twice, only one value would be retained" );

  opt[ option ] = value;

}


int param_t::size() const
{
  return opt.size();
}


void param_t::parse( const std::string & s )
{
  std::vector<std::string> tok = Helper::quoted_parse( s , "=" );
  if ( tok.size() == 2 )     add( tok[0] , tok[1] );
  else if ( tok.size() == 1 ) add( tok[0] , "__null__" );
  else // key=value=2 sets "value=2" to 'key'
    {
      std::string v = tok[1];
      for (int i=2;i<tok.size();i++) v += "=" + tok[i];
      add( tok[0] , v );
    }
}


void param_t::read( const std::string & filename )
{
  zfile_t f;
  if ( ! f.open_read( filename ) )
    Helper::halt( "could not open parameter file " + filename );

  std::string line;
  while ( f.getline( &line ) )
    {
      line = Helper::lrtrim( line );
      if ( line == "" || line[0] == '%' ) continue;
      std::vector<std::string> tok = Helper::quoted_parse( line , "\t " );
      for (int i=0;i<tok.size();i++)
	parse( tok[i] );
    }
}


void param_t::clear()
{
  opt.clear();
}

bool param_t::has( const std::string & s ) const
{
  return opt.find(s) != opt.end();
}

bool param_t::empty( const std::string & s ) const
{
  if ( ! has( s ) ) return true; // no key
  return opt.find( s )->second == "__null__";
}

bool param_t::yesno( const std::string & s , const bool default1 , const bool default2 ) const
{
  if ( ! has( s ) ) return default1;
  if ( empty( s ) ) return default2;
  return Helper::yesno( opt.find( s )->second ) ;
}

std::string param_t::value( const std::string & s , const bool uppercase ) const
{
  if ( ! has( s ) ) return "";
  const std::string & v = opt.find( s )->second;
  if ( v == "__null__" ) return "";
  return uppercase ?
    Helper::strip_quotes( Helper::toupper( v ) )
    : Helper::strip_quotes( v );
}

std::string param_t::requires( const std::string & s , const bool uppercase ) const
{
  if ( ! has(s) || empty(s) ) Helper::halt( "requires parameter " + s );
  return value(s, uppercase );
}

int param_t::requires_int( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "requires parameter " + s );
  int r = 0;
  if ( ! Helper::str2int( value(s) , &r ) )
    Helper::halt( "requires parameter " + s + " to have an integer value" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "requires parameter " + s );
  double r = 0;
  if ( ! Helper::str2dbl( value(s) , &r ) )
    Helper::halt( "requires parameter " + s + " to have a numeric value" );
  return r;
}

void param_t::check( const std::set<std::string> & allowed ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      if ( allowed.find( ii->first ) == allowed.end() )
	Helper::halt( "unrecognized option: " + ii->first );
      ++ii;
    }
}

std::string param_t::dump( const std::string & indent , const std::string & delim ) const
{
  std::vector<std::string> items;
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      items.push_back( indent + ii->first
		       + ( ii->second == "__null__" ? "" : "=" + ii->second ) );
      ++ii;
    }
  return Helper::stringize( items , delim );
}


// list-valued options: 'k=a,b,"c,d"'
std::vector<std::string> param_t::strvector( const std::string & k , const std::string delim , const bool uppercase ) const
{
  std::vector<std::string> r;
  if ( ! has( k ) ) return r;
  std::vector<std::string> tok = Helper::quoted_parse( opt.find( k )->second , delim );
  std::vector<std::string>::const_iterator tt = tok.begin();
  while ( tt != tok.end() )
    {
      const std::string v = Helper::lrtrim( Helper::unquote( *tt ) );
      if ( v != "" && v != "__null__" )
	r.push_back( uppercase ? Helper::toupper( v ) : v );
      ++tt;
    }
  return r;
}


std::set<std::string> param_t::strset( const std::string & k , const std::string delim , const bool uppercase ) const
{
  std::vector<std::string> v = strvector( k , delim , uppercase );
  return std::set<std::string>( v.begin() , v.end() );
}


std::vector<int> param_t::intvector( const std::string & k , const std::string delim ) const
{
  std::vector<std::string> v = strvector( k , delim );
  std::vector<int> r( v.size() );
  for (int i=0; i<v.size(); i++)
    if ( ! Helper::str2int( v[i] , &r[i] ) )
      Helper::halt( "option " + k + " requires integer value(s), found '" + v[i] + "'" );
  return r;
}


std::set<std::string> param_t::keys() const
{
  std::set<std::string> s;
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      s.insert( ii->first );
      ++ii;
    }
  return s;
}
