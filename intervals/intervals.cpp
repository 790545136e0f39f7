
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

#include "intervals/intervals.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include <algorithm>

extern logger_t logger;

std::ostream & operator<<( std::ostream & out , const span_t & rhs )
{
  out << rhs.start << "-" << rhs.stop;
  return out;
}


spanset_t spanset_t::normalize( const std::vector<span_t> & raw , int gap ,
				diagnostics_t * diags )
{

  if ( gap < 0 )
    Helper::halt( "span merge gap cannot be negative" );

  spanset_t r( gap );

  if ( raw.size() == 0 ) return r;

  std::vector<span_t> sorted = raw;

  for (int i=0; i<sorted.size(); i++)
    {
      if ( sorted[i].start > sorted[i].stop )
	throw invalid_span_error( "span " + sorted[i].as_string() + " has start after stop" );
      if ( sorted[i].start < 1 )
	throw invalid_span_error( "span " + sorted[i].as_string() + " starts before sample 1" );
    }

  std::sort( sorted.begin() , sorted.end() );

  span_t current = sorted[0];

  for (int i=1; i<sorted.size(); i++)
    {
      if ( sorted[i].start <= current.stop + gap )
	{
	  if ( sorted[i].stop > current.stop )
	    current.stop = sorted[i].stop;
	}
      else
	{
	  r.s.push_back( current );
	  current = sorted[i];
	}
    }

  r.s.push_back( current );

  r.merged = sorted.size() - r.s.size();

  if ( r.merged > 0 )
    {
      const std::string msg = "merged " + Helper::int2str( (int)sorted.size() )
	+ " spans into " + Helper::int2str( (int)r.s.size() );

      logger << "  " << msg << "\n";

      if ( diags != NULL )
	diags->push_back( diagnostic_t( DIAG_SPANS_MERGED , "normalize" , msg ) );
    }

  return r;
}


void spanset_t::insert( const span_t & x , diagnostics_t * diags )
{
  std::vector<span_t> u = s;
  u.push_back( x );
  spanset_t n = normalize( u , gap , diags );
  s = n.s;
  merged = n.merged;
}


int64_t spanset_t::total() const
{
  int64_t t = 0;
  std::vector<span_t>::const_iterator ii = s.begin();
  while ( ii != s.end() )
    {
      t += ii->length();
      ++ii;
    }
  return t;
}


int spanset_t::find( int64_t p ) const
{
  // first span whose stop is >= p
  int lo = 0 , hi = s.size();
  while ( lo < hi )
    {
      int mid = ( lo + hi ) / 2;
      if ( s[mid].stop < p ) lo = mid + 1;
      else hi = mid;
    }
  if ( lo < s.size() && s[lo].start <= p ) return lo;
  return -1;
}


int64_t spanset_t::removed_before( int64_t p ) const
{
  int64_t t = 0;
  std::vector<span_t>::const_iterator ii = s.begin();
  while ( ii != s.end() )
    {
      if ( ii->start >= p ) break;
      // partial when p falls inside this span
      t += ii->stop < p ? ii->length() : p - ii->start ;
      ++ii;
    }
  return t;
}


std::string spanset_t::as_string( const std::string & delim ) const
{
  std::stringstream ss;
  for (int i=0; i<s.size(); i++)
    {
      if ( i ) ss << delim;
      ss << s[i].as_string();
    }
  return ss.str();
}
