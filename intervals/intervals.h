
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

#ifndef __INTERVALS_H__
#define __INTERVALS_H__

#include "defs/defs.h"

#include <stdint.h>

#include <ostream>
#include <sstream>
#include <vector>


//
// spans are closed intervals of 1-based sample indices: both start and
// stop are removed; a single-sample span has start == stop
//

struct span_t
{

  friend std::ostream & operator<<( std::ostream & out , const span_t & rhs );

  span_t() { start = 0 ; stop = 0; }

  span_t( int64_t start , int64_t stop ) : start(start) , stop(stop) { }

  int64_t length() const { return stop - start + 1; }

  double duration_sec( double sr ) const { return length() / sr; }

  bool contains( int64_t s ) const { return s >= start && s <= stop; }

  bool overlaps( const span_t & b ) const
  {
    return start <= b.stop && b.start <= stop;
  }

  bool operator<( const span_t & rhs ) const
  {
    if ( start == rhs.start ) return stop < rhs.stop;
    return start < rhs.start;
  }

  bool operator==( const span_t & rhs ) const
  {
    return start == rhs.start && stop == rhs.stop;
  }

  std::string as_string() const
  {
    std::stringstream ss;
    ss << "[" << start << "," << stop << "]";
    return ss.str();
  }

  int64_t start;

  int64_t stop;

};


//
// A normalized set of spans: sorted by start, pairwise disjoint, and no
// two spans closer than 'gap' (the default gap of 1 merges touching
// spans, e.g. [10,20] + [21,30] -> [10,30])
//

struct spanset_t
{

  spanset_t() : gap(1) , basis(-1) , merged(0) { }

  explicit spanset_t( int gap ) : gap(gap) , basis(-1) , merged(0) { }

  // sort and merge; throws invalid_span_error on start > stop or start < 1
  static spanset_t normalize( const std::vector<span_t> & raw , int gap = 1 ,
			      diagnostics_t * diags = NULL );

  // add a span and re-normalize over the union
  void insert( const span_t & s , diagnostics_t * diags = NULL );

  void clear() { s.clear(); merged = 0; }

  bool empty() const { return s.empty(); }

  int size() const { return s.size(); }

  // total number of samples covered
  int64_t total() const;

  const std::vector<span_t> & spans() const { return s; }

  std::vector<span_t>::const_iterator begin() const { return s.begin(); }

  std::vector<span_t>::const_iterator end() const { return s.end(); }

  const span_t & operator[]( int i ) const { return s[i]; }

  // index of the span containing sample 'p', or -1
  int find( int64_t p ) const;

  // samples removed strictly before sample 'p' if the whole set were excised
  int64_t removed_before( int64_t p ) const;

  // true if these spans cannot index into the given timeline revision:
  // stamped for another revision, or unstamped once anything was excised
  bool stale( int revision ) const
  { return basis == -1 ? revision > 0 : basis != revision; }

  // spans equal (ignores basis, label)
  bool operator==( const spanset_t & rhs ) const { return s == rhs.s; }

  std::string as_string( const std::string & delim = "," ) const;

  // merge distance (next.start <= prior.stop + gap merges)
  int gap;

  // timeline revision these spans index into (-1 if not stamped)
  int basis;

  // what these spans are, for logging (e.g. "NaN", "stage 0")
  std::string category;

  // spans absorbed by the most recent normalization
  int merged;

 private:

  std::vector<span_t> s;

};


#endif
