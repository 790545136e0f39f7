
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

#include "artifacts/artifacts.h"
#include "timeline/timeline.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

extern logger_t logger;

spanset_t nan_spans( const Eigen::MatrixXd & data )
{

  const int64_t n = data.cols();

  // invalid[i] : any channel NaN at column i
  Eigen::Array<bool,1,Eigen::Dynamic> invalid( n );
  if ( data.rows() == 0 )
    invalid.setConstant( false );
  else
    invalid = data.array().isNaN().colwise().any();

  std::vector<span_t> runs;

  int64_t i = 0;
  while ( i < n )
    {
      if ( ! invalid[i] ) { ++i; continue; }

      int64_t j = i;
      while ( j + 1 < n && invalid[j+1] ) ++j;

      // to 1-based closed
      runs.push_back( span_t( i + 1 , j + 1 ) );

      i = j + 1;
    }

  // runs are maximal, so nothing merges (a gap > 1 would, but the
  // default only merges touching runs, which cannot happen here)
  return spanset_t::normalize( runs );
}


spanset_t nan_spans( const timeline_t & timeline )
{
  const int64_t n = timeline.samples();

  spanset_t spans = nan_spans( timeline.data );

  std::vector<span_t>::const_iterator pp = timeline.pending.begin();
  while ( pp != timeline.pending.end() )
    {
      if ( pp->stop > n )
	throw invalid_span_error( "pending span " + pp->as_string()
				  + " lies beyond the last sample ("
				  + Helper::int2str( (long)n ) + ")" );
      spans.insert( *pp );
      ++pp;
    }

  spans.basis = timeline.revision;
  spans.category = "NaN";

  return spans;
}


void log_spans( const spanset_t & spans , double sr , const std::string & what )
{

  if ( spans.empty() )
    {
      logger << "  no " << what << " segments found\n";
      return;
    }

  std::vector<span_t>::const_iterator ss = spans.begin();
  while ( ss != spans.end() )
    {
      logger << "  " << what << " segment: samples " << ss->start << " to " << ss->stop
	     << " (" << ss->length() << " samples, "
	     << Helper::dbl2str( ss->duration_sec( sr ) , 2 ) << " s)\n";
      ++ss;
    }

  logger << "  " << spans.size() << " " << what << " segments, "
	 << spans.total() << " samples, "
	 << Helper::dbl2str( spans.total() / sr , 2 ) << " s in total\n";
}
