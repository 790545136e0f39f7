
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

#ifndef __EPRUNE_DB_H__
#define __EPRUNE_DB_H__

#include "db/sqlwrap.h"
#include "intervals/intervals.h"

#include <map>
#include <string>
#include <vector>

struct report_t;

//
// An excised or filled span, as it is persisted
//

struct span_record_t {

  span_record_t() : orig_start(0) , orig_stop(0) , seconds(0) { }

  // nan, stages
  std::string pass;

  // excise or fill
  std::string action;

  span_t span;

  // same span in original sample coordinates
  int64_t orig_start;
  int64_t orig_stop;

  double seconds;

};


//
// SQLite store for reports, spans, summaries and diagnostics; one file
// can collect any number of recordings
//

struct prune_db_t {

  prune_db_t() { }

  ~prune_db_t() { close(); }

  // create tables as needed
  void attach( const std::string & filename );

  void close();

  bool attached() const { return sql.is_open(); }

  // replace everything held for this recording, in one transaction
  void write( const std::string & id ,
	      const report_t & report ,
	      const std::vector<span_record_t> & spans ,
	      const std::map<std::string,double> & summary ,
	      const diagnostics_t & diags );

  // a failed recording: status only
  void failed( const std::string & id , const std::string & step , const std::string & msg );

  // rows held for a recording in one table (for checks)
  int count( const std::string & table , const std::string & id );

 private:

  void clear( const std::string & id );

  SQL sql;

};

#endif
