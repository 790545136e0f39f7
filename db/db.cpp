
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

#include "db/db.h"
#include "db/report.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

extern logger_t logger;

void prune_db_t::attach( const std::string & n )
{

  sql.open( n );

  sql.synchronous( false );

  //
  // Tables
  //

  // Reconciliation report rows

  sql.query(" CREATE TABLE IF NOT EXISTS report("
	    "   recording     VARCHAR(20) NOT NULL , "
	    "   event_id      INTEGER NOT NULL , "
	    "   event_type    VARCHAR(20) NOT NULL , "
	    "   proto_type    INTEGER , "
	    "   original_sec  REAL , "
	    "   new_sec       REAL , "
	    "   actual_time   VARCHAR(20) , "
	    "   shift_sec     REAL , "
	    "   moved         INTEGER , "
	    "   sleep_stage   INTEGER , "
	    "   relocated     INTEGER , "
	    "   provenance    VARCHAR(10) ); " );

  // Spans removed (or filled)

  sql.query(" CREATE TABLE IF NOT EXISTS spans("
	    "   recording     VARCHAR(20) NOT NULL , "
	    "   pass          VARCHAR(10) NOT NULL , "
	    "   action        VARCHAR(10) NOT NULL , "
	    "   start         INTEGER NOT NULL , "
	    "   stop          INTEGER NOT NULL , "
	    "   orig_start    INTEGER , "
	    "   orig_stop     INTEGER , "
	    "   seconds       REAL ); " );

  // Per-recording summary variables

  sql.query(" CREATE TABLE IF NOT EXISTS summary("
	    "   recording     VARCHAR(20) NOT NULL , "
	    "   variable      VARCHAR(20) NOT NULL , "
	    "   value         NUMERIC ); " );

  // Recoverable anomalies and failures

  sql.query(" CREATE TABLE IF NOT EXISTS diagnostics("
	    "   recording     VARCHAR(20) NOT NULL , "
	    "   kind          VARCHAR(20) NOT NULL , "
	    "   step          VARCHAR(10) , "
	    "   event_id      INTEGER , "
	    "   message       TEXT ); " );

  logger << "  attached database " << n << "\n";
}


void prune_db_t::close()
{
  sql.close();
}


void prune_db_t::clear( const std::string & id )
{
  const char * tables[] = { "report" , "spans" , "summary" , "diagnostics" };
  for (int t=0; t<4; t++)
    {
      sqlite3_stmt * s = sql.prepare( std::string( "DELETE FROM " ) + tables[t] + " WHERE recording == :id ;" );
      sql.bind_text( s , ":id" , id );
      sql.step( s );
      sql.finalise( s );
    }
}


void prune_db_t::write( const std::string & id ,
			const report_t & report ,
			const std::vector<span_record_t> & spans ,
			const std::map<std::string,double> & summary ,
			const diagnostics_t & diags )
{

  sql.begin();

  try
    {

      clear( id );

      //
      // report
      //

      sqlite3_stmt * s = sql.prepare( " INSERT INTO report ( recording, event_id, event_type, proto_type, "
				      " original_sec, new_sec, actual_time, shift_sec, moved, sleep_stage, "
				      " relocated, provenance ) "
				      " VALUES ( :id, :event, :type, :proto, :orig, :new, :time, :shift, "
				      " :moved, :stage, :reloc, :prov ) ; " );

      for (int i=0; i<report.rows.size(); i++)
	{
	  const report_row_t & r = report.rows[i];

	  sql.bind_text( s , ":id" , id );
	  sql.bind_int( s , ":event" , r.event );
	  sql.bind_text( s , ":type" , r.type );

	  int p = 0;
	  if ( Helper::str2int( r.proto , &p ) ) sql.bind_int( s , ":proto" , p );
	  else sql.bind_null( s , ":proto" );

	  sql.bind_double( s , ":orig" , r.original_sec );
	  sql.bind_double( s , ":new" , r.new_sec );
	  sql.bind_text( s , ":time" , r.actual_time() );
	  sql.bind_double( s , ":shift" , r.shift_sec );
	  sql.bind_int( s , ":moved" , r.moved );

	  int stg = 0;
	  if ( Helper::str2int( r.stage , &stg ) ) sql.bind_int( s , ":stage" , stg );
	  else sql.bind_null( s , ":stage" );

	  sql.bind_int( s , ":reloc" , r.relocated );
	  sql.bind_text( s , ":prov" , r.fallback ? "fallback" : "original" );

	  sql.step( s );
	  sql.reset( s );
	}

      sql.finalise( s );

      //
      // spans
      //

      s = sql.prepare( " INSERT INTO spans ( recording, pass, action, start, stop, orig_start, orig_stop, seconds ) "
		       " VALUES ( :id, :pass, :action, :start, :stop, :ostart, :ostop, :sec ) ; " );

      for (int i=0; i<spans.size(); i++)
	{
	  sql.bind_text( s , ":id" , id );
	  sql.bind_text( s , ":pass" , spans[i].pass );
	  sql.bind_text( s , ":action" , spans[i].action );
	  sql.bind_int( s , ":start" , spans[i].span.start );
	  sql.bind_int( s , ":stop" , spans[i].span.stop );
	  sql.bind_int( s , ":ostart" , spans[i].orig_start );
	  sql.bind_int( s , ":ostop" , spans[i].orig_stop );
	  sql.bind_double( s , ":sec" , spans[i].seconds );
	  sql.step( s );
	  sql.reset( s );
	}

      sql.finalise( s );

      //
      // summary
      //

      s = sql.prepare( " INSERT INTO summary ( recording, variable, value ) VALUES ( :id, :var, :value ) ; " );

      std::map<std::string,double>::const_iterator vv = summary.begin();
      while ( vv != summary.end() )
	{
	  sql.bind_text( s , ":id" , id );
	  sql.bind_text( s , ":var" , vv->first );
	  sql.bind_double( s , ":value" , vv->second );
	  sql.step( s );
	  sql.reset( s );
	  ++vv;
	}

      sql.finalise( s );

      //
      // diagnostics
      //

      s = sql.prepare( " INSERT INTO diagnostics ( recording, kind, step, event_id, message ) "
		       " VALUES ( :id, :kind, :step, :event, :msg ) ; " );

      diagnostics_t::const_iterator dd = diags.begin();
      while ( dd != diags.end() )
	{
	  sql.bind_text( s , ":id" , id );
	  sql.bind_text( s , ":kind" , globals::diag( dd->kind ) );
	  sql.bind_text( s , ":step" , dd->step );
	  if ( dd->event == -1 ) sql.bind_null( s , ":event" );
	  else sql.bind_int( s , ":event" , dd->event );
	  sql.bind_text( s , ":msg" , dd->msg );
	  sql.step( s );
	  sql.reset( s );
	  ++dd;
	}

      sql.finalise( s );

    }
  catch ( const eprune_error & )
    {
      sql.rollback();
      throw;
    }

  sql.commit();

}


void prune_db_t::failed( const std::string & id , const std::string & step , const std::string & msg )
{
  sql.begin();

  try
    {
      clear( id );

      sqlite3_stmt * s = sql.prepare( " INSERT INTO diagnostics ( recording, kind, step, event_id, message ) "
				      " VALUES ( :id, 'Failed', :step, NULL, :msg ) ; " );
      sql.bind_text( s , ":id" , id );
      sql.bind_text( s , ":step" , step );
      sql.bind_text( s , ":msg" , msg );
      sql.step( s );
      sql.finalise( s );
    }
  catch ( const eprune_error & )
    {
      sql.rollback();
      throw;
    }

  sql.commit();
}


int prune_db_t::count( const std::string & table , const std::string & id )
{
  sqlite3_stmt * s = sql.prepare( "SELECT count(1) FROM " + table + " WHERE recording == :id ;" );
  sql.bind_text( s , ":id" , id );
  int n = 0;
  if ( sql.step( s ) ) n = sql.get_int( s , 0 );
  sql.finalise( s );
  return n;
}
