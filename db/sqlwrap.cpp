
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

#include "db/sqlwrap.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "defs/defs.h"

bool SQL::open( const std::string & n )
{
  close();

  // expand ~ to home folder...
  name = Helper::expand( n ) ;

  rc = sqlite3_open( name.c_str() , &db );

  if ( rc )
    {
      std::string msg = db ? sqlite3_errmsg( db ) : "out of memory";
      close();
      throw eprune_error( "write" , "problem opening database " + name + ": " + msg );
    }

  return true;
}

void SQL::synchronous( bool b )
{
  if ( !b )
    query( "PRAGMA synchronous=0;" ); // OFF
  else
    query( "PRAGMA synchronous=2;" ); // FULL
}

bool SQL::table_exists( const std::string & table_name )
{
  sqlite3_stmt * s = prepare( "SELECT name FROM sqlite_master WHERE type='table' AND name= :table_name ; " );
  bind_text( s , ":table_name" , table_name );
  const bool found = step( s );
  finalise( s );
  return found;
}

void SQL::close()
{
  if ( db )
    {
      std::set<sqlite3_stmt*>::iterator ii = qset.begin();
      while ( ii != qset.end() )
	{
	  sqlite3_finalize( *ii );
	  ++ii;
	}
      qset.clear();

      sqlite3_close( db );
      db = NULL;
    }
}

bool SQL::query( const std::string & q )
{
  char * db_err = NULL;
  rc = sqlite3_exec( db , q.c_str() , 0 , 0 , &db_err );
  if ( rc )
    {
      std::string msg = db_err ? db_err : "unknown error";
      sqlite3_free( db_err );
      throw eprune_error( "write" , "database (" + name + ") query failed: " + msg );
    }
  return true;
}

sqlite3_stmt * SQL::prepare( const std::string & q )
{
  sqlite3_stmt * p = NULL;
  rc = sqlite3_prepare_v2( db , q.c_str() , q.size() , &p , NULL );
  if ( rc )
    throw eprune_error( "write" , "database (" + name + ") preparing query: " + std::string( sqlite3_errmsg(db) ) );
  qset.insert( p );
  return p;
}

void SQL::begin()
{
  query( "BEGIN;" );
}

void SQL::commit()
{
  query( "COMMIT;" );
}

void SQL::rollback()
{
  // best effort: used while unwinding from a failed write
  sqlite3_exec( db , "ROLLBACK;" , 0 , 0 , NULL );
}

void SQL::finalise( sqlite3_stmt * stmt )
{
  std::set<sqlite3_stmt*>::iterator i = qset.find( stmt );
  if ( stmt && i != qset.end() )
    {
      qset.erase( i );
      sqlite3_finalize( stmt );
    }
}

bool SQL::step( sqlite3_stmt * stmt )
{

  rc = sqlite3_step( stmt );

  if ( rc != SQLITE_ROW && rc != SQLITE_DONE )
    {
      reset( stmt );
      throw eprune_error( "write" , "database (" + name + ") error (" + Helper::int2str( sqlite3_errcode(db) ) + ") " + sqlite3_errmsg(db) );
    }

  return rc == SQLITE_ROW;
}

void SQL::reset( sqlite3_stmt * stmt )
{
  sqlite3_reset( stmt );
  sqlite3_clear_bindings( stmt );
}

void SQL::bind_int( sqlite3_stmt * stmt , const std::string & index , int value )
{
  sqlite3_bind_int( stmt ,
		    sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		    value );
}

void SQL::bind_null( sqlite3_stmt * stmt , const std::string & index )
{
  sqlite3_bind_null( stmt ,
		     sqlite3_bind_parameter_index( stmt , index.c_str() ) );
}

void SQL::bind_double( sqlite3_stmt * stmt , const std::string & index , double value )
{
  sqlite3_bind_double( stmt ,
		       sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		       value );
}

void SQL::bind_text( sqlite3_stmt * stmt , const std::string & index , const std::string & value )
{
  sqlite3_bind_text( stmt ,
		     sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		     value.c_str() ,
		     value.size() ,
		     SQLITE_TRANSIENT );
}

int SQL::get_int( sqlite3_stmt * stmt , int idx )
{
  return sqlite3_column_int( stmt , idx );
}

double SQL::get_double( sqlite3_stmt * stmt , int idx )
{
  return sqlite3_column_double( stmt , idx );
}

bool SQL::is_null( sqlite3_stmt * stmt , int idx )
{
  return sqlite3_column_type( stmt , idx ) == SQLITE_NULL;
}

std::string SQL::get_text( sqlite3_stmt * stmt , int idx )
{
  const unsigned char * s = sqlite3_column_text( stmt , idx );
  if ( s == NULL )
    return "";
  else
    return (const char*)s;
}

int SQL::lookup_int( const std::string & q )
{
  sqlite3_stmt * s = prepare( q );
  int r = -1;
  if ( step( s ) )
    r = sqlite3_column_int( s , 0 );
  finalise( s );
  return r;
}
