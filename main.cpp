
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

#include "eprune.h"
#include "main.h"

#include <cstdlib>
#include <cstring>
#include <new>

#include <zlib.h>

extern globals global;

extern logger_t logger;


int main( int argc , char ** argv )
{

  //
  // initiate global definitions
  //

  std::set_new_handler( NoMem );

  global.init_defs();


  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );

  if ( show_version )
    {
      global.api();
      std::cerr << eprune_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "sqlite v"
		<< SQL::library_version() << "\n";
      std::cerr << "zlib v"
		<< zlibVersion() << "\n";
      std::cerr << "nlohmann/json v"
		<< NLOHMANN_JSON_VERSION_MAJOR << "."
		<< NLOHMANN_JSON_VERSION_MINOR << "."
		<< NLOHMANN_JSON_VERSION_PATCH << "\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = eprune_version() +
    "primary usage: eprune [sample-list|data-file] sr=Hz [out=folder] [@param-file]\n"
    "                      [proto=p1,p2] [buffer=2] [unwanted=0,5] [prune-protocols]\n"
    "                      [stage-mode=excise|fill] [keep=t1,t2] [report=csv,json]\n"
    "                      [db=file.db] [compress] [start=hh:mm:ss] [silent] [verbose]\n";

  if ( argc < 2 || strcmp( argv[1] , "-h" ) == 0 )
    {
      std::cerr << usage_msg << "\n";
      logger.off();
      std::exit( argc < 2 ? 1 : 0 );
    }


  //
  // options: key=value, or @file of key=value lines
  //

  const std::string input = argv[1];

  for (int i=2; i<argc; i++)
    {
      const std::string a = argv[i];
      if ( a.size() > 1 && a[0] == '@' )
	globals::param.read( a.substr( 1 ) );
      else
	globals::param.parse( a );
    }

  globals::silent = globals::param.yesno( "silent" );
  globals::verbose = globals::param.yesno( "verbose" );

  prune_options_t opt;
  opt.set( globals::param );

  logger.banner( globals::version , globals::date );

  logger << "input   : " << input << "\n"
	 << "options : " << globals::param.dump( "" , " " ) << "\n";


  //
  // output folder
  //

  if ( opt.out != "." )
    {
      const std::string syscmd = globals::mkdir_command + " " + opt.out;
      if ( system( syscmd.c_str() ) != 0 )
	Helper::halt( "could not create output folder " + opt.out );
    }


  //
  // recordings
  //

  std::vector<sample_list_t> recs;

  try
    {
      recs = read_sample_list( input );
    }
  catch ( const eprune_error & e )
    {
      Helper::halt( e.what() );
    }

  logger << "recordings: " << recs.size() << "\n";


  //
  // optional database
  //

  prune_db_t db;

  if ( opt.db != "" )
    {
      try
	{
	  db.attach( opt.db );
	}
      catch ( const eprune_error & e )
	{
	  Helper::halt( e.what() );
	}
    }


  //
  // process each in turn
  //

  pipeline_t pipeline( opt );

  if ( db.attached() ) pipeline.db = &db;

  pipeline.batch( recs );

  db.close();

  return globals::retcode;

}


//
// report version
//

std::string eprune_version()
{
  std::stringstream ss;
  ss << "eprune version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "eprune build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
