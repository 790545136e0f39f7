
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

// log utility initially based on: https://github.com/Manu343726/Cpp11CustomLogClass

#ifndef __LOGGER_H__
#define	__LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <iomanip>
#include <fstream>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  bool           save_log;

  std::ofstream  _log_file;

  bool           is_off;

  // warnings issued since the last reset (per recording)
  int            n_warnings;

  static std::string now()
  {
    time_t rawtime;
    time (&rawtime);
    struct tm * timeinfo = localtime (&rawtime);
    char BUFFER[50];
    strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo);
    return BUFFER;
  }

 public:

 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream )
  {
    is_off = false;
    save_log = false;
    n_warnings = 0;
  }

  // mirror everything to this file (e.g. one log per recording)
  bool write_log( const std::string & log_file )
  {
    if ( is_off ) return false;

    // close any existing stream?
    if ( save_log )
      stop_writing_log();

    _log_file.open( log_file.c_str() );
    save_log = _log_file.good();
    return save_log;
  }

  void stop_writing_log()
  {
    if ( save_log )
      {
	_log_file.close();
	save_log = false;
      }
  }

  void flush() { _out_stream.flush(); if ( save_log ) _log_file.flush(); }

  void off() { flush(); stop_writing_log(); is_off = true; }

  void on() { is_off = false; }

  int warnings() const { return n_warnings; }

  void reset_warnings() { n_warnings = 0; }

  void banner( const std::string & v , const std::string & bd )
  {

    if ( is_off || globals::silent ) return;

    _out_stream << "===================================================================" << "\n"
		<< _log_header
		<< " | " << v << ", " << bd << " | starting " << now()  << " +++\n"
		<< "===================================================================" << std::endl;

  }

  void section( const std::string & title )
  {
    *this << "___________________________________________________________________\n"
	  << "  " << title << "\n";
  }

  ~logger_t()
    {

      if ( is_off || globals::silent ) return;

      _out_stream << "-------------------------------------------------------------------"
		  << "\n"
		  << "+++ eprune | finishing "
		  << now()
		  << "                     +++\n"
		  << "==================================================================="
		  << std::endl;

      stop_writing_log();
    }


  void warning( const std::string & msg )
  {
    if ( is_off ) return ;

    ++n_warnings;

    if ( ! globals::silent )
      _out_stream << " ** warning: " << msg << " ** " << std::endl;

    if ( save_log )
      _log_file << " ** warning: " << msg << " ** " << std::endl;
  }


  template<typename T>
    logger_t& operator<< (const T& data)
    {
      if ( is_off ) return *this;

      if ( ! globals::silent )
	_out_stream << data;

      // the per-recording log is always written, even when silent
      if ( save_log )
	_log_file << data;

      return *this;
    }

};


#endif
