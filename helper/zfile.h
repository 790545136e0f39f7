
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

#ifndef __EPRUNE_ZFILE_H__
#define __EPRUNE_ZFILE_H__

#include <zlib.h>

#include <fstream>
#include <sstream>
#include <string>

//
// Line-oriented text file that may or may not be gzip-compressed.
// Reading goes through zlib, which passes plain files straight through;
// writing compresses only if asked to (or the name ends in .gz)
//

struct zfile_t {

 public:

  zfile_t() : gz(NULL) , writing(false) , compressed(false) , nlines(0) { }

  ~zfile_t() { close(); }

  bool open_read( const std::string & filename );

  bool open_write( const std::string & filename , bool compress = false );

  // false once the file is exhausted; line endings (LF, CRLF) are stripped
  bool getline( std::string * line );

  void print( const std::string & s );

  template <class T>
  zfile_t & operator<< ( const T & rhs )
  {
    std::stringstream ss;
    ss << rhs;
    print( ss.str() );
    return *this;
  }

  void close();

  bool is_open() const { return gz != NULL || out.is_open(); }

  bool is_compressed() const { return compressed; }

  // lines read so far (for error messages)
  int line_number() const { return nlines; }

  const std::string & name() const { return filename; }

 private:

  zfile_t( const zfile_t & );
  zfile_t & operator=( const zfile_t & );

  gzFile gz;

  std::ofstream out;

  bool writing;

  bool compressed;

  int nlines;

  std::string filename;

};

#endif
