// ----------------------------------------------------------------------
// File: ErrnoToString.cc
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2026 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

#include "common/ErrnoToString.hh"
#include <string.h>
#include <sstream>

XMDCOMMONNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// XSI-compliant strerror_r returns an int and fills the buffer
//------------------------------------------------------------------------------
std::string
StrerrorResult(int rc, const char* buf, int errnum)
{
  if (rc == 0) {
    return std::string{buf};
  }

  std::ostringstream oss;
  oss << "Failed to convert errnum to string: errnum=" << errnum;
  return oss.str();
}

//------------------------------------------------------------------------------
// GNU strerror_r returns the message, which may not live in the buffer
//------------------------------------------------------------------------------
std::string
StrerrorResult(const char* msg, const char* /*buf*/, int errnum)
{
  if (msg) {
    return std::string{msg};
  }

  std::ostringstream oss;
  oss << "Failed to convert errnum to string: errnum=" << errnum;
  return oss.str();
}
}

//------------------------------------------------------------------------------
// Convert error number to string representation
//------------------------------------------------------------------------------
std::string ErrnoToString(int errnum)
{
  char buf[128];
  buf[0] = '\0';
  return StrerrorResult(::strerror_r(errnum, buf, sizeof(buf)), buf, errnum);
}

XMDCOMMONNAMESPACE_END
