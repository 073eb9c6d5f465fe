// ----------------------------------------------------------------------
// File: Timing.hh
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

#ifndef __XMDCOMMON_TIMING__HH__
#define __XMDCOMMON_TIMING__HH__

#include "common/Namespace.hh"
#include <sys/time.h>
#include <time.h>
#include <cstdio>
#include <string>

XMDCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Static time helpers
//------------------------------------------------------------------------------
class Timing
{
public:
  //----------------------------------------------------------------------------
  //! Wrapper Function to hide difference between Apple and Linux
  //----------------------------------------------------------------------------
  static void
  GetTimeSpec(struct timespec& ts)
  {
#ifdef __APPLE__
    struct timeval tv;
    gettimeofday(&tv, 0);
    ts.tv_sec = tv.tv_sec;
    ts.tv_nsec = tv.tv_usec * 1000;
#else
    clock_gettime(CLOCK_REALTIME, &ts);
#endif
  }

  //----------------------------------------------------------------------------
  //! Convert a timespec to the fixed width request timestamp representation
  //! "<seconds>.<5 digit fraction>" zero padded to 16 characters, which keeps
  //! lexical and numeric ordering identical
  //----------------------------------------------------------------------------
  static std::string
  TimespecToTimestamp(const struct timespec& ts)
  {
    char stamp[64];
    double now = (double) ts.tv_sec + ((double) ts.tv_nsec / 1000000000.0);
    snprintf(stamp, sizeof(stamp), "%016.05f", now);
    return stamp;
  }

  //----------------------------------------------------------------------------
  //! Request timestamp for the current time
  //----------------------------------------------------------------------------
  static std::string
  GetTimestamp()
  {
    struct timespec ts;
    GetTimeSpec(ts);
    return TimespecToTimestamp(ts);
  }
};

XMDCOMMONNAMESPACE_END

#endif
