// ----------------------------------------------------------------------
// File: ResponseStream.hh
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

/**
 * @file   ResponseStream.hh
 *
 * @brief  Readable body source handed from a backend to an HTTP response.
 *         The response owns the stream; destroying a stream closes it.
 */

#ifndef __XMDCOMMON_RESPONSE_STREAM__HH__
#define __XMDCOMMON_RESPONSE_STREAM__HH__

#include "common/Namespace.hh"
#include <sys/types.h>
#include <algorithm>
#include <cstring>
#include <string>

XMDCOMMONNAMESPACE_BEGIN

class ResponseStream
{
public:
  virtual ~ResponseStream() {};

  /**
   * Read the next piece of the body
   *
   * @param buf  destination buffer
   * @param max  capacity of the destination buffer
   *
   * @return number of bytes read, 0 at end of stream, -1 on error
   */
  virtual ssize_t Read(char* buf, size_t max) = 0;

  /**
   * Release the resources behind the stream. Further reads return 0.
   * Calling it more than once is allowed.
   */
  virtual void Close() = 0;
};

//------------------------------------------------------------------------------
//! Stream serving an in-memory body
//------------------------------------------------------------------------------
class StringResponseStream : public ResponseStream
{
public:
  explicit StringResponseStream(const std::string& body) :
    mBody(body), mOffset(0), mClosed(false) {}

  virtual ~StringResponseStream()
  {
    Close();
  }

  ssize_t Read(char* buf, size_t max) override
  {
    if (mClosed || (mOffset >= mBody.length())) {
      return 0;
    }

    size_t len = std::min(max, mBody.length() - mOffset);
    memcpy(buf, mBody.data() + mOffset, len);
    mOffset += len;
    return len;
  }

  void Close() override
  {
    mClosed = true;
  }

  size_t Size() const
  {
    return mBody.length();
  }

private:
  std::string mBody;
  size_t mOffset;
  bool mClosed;
};

XMDCOMMONNAMESPACE_END

#endif /* __XMDCOMMON_RESPONSE_STREAM__HH__ */
