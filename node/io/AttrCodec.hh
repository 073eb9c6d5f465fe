// ----------------------------------------------------------------------
// File: AttrCodec.hh
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

#pragma once
#include "node/Namespace.hh"
#include "common/Status.hh"
#include <cstddef>
#include <string>
#include <vector>

XMDNODENAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Caller owned, bounds-known byte region. Never owned or resized by the
//! codec; a zero size turns a read into a size probe.
//------------------------------------------------------------------------------
struct AttrBuffer {
  char* data;
  size_t size;

  AttrBuffer() : data(nullptr), size(0) {}
  AttrBuffer(char* d, size_t s) : data(d), size(s) {}

  bool empty() const
  {
    return (size == 0);
  }
};

//------------------------------------------------------------------------------
//! Interface for reading and writing extended attributes on an open file
//! descriptor. The descriptor is borrowed for one call and never closed.
//------------------------------------------------------------------------------
class AttrCodec
{
public:
  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~AttrCodec() = default;

  //----------------------------------------------------------------------------
  //! Read an attribute value
  //!
  //! @param fd open file descriptor
  //! @param key attribute name
  //! @param buffer destination, zero sized to only probe the value size
  //! @param nbytes bytes copied or, for a probe, the value size
  //!
  //! @return OK, NotFound, TooSmall (buffer shorter than the value, nothing
  //!         reported as copied) or IOError carrying the errno
  //----------------------------------------------------------------------------
  virtual common::Status Get(int fd, const std::string& key,
                             AttrBuffer buffer, size_t& nbytes) = 0;

  //----------------------------------------------------------------------------
  //! Create or replace an attribute value atomically. The value must not be
  //! empty.
  //!
  //! @param fd open file descriptor
  //! @param key attribute name
  //! @param value value bytes
  //! @param length number of value bytes
  //! @param nbytes set to length on success, 0 otherwise
  //!
  //! @return OK or IOError carrying the errno
  //----------------------------------------------------------------------------
  virtual common::Status Set(int fd, const std::string& key, const char* value,
                             size_t length, size_t& nbytes) = 0;

  common::Status Set(int fd, const std::string& key, const std::string& value,
                     size_t& nbytes)
  {
    return Set(fd, key, value.data(), value.length(), nbytes);
  }

  //----------------------------------------------------------------------------
  //! Remove an attribute
  //!
  //! @return OK, NotFound or IOError
  //----------------------------------------------------------------------------
  virtual common::Status Remove(int fd, const std::string& key) = 0;

  //----------------------------------------------------------------------------
  //! List the attribute names of a file
  //----------------------------------------------------------------------------
  virtual common::Status List(int fd, std::vector<std::string>& keys) = 0;
};

XMDNODENAMESPACE_END
