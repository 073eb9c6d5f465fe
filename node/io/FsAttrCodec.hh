// ----------------------------------------------------------------------
// File: FsAttrCodec.hh
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
#include "node/io/AttrCodec.hh"

XMDNODENAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Attribute codec issuing the fgetxattr/fsetxattr family of syscalls
//------------------------------------------------------------------------------
class FsAttrCodec final: public AttrCodec
{
public:
  using AttrCodec::Set;

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param listAttempts maximum size probe rounds when listing attributes
  //----------------------------------------------------------------------------
  explicit FsAttrCodec(int listAttempts = 3) : mListAttempts(listAttempts) {}

  ~FsAttrCodec() = default;

  common::Status Get(int fd, const std::string& key, AttrBuffer buffer,
                     size_t& nbytes) override;

  common::Status Set(int fd, const std::string& key, const char* value,
                     size_t length, size_t& nbytes) override;

  common::Status Remove(int fd, const std::string& key) override;

  common::Status List(int fd, std::vector<std::string>& keys) override;

  //----------------------------------------------------------------------------
  //! Check that an attribute name can be handed to the kernel
  //!
  //! @return OK or IOError(EINVAL) for an empty name or one with a NUL byte
  //----------------------------------------------------------------------------
  static common::Status ValidateKey(const std::string& key);

private:
  int mListAttempts;
};

XMDNODENAMESPACE_END
