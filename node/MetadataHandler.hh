// ----------------------------------------------------------------------
// File: MetadataHandler.hh
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
#include "node/Config.hh"
#include "node/MetadataStore.hh"
#include "common/Logging.hh"
#include "common/Status.hh"
#include <map>
#include <string>
#include <utility>

XMDNODENAMESPACE_BEGIN

typedef std::map<std::string, std::string> MetadataMap;

//------------------------------------------------------------------------------
//! Class MetadataHandler
//!
//! Keeps the metadata dictionary of a file or directory as a serialized
//! protobuf record spread over chunked extended attributes.
//------------------------------------------------------------------------------
class MetadataHandler : public xmd::common::LogId
{
public:
  //! Leading byte of every stored record, also keeps the value non-empty
  static constexpr char kFormatVersion = '\x01';

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param store metadata store, must outlive the handler
  //! @param key base attribute name of the record
  //----------------------------------------------------------------------------
  MetadataHandler(MetadataStore& store,
                  const std::string& key = gMetadataAttrName);

  virtual ~MetadataHandler() = default;

  //----------------------------------------------------------------------------
  //! Retrieve the metadata dictionary
  //!
  //! @param fd open file descriptor
  //!
  //! @return status and the dictionary; NotFound if no record exists and
  //!         IOError(EIO) if the record can not be decoded
  //----------------------------------------------------------------------------
  std::pair<common::Status, MetadataMap> LocalRetrieveMetadata(int fd);

  //----------------------------------------------------------------------------
  //! Store the metadata dictionary, replacing the previous record
  //----------------------------------------------------------------------------
  common::Status LocalPutMetadata(int fd, const MetadataMap& md);

  //----------------------------------------------------------------------------
  //! Delete the metadata record, a missing record is not an error
  //----------------------------------------------------------------------------
  common::Status LocalDeleteMetadata(int fd);

  const std::string& GetKey() const
  {
    return mKey;
  }

private:
  MetadataStore& mStore;
  std::string mKey;
};

XMDNODENAMESPACE_END
