// ----------------------------------------------------------------------
// File: MetadataStore.hh
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
#include "node/io/AttrCodec.hh"
#include "common/Logging.hh"
#include "common/Status.hh"
#include <string>

XMDNODENAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Class MetadataStore
//!
//! Reads and writes whole metadata values kept in extended attributes. A read
//! probes the value size, allocates exactly that much and reads; a value that
//! grows in between is retried a bounded number of times. Values larger than
//! the chunk size can be spread over "key", "key1", "key2", ... attributes.
//------------------------------------------------------------------------------
class MetadataStore : public xmd::common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param codec attribute codec, must outlive the store
  //! @param maxAttempts probe/read rounds before giving up with TooSmall
  //! @param chunkSize maximum bytes stored per chunk attribute
  //----------------------------------------------------------------------------
  MetadataStore(AttrCodec& codec, int maxAttempts = gDefaultMetadataAttempts,
                size_t chunkSize = gDefaultMetadataChunkSize);

  //----------------------------------------------------------------------------
  //! Constructor taking the limits from the configuration
  //----------------------------------------------------------------------------
  MetadataStore(AttrCodec& codec, const Config& config);

  virtual ~MetadataStore() = default;

  //----------------------------------------------------------------------------
  //! Read the complete value of one attribute
  //!
  //! @param fd open file descriptor
  //! @param key attribute name
  //! @param value filled with the value, untouched on error
  //!
  //! @return OK, NotFound, TooSmall once the attempts are exhausted or IOError
  //----------------------------------------------------------------------------
  common::Status ReadMetadata(int fd, const std::string& key,
                              std::string& value);

  //----------------------------------------------------------------------------
  //! Write the complete value of one attribute, no retry
  //----------------------------------------------------------------------------
  common::Status WriteMetadata(int fd, const std::string& key,
                               const std::string& value);

  //----------------------------------------------------------------------------
  //! Read a value spread over chunk attributes, concatenating chunks until
  //! the first missing one
  //!
  //! @return OK, NotFound if the first chunk is missing, or the first error
  //----------------------------------------------------------------------------
  common::Status ReadChunked(int fd, const std::string& key,
                             std::string& value);

  //----------------------------------------------------------------------------
  //! Write a value as chunk attributes and drop chunks left over from a
  //! longer previous value
  //----------------------------------------------------------------------------
  common::Status WriteChunked(int fd, const std::string& key,
                              const std::string& value);

  //----------------------------------------------------------------------------
  //! Remove all chunk attributes of a value
  //!
  //! @return OK, NotFound if there was no chunk, or IOError
  //----------------------------------------------------------------------------
  common::Status RemoveChunked(int fd, const std::string& key);

  //----------------------------------------------------------------------------
  //! Attribute name of a chunk: "key" for index 0, "key<index>" otherwise
  //----------------------------------------------------------------------------
  static std::string ChunkKey(const std::string& key, size_t index);

  int GetMaxAttempts() const
  {
    return mMaxAttempts;
  }

  size_t GetChunkSize() const
  {
    return mChunkSize;
  }

private:
  AttrCodec& mCodec;
  int mMaxAttempts;
  size_t mChunkSize;
};

XMDNODENAMESPACE_END
