// ----------------------------------------------------------------------
// File: MetadataStore.cc
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

#include "node/MetadataStore.hh"

XMDNODENAMESPACE_BEGIN

using xmd::common::Status;

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
MetadataStore::MetadataStore(AttrCodec& codec, int maxAttempts,
                             size_t chunkSize):
  mCodec(codec), mMaxAttempts(maxAttempts > 0 ? maxAttempts : 1),
  mChunkSize(chunkSize > 0 ? chunkSize : gDefaultMetadataChunkSize)
{}

//------------------------------------------------------------------------------
// Constructor from configuration
//------------------------------------------------------------------------------
MetadataStore::MetadataStore(AttrCodec& codec, const Config& config):
  MetadataStore(codec, config.MetadataAttempts, config.MetadataChunkSize)
{}

//------------------------------------------------------------------------------
// Chunk attribute name
//------------------------------------------------------------------------------
std::string
MetadataStore::ChunkKey(const std::string& key, size_t index)
{
  if (index == 0) {
    return key;
  }

  return key + std::to_string(index);
}

//------------------------------------------------------------------------------
// Probe then read one attribute
//------------------------------------------------------------------------------
Status
MetadataStore::ReadMetadata(int fd, const std::string& key, std::string& value)
{
  for (int attempt = 1; attempt <= mMaxAttempts; ++attempt) {
    size_t size = 0;
    Status st = mCodec.Get(fd, key, AttrBuffer(), size);

    if (!st) {
      return st;
    }

    if (size == 0) {
      value.clear();
      return Status();
    }

    std::string buffer(size, '\0');
    size_t nread = 0;
    st = mCodec.Get(fd, key, AttrBuffer(&buffer[0], buffer.size()), nread);

    if (st) {
      // the value may have shrunk in between
      buffer.resize(nread);
      value.swap(buffer);
      return Status();
    }

    if (!st.IsTooSmall()) {
      return st;
    }

    xmd_debug("msg=\"attribute grew between probe and read\" fd=%d key=\"%s\" "
              "probed=%lu attempt=%d/%d", fd, key.c_str(), (unsigned long) size,
              attempt, mMaxAttempts);
  }

  xmd_warning("msg=\"attribute kept growing, giving up\" fd=%d key=\"%s\" "
              "attempts=%d", fd, key.c_str(), mMaxAttempts);
  return Status::TooSmall("value of key=" + key + " kept growing after " +
                          std::to_string(mMaxAttempts) + " attempts");
}

//------------------------------------------------------------------------------
// Write one attribute
//------------------------------------------------------------------------------
Status
MetadataStore::WriteMetadata(int fd, const std::string& key,
                             const std::string& value)
{
  size_t nwrite = 0;
  return mCodec.Set(fd, key, value, nwrite);
}

//------------------------------------------------------------------------------
// Read chunked value
//------------------------------------------------------------------------------
Status
MetadataStore::ReadChunked(int fd, const std::string& key, std::string& value)
{
  std::string result;

  for (size_t index = 0; ; ++index) {
    std::string chunk;
    Status st = ReadMetadata(fd, ChunkKey(key, index), chunk);

    if (st.IsNotFound()) {
      if (index == 0) {
        return st;
      }

      break;
    }

    if (!st) {
      return st;
    }

    result += chunk;
  }

  value.swap(result);
  return Status();
}

//------------------------------------------------------------------------------
// Write chunked value
//------------------------------------------------------------------------------
Status
MetadataStore::WriteChunked(int fd, const std::string& key,
                            const std::string& value)
{
  size_t nchunks = 0;

  do {
    std::string chunk = value.substr(nchunks * mChunkSize, mChunkSize);
    Status st = WriteMetadata(fd, ChunkKey(key, nchunks), chunk);

    if (!st) {
      xmd_err("msg=\"failed to write metadata chunk\" fd=%d key=\"%s\" "
              "index=%lu %s", fd, key.c_str(), (unsigned long) nchunks,
              st.toString().c_str());
      return st;
    }

    ++nchunks;
  } while (nchunks * mChunkSize < value.length());

  // drop chunks of a previous longer value
  for (size_t index = nchunks; ; ++index) {
    Status st = mCodec.Remove(fd, ChunkKey(key, index));

    if (st.IsNotFound()) {
      break;
    }

    if (!st) {
      return st;
    }
  }

  return Status();
}

//------------------------------------------------------------------------------
// Remove chunked value
//------------------------------------------------------------------------------
Status
MetadataStore::RemoveChunked(int fd, const std::string& key)
{
  for (size_t index = 0; ; ++index) {
    Status st = mCodec.Remove(fd, ChunkKey(key, index));

    if (st.IsNotFound()) {
      return (index == 0) ? st : Status();
    }

    if (!st) {
      return st;
    }
  }
}

XMDNODENAMESPACE_END
