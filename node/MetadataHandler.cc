// ----------------------------------------------------------------------
// File: MetadataHandler.cc
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

#include "node/MetadataHandler.hh"
#include "proto/Metadata.pb.h"
#include <cerrno>

XMDNODENAMESPACE_BEGIN

using xmd::common::Status;

constexpr char MetadataHandler::kFormatVersion;

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
MetadataHandler::MetadataHandler(MetadataStore& store, const std::string& key):
  mStore(store), mKey(key)
{}

//------------------------------------------------------------------------------
// Retrieve metadata dictionary
//------------------------------------------------------------------------------
std::pair<Status, MetadataMap>
MetadataHandler::LocalRetrieveMetadata(int fd)
{
  std::string attrval;
  Status st = mStore.ReadChunked(fd, mKey, attrval);

  if (!st) {
    if (!st.IsNotFound()) {
      xmd_err("msg=\"failed to retrieve metadata attribute\" fd=%d key=\"%s\" "
              "%s", fd, mKey.c_str(), st.toString().c_str());
    }

    return {st, MetadataMap{}};
  }

  if (attrval.empty() || (attrval[0] != kFormatVersion)) {
    xmd_err("msg=\"unknown metadata record format\" fd=%d key=\"%s\" "
            "attr_sz=%lu", fd, mKey.c_str(), (unsigned long) attrval.size());
    return {Status::IOError(EIO, "unknown metadata record format"), MetadataMap{}};
  }

  MetadataBase record;

  if (!record.ParseFromArray(attrval.data() + 1, attrval.size() - 1)) {
    xmd_err("msg=\"failed parsing metadata attribute\" fd=%d attr_sz=%lu", fd,
            (unsigned long) attrval.size());
    return {Status::IOError(EIO, "failed parsing metadata record"), MetadataMap{}};
  }

  MetadataMap md;

  for (const auto& elem : record.entries()) {
    md[elem.first] = elem.second;
  }

  return {Status(), std::move(md)};
}

//------------------------------------------------------------------------------
// Store metadata dictionary
//------------------------------------------------------------------------------
Status
MetadataHandler::LocalPutMetadata(int fd, const MetadataMap& md)
{
  MetadataBase record;

  for (const auto& elem : md) {
    (*record.mutable_entries())[elem.first] = elem.second;
  }

  std::string attrval(1, kFormatVersion);

  if (!record.AppendToString(&attrval)) {
    return Status::IOError(EIO, "failed serializing metadata record");
  }

  Status st = mStore.WriteChunked(fd, mKey, attrval);

  if (!st) {
    xmd_err("msg=\"failed to store metadata\" fd=%d key=\"%s\" entries=%lu %s",
            fd, mKey.c_str(), (unsigned long) md.size(), st.toString().c_str());
  }

  return st;
}

//------------------------------------------------------------------------------
// Delete metadata record
//------------------------------------------------------------------------------
Status
MetadataHandler::LocalDeleteMetadata(int fd)
{
  Status st = mStore.RemoveChunked(fd, mKey);

  if (st.IsNotFound()) {
    return Status();
  }

  if (!st) {
    xmd_err("msg=\"failed to delete metadata\" fd=%d key=\"%s\" %s", fd,
            mKey.c_str(), st.toString().c_str());
  }

  return st;
}

XMDNODENAMESPACE_END
