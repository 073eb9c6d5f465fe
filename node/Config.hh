// ----------------------------------------------------------------------
// File: Config.hh
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
#include <cstddef>
#include <string>

class XrdOucStream;
class XrdSysError;

XMDNODENAMESPACE_BEGIN

//! Default attribute holding the serialized metadata dictionary
static constexpr auto gMetadataAttrName = "user.xmd.metadata";
//! Historical per-attribute size limit used as chunk size
static constexpr size_t gDefaultMetadataChunkSize = 254;
//! Probe/read rounds before a growing value is reported as too small
static constexpr int gDefaultMetadataAttempts = 3;

//------------------------------------------------------------------------------
//! Metadata layer configuration, directives "node.metadata.*"
//------------------------------------------------------------------------------
class Config
{
public:
  std::string MetadataKey; // attribute name of the metadata dictionary
  int MetadataAttempts; // probe/read rounds for one attribute
  size_t MetadataChunkSize; // maximum bytes stored per attribute

  Config() :
    MetadataKey(gMetadataAttrName),
    MetadataAttempts(gDefaultMetadataAttempts),
    MetadataChunkSize(gDefaultMetadataChunkSize)
  {}

  ~Config() = default;

  //----------------------------------------------------------------------------
  //! Parse the configuration file, ignoring directives of other components
  //!
  //! @param ConfigFN path of the configuration file
  //! @param Eroute error object used for reporting
  //!
  //! @return 0 if successful, otherwise 1
  //----------------------------------------------------------------------------
  int Configure(const char* ConfigFN, XrdSysError& Eroute);

  //----------------------------------------------------------------------------
  //! Handle one "node." directive whose first word was already consumed
  //!
  //! @param var directive name without the "node." prefix
  //! @param Config stream positioned after the directive name
  //! @param Eroute error object used for reporting
  //!
  //! @return 0 if successful, otherwise 1
  //----------------------------------------------------------------------------
  int ParseDirective(const char* var, XrdOucStream& Config, XrdSysError& Eroute);
};

XMDNODENAMESPACE_END
