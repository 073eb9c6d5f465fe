// ----------------------------------------------------------------------
// File: Config.cc
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

#include "node/Config.hh"
#include "XrdOuc/XrdOucStream.hh"
#include "XrdSys/XrdSysError.hh"
#include <fcntl.h>
#include <string.h>
#include <cerrno>
#include <cstdlib>
#include <string>

XMDNODENAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Parse the configuration file
//------------------------------------------------------------------------------
int
Config::Configure(const char* ConfigFN, XrdSysError& Eroute)
{
  int NoGo = 0;
  int cfgFD;
  char* var;

  if (!ConfigFN || !*ConfigFN) {
    Eroute.Say("=====> node: no configuration file, using defaults");
    return NoGo;
  }

  if ((cfgFD = open(ConfigFN, O_RDONLY, 0)) < 0) {
    Eroute.Emsg("Config", errno, "open config file fn=", ConfigFN);
    return 1;
  }

  XrdOucStream Config(&Eroute, getenv("XRDINSTANCE"));
  Config.Attach(cfgFD);

  while ((var = Config.GetMyFirstWord())) {
    if (!strncmp(var, "node.", 5)) {
      var += 5;

      if (ParseDirective(var, Config, Eroute)) {
        NoGo = 1;
      }
    }
  }

  Config.Close();
  return NoGo;
}

//------------------------------------------------------------------------------
// Handle one node directive
//------------------------------------------------------------------------------
int
Config::ParseDirective(const char* var, XrdOucStream& Config,
                       XrdSysError& Eroute)
{
  char* val;

  if (!strcmp("metadata.key", var)) {
    if (!(val = Config.GetWord())) {
      Eroute.Emsg("Config", "argument 2 for metadata.key missing");
      return 1;
    }

    MetadataKey = val;
    Eroute.Say("=====> node.metadata.key : ", MetadataKey.c_str());
    return 0;
  }

  if (!strcmp("metadata.attempts", var)) {
    if (!(val = Config.GetWord()) || (atoi(val) < 1)) {
      Eroute.Emsg("Config", "argument 2 for metadata.attempts illegal or "
                  "missing. Must be a positive number!");
      return 1;
    }

    MetadataAttempts = atoi(val);
    Eroute.Say("=====> node.metadata.attempts : ", val);
    return 0;
  }

  if (!strcmp("metadata.chunksize", var)) {
    if (!(val = Config.GetWord()) || (atol(val) < 1)) {
      Eroute.Emsg("Config", "argument 2 for metadata.chunksize illegal or "
                  "missing. Must be a positive number!");
      return 1;
    }

    MetadataChunkSize = atol(val);
    Eroute.Say("=====> node.metadata.chunksize : ", val);
    return 0;
  }

  Eroute.Say("=====> node: ignoring unknown directive node.", var);
  return 0;
}

XMDNODENAMESPACE_END
