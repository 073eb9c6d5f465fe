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
#include "proxy/Namespace.hh"
#include "proxy/ProxyContext.hh"
#include "node/Config.hh"
#include <string>

class XrdSysError;
class XrdOucStream;

XMDPROXYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Proxy settings read from the proxy.* and node.* directives of the
//! configuration file
//------------------------------------------------------------------------------
class Config
{
public:
  int Port;                    // listening port of the http server
  std::string Root;            // directory holding the account directories
  std::string AuthToken;       // token expected in x-auth-token, empty = open
  bool AllowAccountManagement; // PUT/DELETE on accounts permitted
  bool AccountAutocreate;      // missing accounts look empty on GET/HEAD
  std::string ThreadModel;     // threads|epoll|single
  int ThreadPoolSize;          // threads in epoll mode
  std::string LogLevel;        // syslog priority name
  xmd::node::Config Node;      // metadata settings

  Config() :
    Port(8080), Root("/var/lib/xmd/accounts"), AllowAccountManagement(true),
    AccountAutocreate(false), ThreadModel("threads"), ThreadPoolSize(16),
    LogLevel("info")
  {}

  ~Config() = default;

  //----------------------------------------------------------------------------
  //! Parse the configuration file, a null or empty name keeps the defaults
  //!
  //! @return 0 if successful, otherwise 1
  //----------------------------------------------------------------------------
  int Configure(const char* ConfigFN, XrdSysError& Eroute);

  //----------------------------------------------------------------------------
  //! Handle one proxy directive with the "proxy." prefix stripped
  //!
  //! @return 0 if successful, otherwise 1
  //----------------------------------------------------------------------------
  int ParseDirective(const char* var, XrdOucStream& Config, XrdSysError& Eroute);

  //----------------------------------------------------------------------------
  //! Apply environment overrides (XMD_PROXY_PORT)
  //----------------------------------------------------------------------------
  void ApplyEnv(XrdSysError& Eroute);

  //----------------------------------------------------------------------------
  //! Build the per-request context of the proxy
  //----------------------------------------------------------------------------
  ProxyContext MakeContext() const;

  //----------------------------------------------------------------------------
  //! Parse a boolean value (true/false, yes/no, on/off, 1/0)
  //!
  //! @return false if the value is not a boolean
  //----------------------------------------------------------------------------
  static bool ParseBool(const char* value, bool& result);
};

XMDPROXYNAMESPACE_END
