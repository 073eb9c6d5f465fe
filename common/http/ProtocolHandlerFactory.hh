// ----------------------------------------------------------------------
// File: ProtocolHandlerFactory.hh
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
 * @file   ProtocolHandlerFactory.hh
 *
 * @brief  Abstract factory class to be implemented by the services to
 *         create the correct protocol handler for a request.
 */

#ifndef __XMDCOMMON_PROTOCOLHANDLERFACTORY__HH__
#define __XMDCOMMON_PROTOCOLHANDLERFACTORY__HH__

#include "common/Namespace.hh"
#include "common/http/ProtocolHandler.hh"
#include <map>
#include <memory>
#include <string>

XMDCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! @tparam ContextT per-request context type handed to the created handler
//------------------------------------------------------------------------------
template <typename ContextT>
class ProtocolHandlerFactory
{
public:

  ProtocolHandlerFactory() {};
  virtual ~ProtocolHandlerFactory() {};

  /**
   * Factory function to create an appropriate object which will handle this
   * request based on the method and headers.
   *
   * @param method  the request verb used by the client (GET, PUT, etc)
   * @param headers the map of request headers
   * @param ctx     the per-request context, may be null
   *
   * @return a concrete ProtocolHandler, or null if no matching handler found
   */
  virtual std::unique_ptr<ProtocolHandler>
  CreateProtocolHandler(const std::string&                  method,
                        std::map<std::string, std::string>& headers,
                        ContextT*                           ctx) = 0;
};

XMDCOMMONNAMESPACE_END

#endif /* __XMDCOMMON_PROTOCOLHANDLERFACTORY__HH__ */
