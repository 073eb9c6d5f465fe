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
 * @brief  Factory class to create an appropriate protocol handler for the
 *         proxy.
 */

#ifndef __XMDPROXY_PROTOCOLHANDLERFACTORY__HH__
#define __XMDPROXY_PROTOCOLHANDLERFACTORY__HH__

#include "proxy/Namespace.hh"
#include "proxy/AccountClient.hh"
#include "proxy/AccountHandler.hh"
#include "proxy/ProxyContext.hh"
#include "common/http/ProtocolHandlerFactory.hh"
#include <map>
#include <memory>
#include <string>

XMDPROXYNAMESPACE_BEGIN

class ProtocolHandlerFactory :
  public xmd::common::ProtocolHandlerFactory<ProxyContext>
{
public:

  explicit ProtocolHandlerFactory(AccountClient& client) : mClient(client) {};
  virtual ~ProtocolHandlerFactory() {};

  /**
   * Factory function to create an appropriate object which will handle this
   * request based on the method and headers.
   *
   * @param method  the request verb used by the client (GET, PUT, etc)
   * @param headers the map of request headers
   * @param ctx     the per-request proxy context
   *
   * @return a concrete ProtocolHandler, or null if no matching protocol found
   */
  std::unique_ptr<xmd::common::ProtocolHandler>
  CreateProtocolHandler(const std::string&                  method,
                        std::map<std::string, std::string>& headers,
                        ProxyContext*                       ctx) override
  {
    (void) headers;

    if (method.empty()) {
      return nullptr;
    }

    // unknown methods are answered with 405 by the handler
    return std::unique_ptr<xmd::common::ProtocolHandler>
           (new AccountHandler(mClient, ctx));
  };

private:
  AccountClient& mClient;
};

XMDPROXYNAMESPACE_END

#endif /* __XMDPROXY_PROTOCOLHANDLERFACTORY__HH__ */
