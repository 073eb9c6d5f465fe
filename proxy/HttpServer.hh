// ----------------------------------------------------------------------
// File: HttpServer.hh
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
 * @file   HttpServer.hh
 *
 * @brief  Embedded HTTP server of the proxy serving account resources
 */

#ifndef __XMDPROXY_HTTPSERVER__HH__
#define __XMDPROXY_HTTPSERVER__HH__

#include "proxy/Namespace.hh"
#include "proxy/AccountClient.hh"
#include "proxy/Config.hh"
#include "proxy/ProtocolHandlerFactory.hh"
#include "common/http/HttpServer.hh"
#include <memory>
#include <string>

XMDPROXYNAMESPACE_BEGIN

class HttpServer : public xmd::common::HttpServer
{
public:
  //! Largest request body accepted
  static constexpr size_t kMaxRequestBody = 64 * 1024;

  /**
   * Constructor
   *
   * @param config  proxy configuration, must outlive the server
   * @param client  backend account service, must outlive the server
   */
  HttpServer(const Config& config, AccountClient& client);

  /**
   * Destructor
   */
  virtual ~HttpServer() {};

  /**
   * Route and handle one complete request: inbound gatekeeper, account
   * routing, protocol handler, outbound gatekeeper
   *
   * @param request  the client request
   *
   * @return the response to send, never null
   */
  std::unique_ptr<xmd::common::HttpResponse>
  Dispatch(xmd::common::HttpRequest& request);

#ifdef XMD_MICRO_HTTPD
  /**
   * HTTP object handler function on the proxy
   *
   * @return see implementation
   */
  virtual int
  Handler(void*                  cls,
          struct MHD_Connection* connection,
          const char*            url,
          const char*            method,
          const char*            version,
          const char*            upload_data,
          size_t*                upload_data_size,
          void**                 ptr) override;

  /**
   * HTTP complete handler function
   *
   * @return see implementation
   */
  virtual void
  CompleteHandler(void*                  cls,
                  struct MHD_Connection* connection,
                  void**                 con_cls,
                  enum MHD_RequestTerminationCode toe) override;
#endif

private:
  const Config& mConfig;             //!< proxy configuration
  ProtocolHandlerFactory mFactory;   //!< creates the resource handlers
};

XMDPROXYNAMESPACE_END

#endif /* __XMDPROXY_HTTPSERVER__HH__ */
