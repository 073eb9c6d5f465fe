// ----------------------------------------------------------------------
// File: HttpHandler.hh
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
 * @file   HttpHandler.hh
 *
 * @brief  Class to handle plain HTTP requests and build responses.
 */

#ifndef __XMDCOMMON_HTTP_HANDLER__HH__
#define __XMDCOMMON_HTTP_HANDLER__HH__

#include "common/http/ProtocolHandler.hh"
#include "common/Namespace.hh"
#include <string>

XMDCOMMONNAMESPACE_BEGIN

class HttpHandler : virtual public xmd::common::ProtocolHandler
{

public:
  /**
   * Standard plain HTTP request methods
   */
  enum Methods {
    GET,     //!< Retrieve a representation of the resource
    HEAD,    //!< Same as GET without the response body
    POST,    //!< Update the resource metadata
    PUT,     //!< Create or replace the resource
    DELETE,  //!< Delete the resource
    TRACE,
    OPTIONS,
    CONNECT,
    PATCH,
  };

  /**
   * Constructor
   */
  HttpHandler() {};

  /**
   * Destructor
   */
  virtual ~HttpHandler() {};

  /**
   * Build a response to the given plain HTTP request.
   *
   * @param request  the client request object
   */
  virtual void
  HandleRequest(xmd::common::HttpRequest* request) = 0;

  /**
   * Convert the given request method string into its integer constant
   * representation.
   *
   * @param method  the method string to convert
   *
   * @return the converted method string as an integer, -1 if unknown
   */
  inline static int
  ParseMethodString(const std::string& method)
  {
    if (method == "GET") {
      return Methods::GET;
    } else if (method == "HEAD") {
      return Methods::HEAD;
    } else if (method == "POST") {
      return Methods::POST;
    } else if (method == "PUT") {
      return Methods::PUT;
    } else if (method == "DELETE") {
      return Methods::DELETE;
    } else if (method == "TRACE") {
      return Methods::TRACE;
    } else if (method == "OPTIONS") {
      return Methods::OPTIONS;
    } else if (method == "CONNECT") {
      return Methods::CONNECT;
    } else if (method == "PATCH") {
      return Methods::PATCH;
    } else {
      return -1;
    }
  }
};

XMDCOMMONNAMESPACE_END

#endif /* __XMDCOMMON_HTTP_HANDLER__HH__ */
